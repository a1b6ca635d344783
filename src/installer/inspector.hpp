// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef __INSTALLER_INSPECTOR_HPP__
#define __INSTALLER_INSPECTOR_HPP__

#include <stdint.h>

#include <string>

#include <curator/curator.hpp>

namespace curator {
namespace internal {
namespace installer {

// Returns true if the snapshot contains the index `name`. The name of
// a versioned index encodes its schema version, so only an exact
// match counts.
bool haveLatestVersionedIndex(
    const ClusterState& state,
    const std::string& name);


// Returns true if the snapshot contains the template `name` at
// `version` or newer. A template without a version is outdated.
bool haveLatestTemplate(
    const ClusterState& state,
    const std::string& name,
    int32_t version);

} // namespace installer {
} // namespace internal {
} // namespace curator {

#endif // __INSTALLER_INSPECTOR_HPP__
