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


#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <string>

#include <curator/curator.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>

#include "installer/flags.hpp"

namespace curator {
namespace internal {
namespace tests {

// A cluster state holding only the internal index at the version
// configured by `flags`.
ClusterState createStateWithLatestVersionedIndex(
    const installer::Flags& flags);


// A cluster state holding only the audit index template at the
// version configured by `flags`.
ClusterState createStateWithLatestAuditTemplate(
    const installer::Flags& flags);


Response createResponse(
    const Response::Status& status,
    const Option<std::string>& message = None());

} // namespace tests {
} // namespace internal {
} // namespace curator {

#endif // __TESTS_UTILS_HPP__
