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


#include <stdint.h>

#include <string>

#include "installer/inspector.hpp"

using std::string;

namespace curator {
namespace internal {
namespace installer {

bool haveLatestVersionedIndex(const ClusterState& state, const string& name)
{
  return state.indices().count(name) > 0;
}


bool haveLatestTemplate(
    const ClusterState& state,
    const string& name,
    int32_t version)
{
  auto iterator = state.templates().find(name);
  if (iterator == state.templates().end()) {
    return false;
  }

  const IndexTemplateMetadata& metadata = iterator->second;

  return metadata.has_version() && metadata.version() >= version;
}

} // namespace installer {
} // namespace internal {
} // namespace curator {
