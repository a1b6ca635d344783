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


#include <string>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/stringify.hpp>

#include "installer/index.hpp"

#include "tests/utils.hpp"

using std::string;

namespace curator {
namespace internal {
namespace tests {

ClusterState createStateWithLatestVersionedIndex(
    const installer::Flags& flags)
{
  IndexMetadata index;
  index.set_name(installer::latestVersionedIndexName(flags));
  index.set_mappings(stringify(installer::mappings(flags)));
  index.set_version_created(flags.version_id);

  const hashmap<string, string> settings = installer::settings();
  foreachpair (const string& key, const string& value, settings) {
    (*index.mutable_settings())[key] = value;
  }

  ClusterState state;
  state.set_version(1);
  (*state.mutable_indices())[index.name()] = index;

  return state;
}


ClusterState createStateWithLatestAuditTemplate(
    const installer::Flags& flags)
{
  const IndexTemplateMetadata metadata = installer::auditIndexTemplate(flags);

  ClusterState state;
  state.set_version(1);
  (*state.mutable_templates())[metadata.name()] = metadata;

  return state;
}


Response createResponse(
    const Response::Status& status,
    const Option<string>& message)
{
  Response response;
  response.set_status(status);

  if (message.isSome()) {
    response.set_message(message.get());
  }

  return response;
}

} // namespace tests {
} // namespace internal {
} // namespace curator {
