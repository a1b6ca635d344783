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

#include <stout/error.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>

#include "installer/constants.hpp"
#include "installer/flags.hpp"

using std::string;

namespace {

Option<Error> nonEmpty(const string& name, const string& value)
{
  if (value.empty()) {
    return Error("'--" + name + "' must not be empty");
  }
  return None();
}

} // namespace {


curator::internal::installer::Flags::Flags()
{
  add(&Flags::index_prefix,
      "index_prefix",
      "Common prefix of all versions of the internal index.",
      DEFAULT_INDEX_PREFIX,
      [](const string& value) {
        return nonEmpty("index_prefix", value);
      });

  add(&Flags::index_version,
      "index_version",
      "Schema version of the internal index to install. The installed\n"
      "index is named `<index_prefix><index_version>`; an index of any\n"
      "other version does not satisfy the installer.",
      DEFAULT_INDEX_VERSION,
      [](const string& value) {
        return nonEmpty("index_version", value);
      });

  add(&Flags::audit_index_prefix,
      "audit_index_prefix",
      "Common prefix of the audit indices. The audit index template\n"
      "applies to every index matching `<audit_index_prefix>*`.",
      DEFAULT_AUDIT_INDEX_PREFIX,
      [](const string& value) {
        return nonEmpty("audit_index_prefix", value);
      });

  add(&Flags::audit_template_version,
      "audit_template_version",
      "Version suffix of the audit index template name.",
      DEFAULT_AUDIT_TEMPLATE_VERSION,
      [](const string& value) {
        return nonEmpty("audit_template_version", value);
      });

  add(&Flags::version_id,
      "version_id",
      "Numeric product version written into the audit index template.\n"
      "A stored template whose version is lower is reinstalled.",
      DEFAULT_VERSION_ID,
      [](int32_t value) -> Option<Error> {
        if (value <= 0) {
          return Error("'--version_id' must be positive");
        }
        return None();
      });

  add(&Flags::origin,
      "origin",
      "Origin tag attached to every request sent to the store.",
      DEFAULT_ORIGIN);

  add(&Flags::state,
      "state",
      "Path to a JSON encoded `ClusterState` used to seed both the store\n"
      "and the local view of the cluster. When unset, both start empty.");
}
