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


#ifndef __INSTALLER_INDEX_HPP__
#define __INSTALLER_INDEX_HPP__

#include <string>

#include <curator/curator.hpp>

#include <stout/hashmap.hpp>
#include <stout/json.hpp>

#include "installer/flags.hpp"

namespace curator {
namespace internal {
namespace installer {

// Definitions of the two resources managed by the installer: the
// versioned internal index and the audit index template. Everything
// here is derived from the flags and has no side effects.

// Name of the internal index at the configured schema version,
// e.g. `.transform-internal-005`.
std::string latestVersionedIndexName(const Flags& flags);

// Name of the audit index template, e.g.
// `.transform-notifications-000002`.
std::string auditTemplateName(const Flags& flags);

// Pattern matched by the audit index template.
std::string auditIndexPattern(const Flags& flags);

// Alias under which all audit indices can be searched.
std::string auditReadAlias(const Flags& flags);

// Settings shared by the internal index and the audit indices: a
// single shard, and at most one replica when the cluster has room.
hashmap<std::string, std::string> settings();

JSON::Object mappings(const Flags& flags);

JSON::Object auditMappings();

// Returns the complete audit index template at the current version.
IndexTemplateMetadata auditIndexTemplate(const Flags& flags);

CreateIndexRequest createIndexRequest(const Flags& flags);

PutIndexTemplateRequest putAuditTemplateRequest(const Flags& flags);

} // namespace installer {
} // namespace internal {
} // namespace curator {

#endif // __INSTALLER_INDEX_HPP__
