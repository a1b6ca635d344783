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


#ifndef __INSTALLER_CONSTANTS_HPP__
#define __INSTALLER_CONSTANTS_HPP__

#include <stdint.h>

#include <string>

namespace curator {
namespace internal {
namespace installer {

// Prefix shared by every version of the internal index. The full name
// of an index is the prefix followed by its schema version.
extern const std::string DEFAULT_INDEX_PREFIX;

// Schema version of the internal index this build installs. Bump it
// whenever the index mappings change in an incompatible way.
extern const std::string DEFAULT_INDEX_VERSION;

// Prefix of the audit (notification) indices.
extern const std::string DEFAULT_AUDIT_INDEX_PREFIX;

// Version suffix of the audit index template.
extern const std::string DEFAULT_AUDIT_TEMPLATE_VERSION;

// Numeric id of the product version, written into the audit index
// template. A stored template with an id at least this large is
// considered current.
constexpr int32_t DEFAULT_VERSION_ID = 7100099;

// Tag attached to every request sent on behalf of the installer.
extern const std::string DEFAULT_ORIGIN;

// Suffix of the alias through which all audit indices are read.
extern const std::string AUDIT_READ_ALIAS_SUFFIX;

} // namespace installer {
} // namespace internal {
} // namespace curator {

#endif // __INSTALLER_CONSTANTS_HPP__
