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

#include "installer/constants.hpp"

namespace curator {
namespace internal {
namespace installer {

const std::string DEFAULT_INDEX_PREFIX = ".transform-internal-";
const std::string DEFAULT_INDEX_VERSION = "005";
const std::string DEFAULT_AUDIT_INDEX_PREFIX = ".transform-notifications-";
const std::string DEFAULT_AUDIT_TEMPLATE_VERSION = "000002";
const std::string DEFAULT_ORIGIN = "transform";
const std::string AUDIT_READ_ALIAS_SUFFIX = "read";

} // namespace installer {
} // namespace internal {
} // namespace curator {
