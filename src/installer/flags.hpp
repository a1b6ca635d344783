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


#ifndef __INSTALLER_FLAGS_HPP__
#define __INSTALLER_FLAGS_HPP__

#include <stdint.h>

#include <string>

#include <stout/flags.hpp>
#include <stout/option.hpp>
#include <stout/path.hpp>

#include "logging/flags.hpp"

namespace curator {
namespace internal {
namespace installer {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string index_prefix;
  std::string index_version;
  std::string audit_index_prefix;
  std::string audit_template_version;
  int32_t version_id;
  std::string origin;

  // The following flags are specific to the `curator-installer`
  // executable.

  Option<Path> state;
};

} // namespace installer {
} // namespace internal {
} // namespace curator {

#endif // __INSTALLER_FLAGS_HPP__
