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


#ifndef __INSTALLER_INSTALLER_HPP__
#define __INSTALLER_INSTALLER_HPP__

#include <curator/cluster/cluster.hpp>

#include <curator/store/store.hpp>

#include <process/future.hpp>

#include <stout/nothing.hpp>

#include "installer/flags.hpp"

namespace curator {
namespace internal {
namespace installer {

// Forward declaration.
class InstallerProcess;


// Makes sure the internal index and the audit index template exist
// at their current versions. Many installers (on different nodes) may
// run concurrently against the same store; no locking is required
// because a create that loses the race is treated as a success.
//
// Each operation first inspects the local cluster state and does not
// contact the store at all when the resource is already current.
// Failures are never retried here and are returned to the caller
// with the cause reported by the store.
class Installer
{
public:
  // Neither `cluster` nor `store` is owned; both must outlive the
  // installer.
  Installer(
      const Flags& flags,
      const cluster::ClusterService* cluster,
      store::Store* store);

  virtual ~Installer();

  // Creates the internal index unless the cluster state already
  // contains it.
  process::Future<Nothing> ensureIndexInstalled();

  // Installs the audit index template unless the cluster state
  // already contains it at the current version (or newer).
  process::Future<Nothing> ensureTemplateInstalled();

  // Ensures the index and then, whether or not the index had to be
  // created, the template. A failure to install the index fails the
  // returned future without attempting the template.
  process::Future<Nothing> ensureInstalled();

private:
  InstallerProcess* process;
};

} // namespace installer {
} // namespace internal {
} // namespace curator {

#endif // __INSTALLER_INSTALLER_HPP__
