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

#include <glog/logging.h>

#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/future.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/lambda.hpp>
#include <stout/nothing.hpp>
#include <stout/unreachable.hpp>

#include "installer/index.hpp"
#include "installer/inspector.hpp"
#include "installer/installer.hpp"
#include "installer/provisioner.hpp"

using process::dispatch;
using process::spawn;
using process::terminate;
using process::wait; // Necessary on some OS's to disambiguate.

using process::Failure;
using process::Future;
using process::Process;

using std::string;

namespace curator {
namespace internal {
namespace installer {

class InstallerProcess : public Process<InstallerProcess>
{
public:
  InstallerProcess(
      const Flags& _flags,
      const cluster::ClusterService* _cluster,
      store::Store* _store)
    : ProcessBase(process::ID::generate("installer")),
      flags(_flags),
      cluster(_cluster),
      provisioner(_flags, _store) {}

  ~InstallerProcess() override {}

  Future<Nothing> ensureIndexInstalled();
  Future<Nothing> ensureTemplateInstalled();
  Future<Nothing> ensureInstalled();

private:
  // Continuation shared by both resources.
  Future<Nothing> _install(
      const string& resource,
      const InstallOutcome& outcome);

  const Flags flags;
  const cluster::ClusterService* cluster;
  Provisioner provisioner;
};


Future<Nothing> InstallerProcess::ensureIndexInstalled()
{
  const string name = latestVersionedIndexName(flags);

  if (haveLatestVersionedIndex(cluster->state(), name)) {
    VLOG(1) << "Index '" << name << "' is already installed";
    return Nothing();
  }

  return provisioner.createIndex()
    .then(defer(self(), &Self::_install, "index '" + name + "'", lambda::_1));
}


Future<Nothing> InstallerProcess::ensureTemplateInstalled()
{
  const string name = auditTemplateName(flags);

  if (haveLatestTemplate(cluster->state(), name, flags.version_id)) {
    VLOG(1) << "Index template '" << name << "' is already installed";
    return Nothing();
  }

  return provisioner.putTemplate()
    .then(defer(
        self(),
        &Self::_install,
        "index template '" + name + "'",
        lambda::_1));
}


Future<Nothing> InstallerProcess::ensureInstalled()
{
  // Strictly sequential: the template is only looked at once the
  // index is known to be present.
  return ensureIndexInstalled()
    .then(defer(self(), &Self::ensureTemplateInstalled));
}


Future<Nothing> InstallerProcess::_install(
    const string& resource,
    const InstallOutcome& outcome)
{
  switch (outcome.type()) {
    case InstallOutcome::CREATED:
      LOG(INFO) << "Installed " << resource;
      return Nothing();
    case InstallOutcome::ALREADY_EXISTS:
      LOG(INFO) << "Found " << resource << " installed concurrently";
      return Nothing();
    case InstallOutcome::FAILED:
      return Failure(outcome.cause());
  }

  UNREACHABLE();
}


Installer::Installer(
    const Flags& flags,
    const cluster::ClusterService* cluster,
    store::Store* store)
{
  process = new InstallerProcess(flags, cluster, store);
  spawn(process);
}


Installer::~Installer()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Nothing> Installer::ensureIndexInstalled()
{
  return dispatch(process, &InstallerProcess::ensureIndexInstalled);
}


Future<Nothing> Installer::ensureTemplateInstalled()
{
  return dispatch(process, &InstallerProcess::ensureTemplateInstalled);
}


Future<Nothing> Installer::ensureInstalled()
{
  return dispatch(process, &InstallerProcess::ensureInstalled);
}


} // namespace installer {
} // namespace internal {
} // namespace curator {
