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


#ifndef __INSTALLER_PROVISIONER_HPP__
#define __INSTALLER_PROVISIONER_HPP__

#include <ostream>
#include <string>

#include <curator/curator.hpp>

#include <curator/store/store.hpp>

#include <process/future.hpp>

#include "installer/flags.hpp"

namespace curator {
namespace internal {
namespace installer {

// The result of a single provisioning request. CREATED and
// ALREADY_EXISTS both mean the resource is present; only FAILED
// carries a cause.
class InstallOutcome
{
public:
  enum Type
  {
    CREATED,
    ALREADY_EXISTS,
    FAILED
  };

  static InstallOutcome created()
  {
    return InstallOutcome(CREATED, "");
  }

  static InstallOutcome alreadyExists()
  {
    return InstallOutcome(ALREADY_EXISTS, "");
  }

  static InstallOutcome failed(const std::string& cause)
  {
    return InstallOutcome(FAILED, cause);
  }

  Type type() const { return type_; }

  bool isSuccess() const { return type_ != FAILED; }

  // Only meaningful for FAILED outcomes.
  const std::string& cause() const { return cause_; }

private:
  InstallOutcome(Type type, const std::string& cause)
    : type_(type), cause_(cause) {}

  Type type_;
  std::string cause_;
};


std::ostream& operator<<(std::ostream& stream, const InstallOutcome& outcome);


// Interprets the reply of the store to a create request. This is the
// only place that decides which replies count as success; in
// particular ALREADY_EXISTS is a success because another installer in
// the cluster may have won the race to create the resource. Failed and
// discarded futures become FAILED with the failure as the cause.
InstallOutcome classify(const process::Future<Response>& response);


// Issues create requests against the store. Every call sends exactly
// one request and performs no existence check of its own, so retrying
// a call is always safe. The returned future is never failed; the
// outcome of the request is encoded in the `InstallOutcome`.
class Provisioner
{
public:
  Provisioner(const Flags& flags, store::Store* store);

  // Creates the internal index at the configured schema version.
  process::Future<InstallOutcome> createIndex();

  // Installs the audit index template at the configured version.
  process::Future<InstallOutcome> putTemplate();

private:
  store::Store* store;

  const CreateIndexRequest indexRequest;
  const PutIndexTemplateRequest templateRequest;
};

} // namespace installer {
} // namespace internal {
} // namespace curator {

#endif // __INSTALLER_PROVISIONER_HPP__
