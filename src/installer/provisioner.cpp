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


#include <ostream>
#include <string>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/check.hpp>
#include <stout/unreachable.hpp>

#include "installer/index.hpp"
#include "installer/provisioner.hpp"

using process::Future;
using process::Owned;
using process::Promise;

using std::ostream;
using std::string;

namespace curator {
namespace internal {
namespace installer {

namespace {

// Satisfies the returned future with the classified outcome once the
// store has replied, whatever the reply.
Future<InstallOutcome> outcome(const Future<Response>& response)
{
  Owned<Promise<InstallOutcome>> promise(new Promise<InstallOutcome>());

  response.onAny([promise](const Future<Response>& response) {
    promise->set(classify(response));
  });

  return promise->future();
}

} // namespace {


ostream& operator<<(ostream& stream, const InstallOutcome& outcome)
{
  switch (outcome.type()) {
    case InstallOutcome::CREATED:
      return stream << "CREATED";
    case InstallOutcome::ALREADY_EXISTS:
      return stream << "ALREADY_EXISTS";
    case InstallOutcome::FAILED:
      return stream << "FAILED: " << outcome.cause();
  }

  UNREACHABLE();
}


InstallOutcome classify(const Future<Response>& response)
{
  CHECK(!response.isPending());

  if (response.isDiscarded()) {
    return InstallOutcome::failed("discarded");
  }

  if (response.isFailed()) {
    return InstallOutcome::failed(response.failure());
  }

  switch (response->status()) {
    case Response::OK:
      return InstallOutcome::created();
    case Response::ALREADY_EXISTS:
      return InstallOutcome::alreadyExists();
    case Response::ERROR:
      return InstallOutcome::failed(
          response->has_message()
            ? response->message()
            : "Store rejected the request");
  }

  UNREACHABLE();
}


Provisioner::Provisioner(const Flags& flags, store::Store* _store)
  : store(_store),
    indexRequest(createIndexRequest(flags)),
    templateRequest(putAuditTemplateRequest(flags)) {}


Future<InstallOutcome> Provisioner::createIndex()
{
  return outcome(store->createIndex(indexRequest));
}


Future<InstallOutcome> Provisioner::putTemplate()
{
  return outcome(store->putTemplate(templateRequest));
}

} // namespace installer {
} // namespace internal {
} // namespace curator {
