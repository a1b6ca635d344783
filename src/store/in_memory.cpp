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

#include <curator/store/in_memory.hpp>

#include <process/dispatch.hpp>
#include <process/future.hpp>
#include <process/id.hpp>
#include <process/process.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>

using namespace process;

using std::string;

namespace curator {
namespace store {

namespace {

Response response(
    const Response::Status& status,
    const Option<string>& message = None())
{
  Response response;
  response.set_status(status);

  if (message.isSome()) {
    response.set_message(message.get());
  }

  return response;
}

} // namespace {


class InMemoryStoreProcess : public Process<InMemoryStoreProcess>
{
public:
  explicit InMemoryStoreProcess(const ClusterState& _current)
    : ProcessBase(process::ID::generate("in-memory-store")),
      current(_current) {}

  Response createIndex(const CreateIndexRequest& request)
  {
    if (current.indices().count(request.index()) > 0) {
      return response(
          Response::ALREADY_EXISTS,
          "Index '" + request.index() + "' already exists");
    }

    IndexMetadata index;
    index.set_name(request.index());
    index.mutable_settings()->insert(
        request.settings().begin(),
        request.settings().end());

    if (request.has_mappings()) {
      index.set_mappings(request.mappings());
    }

    (*current.mutable_indices())[request.index()] = index;
    current.set_version(current.version() + 1);

    return response(Response::OK);
  }

  Response putTemplate(const PutIndexTemplateRequest& request)
  {
    const IndexTemplateMetadata& metadata = request.index_template();
    const string& name = metadata.name();

    auto existing = current.templates().find(name);

    if (request.create() &&
        existing != current.templates().end() &&
        existing->second.version() >= metadata.version()) {
      return response(
          Response::ALREADY_EXISTS,
          "Index template '" + name + "' already exists");
    }

    (*current.mutable_templates())[name] = metadata;
    current.set_version(current.version() + 1);

    return response(Response::OK);
  }

  ClusterState snapshot()
  {
    return current;
  }

private:
  ClusterState current;
};


InMemoryStore::InMemoryStore()
{
  process = new InMemoryStoreProcess(ClusterState());
  spawn(process);
}


InMemoryStore::InMemoryStore(const ClusterState& initial)
{
  process = new InMemoryStoreProcess(initial);
  spawn(process);
}


InMemoryStore::~InMemoryStore()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<Response> InMemoryStore::createIndex(const CreateIndexRequest& request)
{
  return dispatch(process, &InMemoryStoreProcess::createIndex, request);
}


Future<Response> InMemoryStore::putTemplate(
    const PutIndexTemplateRequest& request)
{
  return dispatch(process, &InMemoryStoreProcess::putTemplate, request);
}


Future<ClusterState> InMemoryStore::state()
{
  return dispatch(process, &InMemoryStoreProcess::snapshot);
}

} // namespace store {
} // namespace curator {
