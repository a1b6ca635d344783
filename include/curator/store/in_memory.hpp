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


#ifndef __CURATOR_STORE_IN_MEMORY_HPP__
#define __CURATOR_STORE_IN_MEMORY_HPP__

#include <curator/curator.hpp>

#include <curator/store/store.hpp>

#include <process/future.hpp>

namespace curator {
namespace store {

// Forward declaration.
class InMemoryStoreProcess;


// A store that keeps the cluster metadata in memory. All requests are
// serialized through a single process, which makes create-if-absent
// atomic. Intended for tests and for the standalone installer.
class InMemoryStore : public Store
{
public:
  InMemoryStore();
  explicit InMemoryStore(const ClusterState& initial);
  ~InMemoryStore() override;

  process::Future<Response> createIndex(
      const CreateIndexRequest& request) override;

  process::Future<Response> putTemplate(
      const PutIndexTemplateRequest& request) override;

  // Returns a snapshot of the current cluster metadata.
  process::Future<ClusterState> state();

private:
  InMemoryStoreProcess* process;
};

} // namespace store {
} // namespace curator {

#endif // __CURATOR_STORE_IN_MEMORY_HPP__
