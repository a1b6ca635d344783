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
#include <vector>

#include <gtest/gtest.h>

#include <curator/curator.hpp>

#include <curator/store/in_memory.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/foreach.hpp>

#include "installer/flags.hpp"
#include "installer/index.hpp"

#include "tests/utils.hpp"

using curator::store::InMemoryStore;

using process::Future;

using std::string;
using std::vector;

namespace curator {
namespace internal {
namespace tests {

TEST(InMemoryStoreTest, CreateIndex)
{
  installer::Flags flags;
  InMemoryStore store;

  const CreateIndexRequest request = installer::createIndexRequest(flags);

  Future<Response> created = store.createIndex(request);
  AWAIT_READY(created);
  EXPECT_EQ(Response::OK, created->status());

  Future<Response> duplicate = store.createIndex(request);
  AWAIT_READY(duplicate);
  EXPECT_EQ(Response::ALREADY_EXISTS, duplicate->status());

  Future<ClusterState> state = store.state();
  AWAIT_READY(state);
  EXPECT_EQ(1u, state->version());
  ASSERT_EQ(1u, state->indices().count(request.index()));

  const IndexMetadata& index = state->indices().at(request.index());
  EXPECT_EQ(request.mappings(), index.mappings());
  EXPECT_EQ("1", index.settings().at("index.number_of_shards"));
}


TEST(InMemoryStoreTest, InitialState)
{
  installer::Flags flags;
  InMemoryStore store(createStateWithLatestVersionedIndex(flags));

  Future<Response> created =
    store.createIndex(installer::createIndexRequest(flags));

  AWAIT_READY(created);
  EXPECT_EQ(Response::ALREADY_EXISTS, created->status());
}


TEST(InMemoryStoreTest, PutTemplate)
{
  installer::Flags flags;
  InMemoryStore store;

  PutIndexTemplateRequest request = installer::putAuditTemplateRequest(flags);

  Future<Response> put = store.putTemplate(request);
  AWAIT_READY(put);
  EXPECT_EQ(Response::OK, put->status());

  // Same version.
  put = store.putTemplate(request);
  AWAIT_READY(put);
  EXPECT_EQ(Response::ALREADY_EXISTS, put->status());

  // Older version.
  request.mutable_index_template()->set_version(flags.version_id - 1);
  put = store.putTemplate(request);
  AWAIT_READY(put);
  EXPECT_EQ(Response::ALREADY_EXISTS, put->status());

  // Newer version replaces the stored template.
  request.mutable_index_template()->set_version(flags.version_id + 1);
  put = store.putTemplate(request);
  AWAIT_READY(put);
  EXPECT_EQ(Response::OK, put->status());

  // Without `create` the template is always replaced.
  request.set_create(false);
  request.mutable_index_template()->set_version(flags.version_id);
  put = store.putTemplate(request);
  AWAIT_READY(put);
  EXPECT_EQ(Response::OK, put->status());

  Future<ClusterState> state = store.state();
  AWAIT_READY(state);
  EXPECT_EQ(3u, state->version());
  EXPECT_EQ(
      flags.version_id,
      state->templates().at(installer::auditTemplateName(flags)).version());
}


// Of many creates of the same index issued at once, exactly one
// creates it.
TEST(InMemoryStoreTest, ConcurrentCreateIndex)
{
  installer::Flags flags;
  InMemoryStore store;

  const CreateIndexRequest request = installer::createIndexRequest(flags);

  vector<Future<Response>> responses;
  for (int i = 0; i < 10; i++) {
    responses.push_back(store.createIndex(request));
  }

  int created = 0;
  foreach (const Future<Response>& response, responses) {
    AWAIT_READY(response);

    if (response->status() == Response::OK) {
      created++;
    } else {
      EXPECT_EQ(Response::ALREADY_EXISTS, response->status());
    }
  }

  EXPECT_EQ(1, created);
}

} // namespace tests {
} // namespace internal {
} // namespace curator {
