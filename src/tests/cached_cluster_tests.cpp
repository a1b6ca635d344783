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


#include <gtest/gtest.h>

#include <curator/curator.hpp>

#include <curator/cluster/cached.hpp>

#include "installer/flags.hpp"

#include "tests/utils.hpp"

using curator::cluster::CachedClusterService;

namespace curator {
namespace internal {
namespace tests {

TEST(CachedClusterServiceTest, Update)
{
  installer::Flags flags;
  CachedClusterService cluster;

  EXPECT_EQ(0, cluster.state().indices_size());

  ClusterState state = createStateWithLatestVersionedIndex(flags);
  state.set_version(5);

  EXPECT_TRUE(cluster.update(state));
  EXPECT_EQ(1, cluster.state().indices_size());
  EXPECT_EQ(5u, cluster.state().version());

  // A snapshot of the same version is taken as is.
  state = createStateWithLatestAuditTemplate(flags);
  state.set_version(5);

  EXPECT_TRUE(cluster.update(state));
  EXPECT_EQ(0, cluster.state().indices_size());
  EXPECT_EQ(1, cluster.state().templates_size());
}


// A delayed publication of an older snapshot must not roll the view
// back.
TEST(CachedClusterServiceTest, IgnoreOlderState)
{
  installer::Flags flags;

  ClusterState newer = createStateWithLatestVersionedIndex(flags);
  newer.set_version(7);

  CachedClusterService cluster(newer);

  ClusterState older;
  older.set_version(6);

  EXPECT_FALSE(cluster.update(older));
  EXPECT_EQ(7u, cluster.state().version());
  EXPECT_EQ(1, cluster.state().indices_size());
}

} // namespace tests {
} // namespace internal {
} // namespace curator {
