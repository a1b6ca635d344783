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

#include <gtest/gtest.h>

#include <curator/curator.hpp>

#include "installer/flags.hpp"
#include "installer/index.hpp"
#include "installer/inspector.hpp"

#include "tests/utils.hpp"

using curator::internal::installer::auditTemplateName;
using curator::internal::installer::haveLatestTemplate;
using curator::internal::installer::haveLatestVersionedIndex;
using curator::internal::installer::latestVersionedIndexName;

namespace curator {
namespace internal {
namespace tests {

TEST(InspectorTest, HaveLatestVersionedIndex)
{
  installer::Flags flags;
  const std::string name = latestVersionedIndexName(flags);

  EXPECT_TRUE(haveLatestVersionedIndex(
      createStateWithLatestVersionedIndex(flags), name));

  EXPECT_FALSE(haveLatestVersionedIndex(ClusterState(), name));

  // The template alone does not make the index present.
  EXPECT_FALSE(haveLatestVersionedIndex(
      createStateWithLatestAuditTemplate(flags), name));
}


// The schema version is part of the index name, so an index of a
// previous (or later) version never satisfies the check.
TEST(InspectorTest, OtherIndexVersionIsNotLatest)
{
  installer::Flags flags;
  flags.index_version = "004";

  ClusterState state = createStateWithLatestVersionedIndex(flags);

  flags.index_version = "005";
  EXPECT_FALSE(haveLatestVersionedIndex(
      state, latestVersionedIndexName(flags)));

  flags.index_version = "006";
  EXPECT_FALSE(haveLatestVersionedIndex(
      state, latestVersionedIndexName(flags)));
}


TEST(InspectorTest, HaveLatestTemplate)
{
  installer::Flags flags;
  const std::string name = auditTemplateName(flags);

  EXPECT_TRUE(haveLatestTemplate(
      createStateWithLatestAuditTemplate(flags), name, flags.version_id));

  EXPECT_FALSE(haveLatestTemplate(ClusterState(), name, flags.version_id));

  EXPECT_FALSE(haveLatestTemplate(
      createStateWithLatestVersionedIndex(flags), name, flags.version_id));
}


TEST(InspectorTest, TemplateVersionComparison)
{
  installer::Flags flags;
  const std::string name = auditTemplateName(flags);

  ClusterState state = createStateWithLatestAuditTemplate(flags);

  // A template installed by a newer version is still acceptable.
  EXPECT_TRUE(haveLatestTemplate(state, name, flags.version_id - 1));

  // A template installed by an older version must be replaced.
  EXPECT_FALSE(haveLatestTemplate(state, name, flags.version_id + 1));

  (*state.mutable_templates())[name].clear_version();
  EXPECT_FALSE(haveLatestTemplate(state, name, 1));
}

} // namespace tests {
} // namespace internal {
} // namespace curator {
