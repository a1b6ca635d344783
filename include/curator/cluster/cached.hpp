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


#ifndef __CURATOR_CLUSTER_CACHED_HPP__
#define __CURATOR_CLUSTER_CACHED_HPP__

#include <mutex>

#include <curator/curator.hpp>

#include <curator/cluster/cluster.hpp>

namespace curator {
namespace cluster {

// A cluster service backed by the last published cluster state. The
// cache may be updated from any thread; snapshots older than the one
// currently held (by `ClusterState::version`) are ignored.
class CachedClusterService : public ClusterService
{
public:
  CachedClusterService() {}
  explicit CachedClusterService(const ClusterState& initial);
  ~CachedClusterService() override {}

  ClusterState state() const override;

  // Returns true if the snapshot replaced the cached one.
  bool update(const ClusterState& state);

private:
  mutable std::mutex mutex;
  ClusterState current;
};

} // namespace cluster {
} // namespace curator {

#endif // __CURATOR_CLUSTER_CACHED_HPP__
