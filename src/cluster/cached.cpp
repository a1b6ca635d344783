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


#include <curator/cluster/cached.hpp>

#include <stout/synchronized.hpp>

namespace curator {
namespace cluster {

CachedClusterService::CachedClusterService(const ClusterState& initial)
  : current(initial) {}


ClusterState CachedClusterService::state() const
{
  ClusterState state;

  synchronized (mutex) {
    state = current;
  }

  return state;
}


bool CachedClusterService::update(const ClusterState& state)
{
  bool updated = false;

  synchronized (mutex) {
    if (state.version() >= current.version()) {
      current = state;
      updated = true;
    }
  }

  return updated;
}

} // namespace cluster {
} // namespace curator {
