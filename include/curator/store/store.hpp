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


#ifndef __CURATOR_STORE_STORE_HPP__
#define __CURATOR_STORE_STORE_HPP__

#include <curator/curator.hpp>

#include <process/future.hpp>

namespace curator {
namespace store {

// The authoritative, cluster wide store of index metadata. Requests
// are asynchronous and may be issued concurrently by many independent
// processes, so an implementation must make creation atomic: of all
// concurrent creates of one name exactly one is answered with OK, the
// others with ALREADY_EXISTS.
//
// A reply that could not be obtained (the transport failed, the store
// did not answer in time, the request was discarded) is reported by
// failing the returned future. Every other answer, including a
// rejection, is a `Response`.
class Store
{
public:
  Store() {}
  virtual ~Store() {}

  virtual process::Future<Response> createIndex(
      const CreateIndexRequest& request) = 0;

  virtual process::Future<Response> putTemplate(
      const PutIndexTemplateRequest& request) = 0;
};

} // namespace store {
} // namespace curator {

#endif // __CURATOR_STORE_STORE_HPP__
