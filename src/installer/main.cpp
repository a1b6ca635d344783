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


#include <iostream>
#include <string>

#include <curator/curator.hpp>

#include <curator/cluster/cached.hpp>

#include <curator/store/in_memory.hpp>

#include <process/future.hpp>
#include <process/process.hpp>

#include <stout/error.hpp>
#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/try.hpp>

#include "installer/flags.hpp"
#include "installer/installer.hpp"

#include "logging/logging.hpp"

using namespace curator;
using namespace curator::internal;

using curator::cluster::CachedClusterService;

using curator::internal::installer::Installer;

using curator::store::InMemoryStore;

using process::Future;

using std::cerr;
using std::cout;
using std::endl;
using std::string;


static Try<ClusterState> loadState(const Path& path)
{
  Try<string> read = os::read(path.string());
  if (read.isError()) {
    return Error("Failed to read '" + path.string() + "': " + read.error());
  }

  Try<JSON::Object> json = JSON::parse<JSON::Object>(read.get());
  if (json.isError()) {
    return Error("Failed to parse '" + path.string() + "': " + json.error());
  }

  return ::protobuf::parse<ClusterState>(json.get());
}


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  installer::Flags flags;

  Try<flags::Warnings> load = flags.load("CURATOR_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << load.error() << "\n\n"
         << "See `curator-installer --help` for a list of supported flags."
         << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  ClusterState state;

  if (flags.state.isSome()) {
    Try<ClusterState> loaded = loadState(flags.state.get());
    if (loaded.isError()) {
      EXIT(EXIT_FAILURE) << "Failed to load cluster state: " << loaded.error();
    }

    state = loaded.get();

    LOG(INFO) << "Loaded cluster state version " << state.version()
              << " with " << state.indices_size() << " indices and "
              << state.templates_size() << " index templates";
  }

  process::initialize();

  InMemoryStore store(state);
  CachedClusterService cluster(state);

  Future<ClusterState> installed;

  {
    Installer installer(flags, &cluster, &store);

    Future<Nothing> ensured = installer.ensureInstalled();
    ensured.await();

    if (!ensured.isReady()) {
      EXIT(EXIT_FAILURE)
        << "Failed to install the internal index and template: "
        << (ensured.isFailed() ? ensured.failure() : "discarded");
    }

    installed = store.state();
  }

  installed.await();

  if (!installed.isReady()) {
    EXIT(EXIT_FAILURE)
      << "Failed to read the cluster state back from the store: "
      << (installed.isFailed() ? installed.failure() : "discarded");
  }

  // Publish the state of the store to the local view, as a cluster
  // state listener would.
  cluster.update(installed.get());

  cout << JSON::protobuf(cluster.state()) << endl;

  return EXIT_SUCCESS;
}
