// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <iostream>
#include <string>
#include <vector>

#include "geoload/store/store_client.h"
#include "tool_common.h"

DEFINE_bool(yes, false, "Skip the confirmation prompt of flush");

using namespace geoload;

namespace {

int fail(const std::string& what, const Status& status) {
    std::cerr << what << ": " << status.ToString() << std::endl;
    return 1;
}

int requireArg(const std::vector<std::string>& args, const char* usage) {
    if (args.size() < 2) {
        std::cerr << "usage: geoload_admin " << usage << std::endl;
        return 1;
    }
    return 0;
}

int dispatch(StoreClient& client, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    if (cmd == "ping") {
        Status status = client.ping();
        if (!status.ok()) return fail("ping", status);
        std::cout << "PONG from " << client.endpoint() << std::endl;
        return 0;
    }
    if (cmd == "get") {
        if (requireArg(args, "get <key>")) return 1;
        std::string value;
        Status status = client.get(args[1], value);
        if (status.IsNotFound()) {
            std::cout << "(nil)" << std::endl;
            return 0;
        }
        if (!status.ok()) return fail("get", status);
        std::cout << value << std::endl;
        return 0;
    }
    if (cmd == "exists") {
        if (requireArg(args, "exists <key>")) return 1;
        bool found = false;
        Status status = client.exists(args[1], found);
        if (!status.ok()) return fail("exists", status);
        std::cout << (found ? 1 : 0) << std::endl;
        return 0;
    }
    if (cmd == "del") {
        if (requireArg(args, "del <key>")) return 1;
        Status status = client.remove(args[1]);
        if (!status.ok()) return fail("del", status);
        return 0;
    }
    if (cmd == "ttl") {
        if (requireArg(args, "ttl <key>")) return 1;
        int64_t seconds = 0;
        Status status = client.ttl(args[1], seconds);
        if (!status.ok()) return fail("ttl", status);
        if (seconds == -2) {
            std::cout << "key does not exist" << std::endl;
        } else if (seconds == -1) {
            std::cout << "no expiry" << std::endl;
        } else {
            std::cout << seconds << " s (" << seconds / 3600.0 << " h)"
                      << std::endl;
        }
        return 0;
    }
    if (cmd == "keys" || cmd == "count") {
        std::string pattern = args.size() > 1 ? args[1] : "*";
        std::vector<std::string> keys;
        Status status = client.keys(pattern, keys);
        if (!status.ok()) return fail(cmd, status);
        if (cmd == "count") {
            std::cout << keys.size() << std::endl;
        } else {
            for (const auto& key : keys) std::cout << key << "\n";
            std::cout << std::flush;
        }
        return 0;
    }
    if (cmd == "flush") {
        if (!FLAGS_yes) {
            std::cout << "Delete ALL keys on " << client.endpoint()
                      << "? (y/N): " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            if (answer != "y" && answer != "Y") {
                std::cout << "Flush cancelled" << std::endl;
                return 0;
            }
        }
        Status status = client.flushAll();
        if (!status.ok()) return fail("flush", status);
        std::cout << "Flushed " << client.endpoint() << std::endl;
        return 0;
    }
    std::cerr << "unknown command '" << cmd << "'" << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage(
        "Store maintenance commands.\n"
        "  geoload_admin ping | get <key> | exists <key> | del <key> |\n"
        "                ttl <key> | keys [pattern] | count [pattern] | "
        "flush [--yes]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    GeoloadConfig config;
    Status status = tools::loadToolConfig(config);
    Status log_status = tools::initLogging(config, argv[0]);
    if (!log_status.ok()) {
        LOG(WARNING) << "Logging to stderr only: " << log_status.ToString();
    }
    if (!status.ok()) {
        LOG(ERROR) << "Invalid configuration: " << status.ToString();
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        std::cerr << gflags::ProgramUsage() << std::endl;
        return 1;
    }

    std::unique_ptr<StoreClient> client;
    status = tools::connectAndPing(config.store, client);
    if (!status.ok()) {
        LOG(ERROR) << "Cannot reach store at " << config.store.endpoint()
                   << ": " << status.ToString();
        return 1;
    }
    int rc = dispatch(*client, args);
    client->disconnect();
    google::ShutdownGoogleLogging();
    return rc;
}
