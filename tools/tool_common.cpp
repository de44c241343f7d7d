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

#include "tool_common.h"

#include <glog/logging.h>

#include <stdexcept>

#include "geoload/store/redis_store.h"

DEFINE_string(config, "",
              "Configuration file (.json, .yaml or .yml); defaults are used "
              "when empty or missing");
DEFINE_string(host, "localhost", "Store host");
DEFINE_int32(port, 6379, "Store port");
DEFINE_int32(db, 0, "Store database index");
DEFINE_string(password, "", "Store password");
DEFINE_uint64(max_keys, 200000, "Size of the key space per version");
DEFINE_string(primary_version, "v23", "Primary version tag");
DEFINE_string(secondary_version, "v22", "Secondary (fallback) version tag");
DEFINE_string(log_dir, "", "Log directory; logs go to stderr when empty");
DEFINE_string(log_level, "INFO", "Minimum log level: INFO|WARNING|ERROR");

namespace geoload {
namespace tools {

bool flagIsSet(const char* name) {
    gflags::CommandLineFlagInfo info;
    return gflags::GetCommandLineFlagInfo(name, &info) && !info.is_default;
}

Status loadToolConfig(GeoloadConfig& config) {
    CHECK_STATUS(ConfigLoader::loadFile(FLAGS_config, config));
    ConfigLoader::applyEnvOverrides(config);

    if (flagIsSet("host")) config.store.host = FLAGS_host;
    if (flagIsSet("port")) {
        if (FLAGS_port <= 0 || FLAGS_port > 65535) {
            return Status::InvalidArgument("--port must be in 1..65535" +
                                           std::string(LOC_MARK));
        }
        config.store.port = static_cast<uint16_t>(FLAGS_port);
    }
    if (flagIsSet("db")) config.store.db = FLAGS_db;
    if (flagIsSet("password")) config.store.password = FLAGS_password;
    if (flagIsSet("max_keys")) config.key_space.max_keys = FLAGS_max_keys;
    if (flagIsSet("primary_version")) {
        config.key_space.primary_version = FLAGS_primary_version;
    }
    if (flagIsSet("secondary_version")) {
        config.key_space.secondary_version = FLAGS_secondary_version;
    }
    if (flagIsSet("log_dir")) config.log.log_dir = FLAGS_log_dir;
    if (flagIsSet("log_level")) {
        GlogLogLevel level;
        if (!parseLogLevel(FLAGS_log_level, &level)) {
            return Status::InvalidArgument("invalid --log_level " +
                                           FLAGS_log_level + LOC_MARK);
        }
        config.log.min_log_level = level;
        config.log.stderr_output_level = level;
    }
    return config.validate();
}

Status initLogging(const GeoloadConfig& config, const char* argv0) {
    try {
        config.log.InitLogging(argv0);
    } catch (const std::runtime_error& e) {
        LogConfig fallback = config.log;
        fallback.log_dir.clear();
        fallback.InitLogging(argv0);
        return Status::InvalidArgument(e.what());
    }
    return Status::OK();
}

Status connectAndPing(const StoreConfig& config,
                      std::unique_ptr<StoreClient>& client) {
    client = std::make_unique<RedisStoreClient>(config);
    CHECK_STATUS(client->connect());
    return client->ping();
}

Status loadRecordSource(const GeoloadConfig& config,
                        std::shared_ptr<const RecordSource>& source) {
    return createRecordSource(config.key_space.sample_file,
                              config.key_space.sample_set_size, source);
}

}  // namespace tools
}  // namespace geoload
