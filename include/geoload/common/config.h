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

#ifndef GEOLOAD_CONFIG_H
#define GEOLOAD_CONFIG_H

#include <ctime>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "geoload/common/status.h"

namespace geoload {

enum class GlogLogLevel { INFO = 0, WARNING = 1, ERROR = 2, FATAL = 3 };

bool parseLogLevel(const std::string& str, GlogLogLevel* level);
std::string logLevelToString(GlogLogLevel level);

struct LogConfig {
    std::string log_dir;                          // empty: stderr only
    std::string log_prefix = "geoload";           // prefix for log files
    GlogLogLevel min_log_level = GlogLogLevel::INFO;
    GlogLogLevel stderr_output_level = GlogLogLevel::INFO;
    uint32_t max_log_size_mb = 100;               // max size of one log file

    // Initializes glog for this process. Throws std::runtime_error when the
    // log directory cannot be created.
    void InitLogging(const std::string& program_name) const;
};

struct StoreConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    int32_t db = 0;
    std::string password;
    uint32_t connect_timeout_ms = 5000;
    uint32_t socket_timeout_ms = 5000;

    std::string endpoint() const { return host + ":" + std::to_string(port); }
};

struct WriterConfig {
    uint32_t num_writers = 4;
    uint32_t batch_size = 50;      // keys per pipelined request
    uint32_t write_chunk = 100;    // keys per loop iteration
    int64_t key_ttl_seconds = 259200;  // 3 days
    double skip_probability = 0.0;     // 0 disables miss simulation
    uint32_t loop_pause_us = 1000;
    double progress_interval_sec = 5.0;
    uint32_t version_pause_ms = 2000;
};

struct ReaderConfig {
    uint32_t num_readers = 4;
    uint32_t batch_size = 100;
    double progress_interval_sec = 5.0;
};

struct KeySpaceConfig {
    std::string key_prefix = "ip";
    uint64_t max_keys = 200000;
    std::string primary_version = "v23";
    std::string secondary_version = "v22";
    uint32_t sample_set_size = 100;
    std::string sample_file;  // optional pre-generated samples (JSON)
};

struct GeoloadConfig {
    StoreConfig store;
    WriterConfig writer;
    ReaderConfig reader;
    KeySpaceConfig key_space;
    LogConfig log;

    // Range checks applied once at the configuration boundary.
    Status validate() const;

    std::string stringify() const;
};

// Date-derived namespace tag, e.g. "v22" for the 22nd of the month.
std::string versionFromDate(const std::tm& date);
std::string currentVersionTag();

enum class ConfigFormat { kJson, kYaml };

// Loads GeoloadConfig from a JSON/YAML file and GEOLOAD_* environment
// variables. Every recognised setting is listed in overrideKeys(); values
// that fail to parse are logged and the previous value is kept.
class ConfigLoader {
   public:
    static constexpr const char* kEnvPrefix = "GEOLOAD_";

    struct OverrideKey {
        const char* path;  // dotted key used in config files
        const char* env;   // environment variable, nullptr if file-only
        bool (*apply)(GeoloadConfig& config, const std::string& value);
    };

    static const std::vector<OverrideKey>& overrideKeys();

    // A missing file keeps the defaults; a malformed one is an error.
    static Status loadFile(const std::string& path, GeoloadConfig& config);

    static Status loadFromString(const std::string& content,
                                 ConfigFormat format, GeoloadConfig& config);

    // Returns the number of overrides applied.
    static size_t applyEnvOverrides(GeoloadConfig& config);

    // loadFile + applyEnvOverrides + validate.
    static Status load(const std::string& path, GeoloadConfig& config);

    static bool parseInt64(const std::string& str, int64_t* value);
    static bool parseUInt64(const std::string& str, uint64_t* value);
    static bool parseDouble(const std::string& str, double* value);

   private:
    static Status flattenJson(const std::string& content,
                              std::unordered_map<std::string, std::string>& out);
    static Status flattenYaml(const std::string& content,
                              std::unordered_map<std::string, std::string>& out);
    static void applyFlattened(
        const std::unordered_map<std::string, std::string>& values,
        GeoloadConfig& config);
};

}  // namespace geoload

#endif  // GEOLOAD_CONFIG_H
