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

#include "geoload/common/config.h"

#include <glog/logging.h>

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace geoload {

namespace {

// Each assign helper leaves |field| untouched when the value does not parse
// or falls outside the accepted range.
template <typename T>
bool assignUnsigned(const std::string& value, T* field,
                    uint64_t min_value = 0) {
    uint64_t parsed = 0;
    if (!ConfigLoader::parseUInt64(value, &parsed) || parsed < min_value ||
        parsed > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        return false;
    }
    *field = static_cast<T>(parsed);
    return true;
}

template <typename T>
bool assignSigned(const std::string& value, T* field,
                  int64_t min_value = std::numeric_limits<int64_t>::min()) {
    int64_t parsed = 0;
    if (!ConfigLoader::parseInt64(value, &parsed) || parsed < min_value ||
        parsed > static_cast<int64_t>(std::numeric_limits<T>::max()) ||
        parsed < static_cast<int64_t>(std::numeric_limits<T>::min())) {
        return false;
    }
    *field = static_cast<T>(parsed);
    return true;
}

bool assignDouble(const std::string& value, double* field, double min_value,
                  double max_value) {
    double parsed = 0;
    if (!ConfigLoader::parseDouble(value, &parsed) || parsed < min_value ||
        parsed > max_value) {
        return false;
    }
    *field = parsed;
    return true;
}

bool assignPositiveDouble(const std::string& value, double* field) {
    double parsed = 0;
    if (!ConfigLoader::parseDouble(value, &parsed) || !(parsed > 0.0)) {
        return false;
    }
    *field = parsed;
    return true;
}

bool assignString(const std::string& value, std::string* field) {
    *field = value;
    return true;
}

std::string trim(const std::string& str) {
    auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void flattenYamlNode(const YAML::Node& node, const std::string& key,
                     std::unordered_map<std::string, std::string>& out) {
    if (node.IsScalar()) {
        out[key] = node.as<std::string>();
    } else if (node.IsMap()) {
        for (const auto& iter : node) {
            std::string new_key =
                key.empty() ? iter.first.as<std::string>()
                            : key + "." + iter.first.as<std::string>();
            flattenYamlNode(iter.second, new_key, out);
        }
    } else if (!node.IsNull()) {
        LOG(WARNING) << "Ignoring non-scalar config entry '" << key << "'";
    }
}

void flattenJsonNode(const Json::Value& node, const std::string& key,
                     std::unordered_map<std::string, std::string>& out) {
    if (node.isObject()) {
        for (const auto& member : node.getMemberNames()) {
            std::string new_key = key.empty() ? member : key + "." + member;
            flattenJsonNode(node[member], new_key, out);
        }
    } else if (node.isArray()) {
        LOG(WARNING) << "Ignoring non-scalar config entry '" << key << "'";
    } else if (!node.isNull()) {
        out[key] = node.asString();
    }
}

}  // namespace

bool parseLogLevel(const std::string& str, GlogLogLevel* level) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    if (s == "INFO") {
        *level = GlogLogLevel::INFO;
    } else if (s == "WARNING" || s == "WARN") {
        *level = GlogLogLevel::WARNING;
    } else if (s == "ERROR") {
        *level = GlogLogLevel::ERROR;
    } else if (s == "FATAL") {
        *level = GlogLogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

std::string logLevelToString(GlogLogLevel level) {
    switch (level) {
        case GlogLogLevel::INFO:
            return "INFO";
        case GlogLogLevel::WARNING:
            return "WARNING";
        case GlogLogLevel::ERROR:
            return "ERROR";
        case GlogLogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

void LogConfig::InitLogging(const std::string& program_name) const {
    FLAGS_minloglevel = static_cast<int>(min_log_level);
    FLAGS_stderrthreshold = static_cast<int>(stderr_output_level);
    FLAGS_max_log_size = max_log_size_mb;
    if (log_dir.empty()) {
        FLAGS_logtostderr = true;
        google::InitGoogleLogging(program_name.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory: " +
                                 log_dir + ", " + ec.message());
    }

    FLAGS_log_dir = log_dir;
    FLAGS_logtostderr = false;
    FLAGS_alsologtostderr = true;
    google::SetLogFilenameExtension(".log");
    for (auto& [level, level_str] :
         std::unordered_map<google::LogSeverity, std::string>{
             {google::INFO, "INFO"},
             {google::WARNING, "WARNING"},
             {google::ERROR, "ERROR"},
             {google::FATAL, "FATAL"}}) {
        google::SetLogDestination(
            level, (log_dir + "/" + log_prefix + "." + level_str + ".").c_str());
    }
    google::InitGoogleLogging(program_name.c_str());
    LOG(INFO) << "Log config: dir=" << log_dir
              << ", min_level=" << logLevelToString(min_log_level)
              << ", max_file_size=" << max_log_size_mb << "MB";
}

Status GeoloadConfig::validate() const {
    if (store.host.empty()) {
        return Status::InvalidArgument("store.host must not be empty");
    }
    if (store.port == 0) {
        return Status::InvalidArgument("store.port must be in 1..65535");
    }
    if (store.db < 0) {
        return Status::InvalidArgument("store.db must not be negative");
    }
    if (writer.num_writers < 1) {
        return Status::InvalidArgument("writer.num_writers must be >= 1");
    }
    if (writer.batch_size < 1) {
        return Status::InvalidArgument("writer.batch_size must be >= 1");
    }
    if (writer.write_chunk < 1) {
        return Status::InvalidArgument("writer.write_chunk must be >= 1");
    }
    if (writer.key_ttl_seconds < 1) {
        return Status::InvalidArgument("writer.key_ttl_seconds must be >= 1");
    }
    if (writer.skip_probability < 0.0 || writer.skip_probability > 1.0) {
        return Status::InvalidArgument(
            "writer.skip_probability must be in [0, 1]");
    }
    if (writer.progress_interval_sec <= 0.0 ||
        reader.progress_interval_sec <= 0.0) {
        return Status::InvalidArgument(
            "progress_interval_sec must be positive");
    }
    if (reader.num_readers < 1) {
        return Status::InvalidArgument("reader.num_readers must be >= 1");
    }
    if (reader.batch_size < 1) {
        return Status::InvalidArgument("reader.batch_size must be >= 1");
    }
    if (key_space.max_keys < 1) {
        return Status::InvalidArgument("key_space.max_keys must be >= 1");
    }
    if (key_space.sample_set_size < 1) {
        return Status::InvalidArgument(
            "key_space.sample_set_size must be >= 1");
    }
    if (key_space.key_prefix.empty()) {
        return Status::InvalidArgument("key_space.key_prefix must not be empty");
    }
    if (key_space.primary_version.empty() ||
        key_space.secondary_version.empty()) {
        return Status::InvalidArgument("version tags must not be empty");
    }
    return Status::OK();
}

std::string GeoloadConfig::stringify() const {
    std::stringstream ss;
    auto pad = [](const std::string& s, size_t width = 28) {
        if (s.size() >= width) return s;
        return s + std::string(width - s.size(), ' ');
    };

    ss << "GeoloadConfig {\n";
    ss << "  [Store]\n"
       << "    " << pad("endpoint:") << store.endpoint() << "\n"
       << "    " << pad("db:") << store.db << "\n"
       << "    " << pad("password:") << (store.password.empty() ? "None" : "***")
       << "\n"
       << "    " << pad("connect_timeout:") << store.connect_timeout_ms
       << " ms\n"
       << "    " << pad("socket_timeout:") << store.socket_timeout_ms
       << " ms\n\n";

    ss << "  [Writer]\n"
       << "    " << pad("num_writers:") << writer.num_writers << "\n"
       << "    " << pad("batch_size:") << writer.batch_size << "\n"
       << "    " << pad("write_chunk:") << writer.write_chunk << "\n"
       << "    " << pad("key_ttl_seconds:") << writer.key_ttl_seconds
       << " sec\n"
       << "    " << pad("skip_probability:") << writer.skip_probability
       << "\n\n";

    ss << "  [Reader]\n"
       << "    " << pad("num_readers:") << reader.num_readers << "\n"
       << "    " << pad("batch_size:") << reader.batch_size << "\n\n";

    ss << "  [Key Space]\n"
       << "    " << pad("key_prefix:") << key_space.key_prefix << "\n"
       << "    " << pad("max_keys:") << key_space.max_keys << "\n"
       << "    " << pad("primary_version:") << key_space.primary_version
       << "\n"
       << "    " << pad("secondary_version:") << key_space.secondary_version
       << "\n"
       << "    " << pad("sample_set_size:") << key_space.sample_set_size
       << "\n";
    if (!key_space.sample_file.empty()) {
        ss << "    " << pad("sample_file:") << key_space.sample_file << "\n";
    }
    ss << "\n  [Log]\n"
       << "    " << pad("log_dir:")
       << (log.log_dir.empty() ? "<stderr>" : log.log_dir) << "\n"
       << "    " << pad("log_level:") << logLevelToString(log.min_log_level)
       << "\n";
    ss << "}";
    return ss.str();
}

std::string versionFromDate(const std::tm& date) {
    return "v" + std::to_string(date.tm_mday);
}

std::string currentVersionTag() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    return versionFromDate(local_tm);
}

// clang-format off
const std::vector<ConfigLoader::OverrideKey>& ConfigLoader::overrideKeys() {
    static const std::vector<OverrideKey> keys = {
        {"store.host", "GEOLOAD_STORE_HOST",
         [](GeoloadConfig& c, const std::string& v) {
             if (v.empty()) return false;
             return assignString(v, &c.store.host);
         }},
        {"store.port", "GEOLOAD_STORE_PORT",
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.store.port, 1);
         }},
        {"store.db", "GEOLOAD_STORE_DB",
         [](GeoloadConfig& c, const std::string& v) {
             return assignSigned(v, &c.store.db, 0);
         }},
        {"store.password", "GEOLOAD_STORE_PASSWORD",
         [](GeoloadConfig& c, const std::string& v) {
             return assignString(v, &c.store.password);
         }},
        {"store.connect_timeout_ms", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.store.connect_timeout_ms);
         }},
        {"store.socket_timeout_ms", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.store.socket_timeout_ms);
         }},
        {"writer.num_writers", "GEOLOAD_WRITER_COUNT",
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.writer.num_writers, 1);
         }},
        {"writer.batch_size", "GEOLOAD_WRITER_BATCH_SIZE",
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.writer.batch_size, 1);
         }},
        {"writer.write_chunk", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.writer.write_chunk, 1);
         }},
        {"writer.key_ttl_seconds", "GEOLOAD_WRITER_TTL",
         [](GeoloadConfig& c, const std::string& v) {
             return assignSigned(v, &c.writer.key_ttl_seconds, 1);
         }},
        {"writer.skip_probability", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignDouble(v, &c.writer.skip_probability, 0.0, 1.0);
         }},
        {"writer.loop_pause_us", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.writer.loop_pause_us);
         }},
        {"writer.progress_interval_sec", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignPositiveDouble(v, &c.writer.progress_interval_sec);
         }},
        {"writer.version_pause_ms", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.writer.version_pause_ms);
         }},
        {"reader.num_readers", "GEOLOAD_READER_COUNT",
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.reader.num_readers, 1);
         }},
        {"reader.batch_size", "GEOLOAD_READER_BATCH_SIZE",
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.reader.batch_size, 1);
         }},
        {"reader.progress_interval_sec", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignPositiveDouble(v, &c.reader.progress_interval_sec);
         }},
        {"key_space.key_prefix", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             if (v.empty()) return false;
             return assignString(v, &c.key_space.key_prefix);
         }},
        {"key_space.max_keys", "GEOLOAD_MAX_KEYS",
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.key_space.max_keys, 1);
         }},
        {"key_space.primary_version", "GEOLOAD_VERSION",
         [](GeoloadConfig& c, const std::string& v) {
             if (v.empty()) return false;
             return assignString(v, &c.key_space.primary_version);
         }},
        {"key_space.secondary_version", "GEOLOAD_SECONDARY_VERSION",
         [](GeoloadConfig& c, const std::string& v) {
             if (v.empty()) return false;
             return assignString(v, &c.key_space.secondary_version);
         }},
        {"key_space.sample_set_size", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignUnsigned(v, &c.key_space.sample_set_size, 1);
         }},
        {"key_space.sample_file", nullptr,
         [](GeoloadConfig& c, const std::string& v) {
             return assignString(v, &c.key_space.sample_file);
         }},
        {"log.log_dir", "GEOLOAD_LOG_DIR",
         [](GeoloadConfig& c, const std::string& v) {
             return assignString(v, &c.log.log_dir);
         }},
        {"log.level", "GEOLOAD_LOG_LEVEL",
         [](GeoloadConfig& c, const std::string& v) {
             return parseLogLevel(v, &c.log.min_log_level);
         }},
    };
    return keys;
}
// clang-format on

bool ConfigLoader::parseInt64(const std::string& str, int64_t* value) {
    std::string s = trim(str);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *value = parsed;
    return true;
}

bool ConfigLoader::parseUInt64(const std::string& str, uint64_t* value) {
    std::string s = trim(str);
    if (s.empty() || s[0] == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *value = parsed;
    return true;
}

bool ConfigLoader::parseDouble(const std::string& str, double* value) {
    std::string s = trim(str);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *value = parsed;
    return true;
}

Status ConfigLoader::flattenJson(
    const std::string& content,
    std::unordered_map<std::string, std::string>& out) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(content);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return Status::MalformedConfig("Failed to parse JSON config: " +
                                       errors + LOC_MARK);
    }
    if (!root.isObject()) {
        return Status::MalformedConfig(
            "JSON config root must be an object" LOC_MARK);
    }
    flattenJsonNode(root, "", out);
    return Status::OK();
}

Status ConfigLoader::flattenYaml(
    const std::string& content,
    std::unordered_map<std::string, std::string>& out) {
    try {
        YAML::Node root = YAML::Load(content);
        if (!root.IsMap()) {
            return Status::MalformedConfig(
                "YAML config root must be a mapping" LOC_MARK);
        }
        flattenYamlNode(root, "", out);
    } catch (const YAML::Exception& e) {
        return Status::MalformedConfig(
            std::string("Failed to parse YAML config: ") + e.what() + LOC_MARK);
    }
    return Status::OK();
}

void ConfigLoader::applyFlattened(
    const std::unordered_map<std::string, std::string>& values,
    GeoloadConfig& config) {
    for (const auto& [key, value] : values) {
        auto& keys = overrideKeys();
        auto it = std::find_if(
            keys.begin(), keys.end(),
            [&key](const OverrideKey& entry) { return key == entry.path; });
        if (it == keys.end()) {
            LOG(WARNING) << "Unknown config key '" << key << "' ignored";
            continue;
        }
        if (!it->apply(config, value)) {
            LOG(WARNING) << "Invalid value for config key '" << key
                         << "': '" << value << "', keeping default";
        }
    }
}

Status ConfigLoader::loadFromString(const std::string& content,
                                    ConfigFormat format,
                                    GeoloadConfig& config) {
    std::unordered_map<std::string, std::string> values;
    if (format == ConfigFormat::kJson) {
        CHECK_STATUS(flattenJson(content, values));
    } else {
        CHECK_STATUS(flattenYaml(content, values));
    }
    applyFlattened(values, config);
    return Status::OK();
}

Status ConfigLoader::loadFile(const std::string& path, GeoloadConfig& config) {
    if (path.empty()) return Status::OK();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG(WARNING) << "Config file " << path
                     << " not found, using defaults";
        return Status::OK();
    }

    ConfigFormat format;
    if (endsWith(path, ".json")) {
        format = ConfigFormat::kJson;
    } else if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        format = ConfigFormat::kYaml;
    } else {
        return Status::MalformedConfig("Unsupported config file format: " +
                                       path + LOC_MARK);
    }

    std::ifstream file(path);
    if (!file) {
        return Status::MalformedConfig("Cannot open config file " + path +
                                       LOC_MARK);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    CHECK_STATUS(loadFromString(buffer.str(), format, config));
    LOG(INFO) << "Loaded configuration from " << path;
    return Status::OK();
}

size_t ConfigLoader::applyEnvOverrides(GeoloadConfig& config) {
    size_t applied = 0;
    for (const auto& entry : overrideKeys()) {
        if (!entry.env) continue;
        const char* value = std::getenv(entry.env);
        if (!value) continue;
        if (entry.apply(config, value)) {
            ++applied;
        } else {
            LOG(WARNING) << "Invalid environment variable " << entry.env
                         << "=" << value << ", keeping previous value";
        }
    }
    return applied;
}

Status ConfigLoader::load(const std::string& path, GeoloadConfig& config) {
    CHECK_STATUS(loadFile(path, config));
    applyEnvOverrides(config);
    return config.validate();
}

}  // namespace geoload
