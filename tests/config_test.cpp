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

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <cstdlib>
#include <string>

namespace geoload {

class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("ConfigTest");
        FLAGS_logtostderr = 1;
        data_dir_ = GEOLOAD_TEST_DATA_DIR;
        clearEnv();
    }

    void TearDown() override {
        clearEnv();
        google::ShutdownGoogleLogging();
    }

    static void clearEnv() {
        for (const auto& key : ConfigLoader::overrideKeys()) {
            if (key.env) unsetenv(key.env);
        }
    }

    std::string data_dir_;
};

TEST_F(ConfigTest, DefaultsMatchDeployment) {
    GeoloadConfig config;
    EXPECT_EQ(config.store.host, "localhost");
    EXPECT_EQ(config.store.port, 6379);
    EXPECT_EQ(config.store.db, 0);
    EXPECT_EQ(config.writer.num_writers, 4u);
    EXPECT_EQ(config.writer.batch_size, 50u);
    EXPECT_EQ(config.writer.write_chunk, 100u);
    EXPECT_EQ(config.writer.key_ttl_seconds, 259200);
    EXPECT_DOUBLE_EQ(config.writer.skip_probability, 0.0);
    EXPECT_EQ(config.reader.batch_size, 100u);
    EXPECT_EQ(config.key_space.key_prefix, "ip");
    EXPECT_EQ(config.key_space.max_keys, 200000u);
    EXPECT_EQ(config.key_space.primary_version, "v23");
    EXPECT_EQ(config.key_space.secondary_version, "v22");
    EXPECT_TRUE(config.validate().ok());
}

TEST_F(ConfigTest, LoadJsonFile) {
    GeoloadConfig config;
    ASSERT_TRUE(
        ConfigLoader::loadFile(data_dir_ + "/test_config.json", config).ok());
    EXPECT_EQ(config.store.host, "redis.internal");
    EXPECT_EQ(config.store.port, 6380);
    EXPECT_EQ(config.store.db, 2);
    EXPECT_EQ(config.store.password, "s3cret");
    EXPECT_EQ(config.writer.num_writers, 8u);
    EXPECT_EQ(config.writer.batch_size, 25u);
    EXPECT_EQ(config.writer.key_ttl_seconds, 3600);
    EXPECT_DOUBLE_EQ(config.writer.skip_probability, 0.25);
    EXPECT_EQ(config.reader.num_readers, 2u);
    EXPECT_EQ(config.reader.batch_size, 10u);
    EXPECT_EQ(config.key_space.max_keys, 5000u);
    EXPECT_EQ(config.key_space.primary_version, "v7");
    EXPECT_EQ(config.key_space.secondary_version, "v6");
    EXPECT_EQ(config.log.min_log_level, GlogLogLevel::WARNING);
    // Untouched keys keep their defaults.
    EXPECT_EQ(config.writer.write_chunk, 100u);
    EXPECT_EQ(config.key_space.key_prefix, "ip");
}

TEST_F(ConfigTest, LoadYamlFileKeepsDefaultOnInvalidValue) {
    GeoloadConfig config;
    ASSERT_TRUE(
        ConfigLoader::loadFile(data_dir_ + "/test_config.yaml", config).ok());
    EXPECT_EQ(config.store.host, "10.0.0.5");
    EXPECT_EQ(config.store.port, 7000);
    EXPECT_EQ(config.store.connect_timeout_ms, 1500u);
    EXPECT_EQ(config.writer.num_writers, 16u);
    EXPECT_EQ(config.writer.write_chunk, 200u);
    EXPECT_EQ(config.writer.batch_size, 50u);
    EXPECT_EQ(config.reader.num_readers, 6u);
    EXPECT_EQ(config.key_space.key_prefix, "geo");
    EXPECT_EQ(config.key_space.max_keys, 1000000u);
    EXPECT_EQ(config.key_space.sample_set_size, 10u);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    GeoloadConfig config;
    EXPECT_TRUE(
        ConfigLoader::loadFile(data_dir_ + "/does_not_exist.yaml", config)
            .ok());
    EXPECT_TRUE(ConfigLoader::loadFile("", config).ok());
    EXPECT_EQ(config.store.host, "localhost");
}

TEST_F(ConfigTest, MalformedFileIsAnError) {
    GeoloadConfig config;
    Status s =
        ConfigLoader::loadFile(data_dir_ + "/malformed_config.json", config);
    EXPECT_TRUE(s.IsMalformedConfig()) << s.ToString();

    s = ConfigLoader::loadFromString("[1, 2]", ConfigFormat::kJson, config);
    EXPECT_TRUE(s.IsMalformedConfig());
    s = ConfigLoader::loadFromString("store: [unclosed", ConfigFormat::kYaml,
                                     config);
    EXPECT_TRUE(s.IsMalformedConfig());
}

TEST_F(ConfigTest, UnsupportedExtension) {
    GeoloadConfig config;
    // The data directory exists but is neither JSON nor YAML.
    Status s = ConfigLoader::loadFile(data_dir_, config);
    EXPECT_TRUE(s.IsMalformedConfig());
}

TEST_F(ConfigTest, EnvOverridesApplyAndIgnoreInvalid) {
    setenv("GEOLOAD_STORE_HOST", "cache-1", 1);
    setenv("GEOLOAD_STORE_PORT", "6390", 1);
    setenv("GEOLOAD_WRITER_COUNT", "12", 1);
    setenv("GEOLOAD_WRITER_TTL", "600", 1);
    setenv("GEOLOAD_VERSION", "v30", 1);
    setenv("GEOLOAD_READER_BATCH_SIZE", "-5", 1);
    setenv("GEOLOAD_MAX_KEYS", "lots", 1);

    GeoloadConfig config;
    size_t applied = ConfigLoader::applyEnvOverrides(config);
    EXPECT_EQ(applied, 5u);
    EXPECT_EQ(config.store.host, "cache-1");
    EXPECT_EQ(config.store.port, 6390);
    EXPECT_EQ(config.writer.num_writers, 12u);
    EXPECT_EQ(config.writer.key_ttl_seconds, 600);
    EXPECT_EQ(config.key_space.primary_version, "v30");
    EXPECT_EQ(config.reader.batch_size, 100u);
    EXPECT_EQ(config.key_space.max_keys, 200000u);
}

TEST_F(ConfigTest, PortOutOfRangeIsRejected) {
    setenv("GEOLOAD_STORE_PORT", "70000", 1);
    GeoloadConfig config;
    EXPECT_EQ(ConfigLoader::applyEnvOverrides(config), 0u);
    EXPECT_EQ(config.store.port, 6379);
}

TEST_F(ConfigTest, OutOfRangeEnvOverrideKeepsDefault) {
    setenv("GEOLOAD_WRITER_BATCH_SIZE", "0", 1);
    setenv("GEOLOAD_WRITER_TTL", "-5", 1);
    setenv("GEOLOAD_WRITER_COUNT", "0", 1);
    setenv("GEOLOAD_MAX_KEYS", "0", 1);
    setenv("GEOLOAD_STORE_PORT", "0", 1);
    setenv("GEOLOAD_READER_COUNT", "3", 1);

    GeoloadConfig config;
    Status s = ConfigLoader::load("", config);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_EQ(config.writer.batch_size, 50u);
    EXPECT_EQ(config.writer.key_ttl_seconds, 259200);
    EXPECT_EQ(config.writer.num_writers, 4u);
    EXPECT_EQ(config.key_space.max_keys, 200000u);
    EXPECT_EQ(config.store.port, 6379);
    EXPECT_EQ(config.reader.num_readers, 3u);
}

TEST_F(ConfigTest, OutOfRangeFileValueKeepsDefault) {
    GeoloadConfig config;
    ASSERT_TRUE(ConfigLoader::loadFromString(
                    R"({"writer": {"write_chunk": 0, "skip_probability": 1.5,
                        "progress_interval_sec": 0},
                        "reader": {"batch_size": 0},
                        "key_space": {"sample_set_size": 0}})",
                    ConfigFormat::kJson, config)
                    .ok());
    EXPECT_EQ(config.writer.write_chunk, 100u);
    EXPECT_DOUBLE_EQ(config.writer.skip_probability, 0.0);
    EXPECT_DOUBLE_EQ(config.writer.progress_interval_sec, 5.0);
    EXPECT_EQ(config.reader.batch_size, 100u);
    EXPECT_EQ(config.key_space.sample_set_size, 100u);
    EXPECT_TRUE(config.validate().ok());
}

TEST_F(ConfigTest, EnvOverridesFile) {
    setenv("GEOLOAD_STORE_HOST", "from-env", 1);
    GeoloadConfig config;
    ASSERT_TRUE(
        ConfigLoader::load(data_dir_ + "/test_config.json", config).ok());
    EXPECT_EQ(config.store.host, "from-env");
    EXPECT_EQ(config.store.port, 6380);
}

TEST_F(ConfigTest, ValidateNamesField) {
    GeoloadConfig config;
    config.writer.batch_size = 0;
    Status s = config.validate();
    EXPECT_TRUE(s.IsInvalidArgument());
    EXPECT_NE(s.message().find("writer.batch_size"), std::string::npos);

    config = GeoloadConfig();
    config.writer.skip_probability = 1.5;
    EXPECT_TRUE(config.validate().IsInvalidArgument());

    config = GeoloadConfig();
    config.key_space.secondary_version.clear();
    EXPECT_TRUE(config.validate().IsInvalidArgument());

    config = GeoloadConfig();
    config.store.port = 0;
    EXPECT_TRUE(config.validate().IsInvalidArgument());
}

TEST_F(ConfigTest, StringifyMasksPassword) {
    GeoloadConfig config;
    config.store.password = "hunter2";
    std::string text = config.stringify();
    EXPECT_EQ(text.find("hunter2"), std::string::npos);
    EXPECT_NE(text.find("***"), std::string::npos);
    EXPECT_NE(text.find("localhost:6379"), std::string::npos);
}

TEST_F(ConfigTest, VersionFromDate) {
    std::tm date{};
    date.tm_year = 2025 - 1900;
    date.tm_mon = 8;
    date.tm_mday = 22;
    EXPECT_EQ(versionFromDate(date), "v22");
    date.tm_mday = 3;
    EXPECT_EQ(versionFromDate(date), "v3");
    EXPECT_EQ(currentVersionTag().front(), 'v');
}

TEST_F(ConfigTest, ParseHelpers) {
    uint64_t u = 0;
    EXPECT_TRUE(ConfigLoader::parseUInt64("42", &u));
    EXPECT_EQ(u, 42u);
    EXPECT_FALSE(ConfigLoader::parseUInt64("-1", &u));
    EXPECT_FALSE(ConfigLoader::parseUInt64("12abc", &u));

    int64_t i = 0;
    EXPECT_TRUE(ConfigLoader::parseInt64("-7", &i));
    EXPECT_EQ(i, -7);

    double d = 0;
    EXPECT_TRUE(ConfigLoader::parseDouble("0.05", &d));
    EXPECT_DOUBLE_EQ(d, 0.05);
    EXPECT_FALSE(ConfigLoader::parseDouble("", &d));

    GlogLogLevel level;
    EXPECT_TRUE(parseLogLevel("warn", &level));
    EXPECT_EQ(level, GlogLogLevel::WARNING);
    EXPECT_FALSE(parseLogLevel("verbose", &level));
}

}  // namespace geoload
