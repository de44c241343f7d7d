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

#include "geoload/record/record_source.h"

#include <gtest/gtest.h>
#include <glog/logging.h>

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif

#include <memory>
#include <sstream>

namespace geoload {

class RecordSourceTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("RecordSourceTest");
        FLAGS_logtostderr = 1;
    }

    void TearDown() override { google::ShutdownGoogleLogging(); }
};

TEST_F(RecordSourceTest, CyclesModuloSampleSet) {
    SyntheticRecordSource source;
    EXPECT_EQ(source.sampleCount(), 100u);
    EXPECT_EQ(source.generate(uint64_t{7}), source.generate(uint64_t{107}));
    EXPECT_EQ(source.generate(uint64_t{0}), source.generate(uint64_t{200000}));
    EXPECT_NE(source.generate(uint64_t{7}), source.generate(uint64_t{8}));
}

TEST_F(RecordSourceTest, DeterministicAcrossInstances) {
    SyntheticRecordSource a(10);
    SyntheticRecordSource b(10);
    for (uint64_t id = 0; id < 10; ++id) {
        EXPECT_EQ(a.generate(id), b.generate(id));
    }
    EXPECT_EQ(SyntheticRecordSource::buildSample(3),
              SyntheticRecordSource::buildSample(3));
}

TEST_F(RecordSourceTest, PayloadIsJsonOfAboutOneKilobyte) {
    SyntheticRecordSource source;
    EXPECT_GT(source.averagePayloadSize(), 700.0);
    EXPECT_LT(source.averagePayloadSize(), 2048.0);

    Json::Value doc;
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream in(source.generate(uint64_t{5}));
    ASSERT_TRUE(Json::parseFromStream(builder, in, &doc, &errs)) << errs;
    EXPECT_EQ(doc["ip"].asString(), "10.0.0.5");
    EXPECT_TRUE(doc.isMember("country_code"));
    EXPECT_TRUE(doc.isMember("latitude"));
    EXPECT_TRUE(doc["dns_servers"].isArray());
}

TEST_F(RecordSourceTest, StringIdentifiers) {
    SyntheticRecordSource source;
    EXPECT_EQ(source.generate(std::string_view("42")),
              source.generate(uint64_t{42}));
    const std::string& a = source.generate(std::string_view("192.0.2.1"));
    const std::string& b = source.generate(std::string_view("192.0.2.1"));
    EXPECT_EQ(&a, &b);
}

TEST_F(RecordSourceTest, LoadFromFile) {
    std::shared_ptr<SyntheticRecordSource> source;
    ASSERT_TRUE(SyntheticRecordSource::fromFile(
                    std::string(GEOLOAD_TEST_DATA_DIR) + "/sample_keys.json",
                    source)
                    .ok());
    ASSERT_EQ(source->sampleCount(), 3u);
    EXPECT_NE(source->generate(uint64_t{4}).find("London"), std::string::npos);
    EXPECT_EQ(source->generate(uint64_t{0}), source->generate(uint64_t{3}));
}

TEST_F(RecordSourceTest, LoadFromBadFile) {
    std::shared_ptr<SyntheticRecordSource> source;
    EXPECT_TRUE(SyntheticRecordSource::fromFile("/nonexistent/samples.json",
                                                source)
                    .IsInvalidArgument());
    EXPECT_TRUE(
        SyntheticRecordSource::fromFile(
            std::string(GEOLOAD_TEST_DATA_DIR) + "/malformed_config.json",
            source)
            .IsMalformedConfig());
}

TEST_F(RecordSourceTest, CreateRecordSource) {
    std::shared_ptr<const RecordSource> source;
    ASSERT_TRUE(createRecordSource("", 5, source).ok());
    EXPECT_EQ(source->sampleCount(), 5u);
    ASSERT_TRUE(createRecordSource(
                    std::string(GEOLOAD_TEST_DATA_DIR) + "/sample_keys.json",
                    100, source)
                    .ok());
    EXPECT_EQ(source->sampleCount(), 3u);
}

}  // namespace geoload
