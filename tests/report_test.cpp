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

#include "geoload/report.h"

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace geoload {

class ReportTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("ReportTest");
        FLAGS_logtostderr = 1;
    }

    void TearDown() override { google::ShutdownGoogleLogging(); }

    static WriteReport makeWorker(uint32_t id, uint64_t written,
                                  double duration) {
        WriteReport report;
        report.worker_id = id;
        report.version = "v3";
        report.start_key = id * 100;
        report.end_key = (id + 1) * 100;
        report.keys_written = written;
        report.keys_skipped = 100 - written;
        report.duration_sec = duration;
        return report;
    }
};

TEST_F(ReportTest, LatencyPercentilesInterpolate) {
    std::vector<double> samples;
    for (int i = 100; i >= 1; --i) samples.push_back(i);
    LatencyStats stats = LatencyStats::compute(samples);
    EXPECT_DOUBLE_EQ(stats.min, 1.0);
    EXPECT_DOUBLE_EQ(stats.max, 100.0);
    EXPECT_DOUBLE_EQ(stats.avg, 50.5);
    EXPECT_DOUBLE_EQ(stats.p50, 50.5);
    EXPECT_NEAR(stats.p95, 95.05, 1e-9);

    // With 20 samples p95 lies between the two largest, not at the max.
    std::vector<double> twenty;
    for (int i = 1; i <= 20; ++i) twenty.push_back(i);
    LatencyStats small = LatencyStats::compute(twenty);
    EXPECT_DOUBLE_EQ(small.p50, 10.5);
    EXPECT_NEAR(small.p95, 19.05, 1e-9);
    EXPECT_LT(small.p95, small.max);

    std::vector<double> sorted = {1.0, 2.0, 3.0};
    EXPECT_DOUBLE_EQ(LatencyStats::percentile(sorted, 0), 1.0);
    EXPECT_DOUBLE_EQ(LatencyStats::percentile(sorted, 100), 3.0);
    EXPECT_DOUBLE_EQ(LatencyStats::percentile(sorted, 25), 1.5);

    LatencyStats single = LatencyStats::compute({0.25});
    EXPECT_DOUBLE_EQ(single.p50, 0.25);
    EXPECT_DOUBLE_EQ(single.p95, 0.25);

    LatencyStats none = LatencyStats::compute({});
    EXPECT_DOUBLE_EQ(none.max, 0.0);
    EXPECT_DOUBLE_EQ(none.p95, 0.0);
}

TEST_F(ReportTest, ReadStatisticsRecordAndMerge) {
    ReadStatistics a;
    a.record({1, ReadTier::kPrimary, 100, 0.001, true});
    a.record({2, ReadTier::kSecondary, 50, 0.002, true});
    a.record({3, ReadTier::kNone, 0, 0.003, false});

    ReadStatistics b;
    b.record({4, ReadTier::kPrimary, 10, 0.004, true});
    b.interrupted = true;

    a.merge(b);
    EXPECT_EQ(a.total_reads, 4u);
    EXPECT_EQ(a.successful_reads, 3u);
    EXPECT_EQ(a.cache_misses, 1u);
    EXPECT_EQ(a.primary_hits, 2u);
    EXPECT_EQ(a.secondary_hits, 1u);
    EXPECT_EQ(a.total_bytes, 160u);
    EXPECT_EQ(a.latencies_sec.size(), 3u);
    EXPECT_TRUE(a.interrupted);
    EXPECT_DOUBLE_EQ(a.hitRate(), 75.0);
    EXPECT_DOUBLE_EQ(a.latency().max, 0.004);

    // Without a duration there is no rate.
    EXPECT_DOUBLE_EQ(a.readsPerSecond(), 0.0);
    a.duration_sec = 2.0;
    EXPECT_DOUBLE_EQ(a.readsPerSecond(), 2.0);
}

TEST_F(ReportTest, ReadStatisticsJson) {
    ReadStatistics stats;
    stats.mode = "pipeline";
    stats.record({1, ReadTier::kPrimary, 100, 0.002, true});
    stats.duration_sec = 1.0;
    Json::Value json = stats.toJson();
    EXPECT_EQ(json["mode"].asString(), "pipeline");
    EXPECT_EQ(json["primary_hits"].asUInt64(), 1u);
    EXPECT_EQ(json["cache_misses"].asUInt64(), 0u);
    EXPECT_DOUBLE_EQ(json["latency_ms"]["p50"].asDouble(), 2.0);
    EXPECT_FALSE(json["interrupted"].asBool());

    std::ostringstream os;
    stats.print(os);
    EXPECT_NE(os.str().find("Read benchmark (pipeline)"), std::string::npos);
}

TEST_F(ReportTest, AggregateWriteReport) {
    AggregateWriteReport report;
    report.version = "v3";
    report.num_workers = 2;
    report.target_keys = 200;
    report.avg_payload_bytes = 1024.0;
    report.add(makeWorker(0, 90, 1.0));
    report.add(makeWorker(1, 100, 2.0));
    report.duration_sec = 2.0;

    EXPECT_EQ(report.total_written, 190u);
    EXPECT_EQ(report.total_skipped, 10u);
    EXPECT_DOUBLE_EQ(report.totalRate(), 95.0);
    EXPECT_DOUBLE_EQ(report.workers[1].rate(), 50.0);
    EXPECT_DOUBLE_EQ(report.megabytesWritten(), 190.0 / 1024.0);

    Json::Value json = report.toJson();
    EXPECT_EQ(json["total_keys_written"].asUInt64(), 190u);
    EXPECT_DOUBLE_EQ(json["total_rate"].asDouble(), 95.0);
    ASSERT_EQ(json["writer_stats"].size(), 2u);
    EXPECT_EQ(json["writer_stats"][1]["writer_id"].asUInt(), 1u);
    EXPECT_EQ(json["writer_stats"][1]["start_key"].asUInt64(), 100u);
    EXPECT_FALSE(json["writer_stats"][0].isMember("error"));

    std::ostringstream os;
    report.print(os);
    EXPECT_NE(os.str().find("[100, 200)"), std::string::npos);
}

TEST_F(ReportTest, MultiVersionProjection) {
    MultiVersionReport report;
    report.total_written = 1000;
    report.overall_duration_sec = 10.0;
    EXPECT_FALSE(report.projectedSeconds().has_value());
    report.projection_keys = 50000;
    ASSERT_TRUE(report.projectedSeconds().has_value());
    EXPECT_DOUBLE_EQ(*report.projectedSeconds(), 500.0);
    EXPECT_DOUBLE_EQ(report.toJson()["projected_seconds"].asDouble(), 500.0);

    report.overall_duration_sec = 0.0;
    EXPECT_FALSE(report.projectedSeconds().has_value());
}

TEST_F(ReportTest, SaveJsonWritesIndentedFile) {
    const std::string path = ::testing::TempDir() + "geoload_report.json";
    Json::Value value;
    value["mode"] = "sequential";
    value["total_reads"] = 12;
    ASSERT_TRUE(saveJson(path, value).ok());

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    Json::CharReaderBuilder builder;
    Json::Value parsed;
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(builder, file, &parsed, &errors))
        << errors;
    EXPECT_EQ(parsed["total_reads"].asInt(), 12);
    std::remove(path.c_str());

    EXPECT_TRUE(saveJson("/nonexistent-dir/report.json", value)
                    .IsInvalidArgument());
}

TEST_F(ReportTest, TierNames) {
    EXPECT_STREQ(readTierToString(ReadTier::kPrimary), "primary");
    EXPECT_STREQ(readTierToString(ReadTier::kSecondary), "secondary");
    EXPECT_STREQ(readTierToString(ReadTier::kNone), "none");
}

}  // namespace geoload
