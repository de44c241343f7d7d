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

#include "geoload/writer/write_orchestrator.h"

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <memory>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "geoload/key_space.h"
#include "memory_store.h"

namespace geoload {

class WriteOrchestratorTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("WriteOrchestratorTest");
        FLAGS_logtostderr = 1;
        store_ = std::make_shared<MemoryStore>();
        source_ = std::make_shared<SyntheticRecordSource>(10);
        options_.num_workers = 4;
        options_.writer.batch_size = 50;
        options_.writer.write_chunk = 100;
        options_.writer.ttl_seconds = 3600;
        options_.writer.loop_pause_us = 0;
        options_.writer.seed = 11;
        options_.progress_interval_sec = 0.05;
        options_.version_pause_ms = 0;
    }

    void TearDown() override { google::ShutdownGoogleLogging(); }

    WriteOrchestrator makeOrchestrator(
        CancellationToken token = CancellationToken()) {
        return WriteOrchestrator(makeMemoryStoreFactory(store_), source_,
                                 options_, token);
    }

    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<SyntheticRecordSource> source_;
    WriteOrchestratorOptions options_;
};

TEST_F(WriteOrchestratorTest, ImportCoversEveryKeyOnce) {
    auto orchestrator = makeOrchestrator();
    AggregateWriteReport report;
    ASSERT_TRUE(orchestrator.runImport("v5", 1000, report).ok());

    EXPECT_EQ(report.version, "v5");
    EXPECT_EQ(report.num_workers, 4u);
    EXPECT_EQ(report.total_written, 1000u);
    EXPECT_EQ(report.total_skipped, 0u);
    EXPECT_EQ(report.total_failed, 0u);
    EXPECT_FALSE(report.interrupted);
    ASSERT_EQ(report.workers.size(), 4u);
    for (uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(report.workers[i].worker_id, i);
        EXPECT_EQ(report.workers[i].start_key, i * 250u);
        EXPECT_EQ(report.workers[i].end_key, (i + 1) * 250u);
        EXPECT_EQ(report.workers[i].keys_written, 250u);
        EXPECT_TRUE(report.workers[i].error.empty());
    }

    EXPECT_EQ(store_->size(), 1000u);
    EXPECT_EQ(store_->keys("ip:v5:*").size(), 1000u);
    MemoryStore::Entry entry;
    ASSERT_TRUE(store_->lookup("ip:v5:999", entry));
    EXPECT_EQ(entry.ttl_seconds, 3600);
    EXPECT_EQ(store_->connections.load(), 4u);
}

TEST_F(WriteOrchestratorTest, LastWorkerAbsorbsRemainder) {
    options_.num_workers = 3;
    auto orchestrator = makeOrchestrator();
    AggregateWriteReport report;
    ASSERT_TRUE(orchestrator.runImport("v1", 1001, report).ok());
    ASSERT_EQ(report.workers.size(), 3u);
    EXPECT_EQ(report.workers[0].keys_written, 333u);
    EXPECT_EQ(report.workers[1].keys_written, 333u);
    EXPECT_EQ(report.workers[2].keys_written, 335u);
    EXPECT_EQ(report.workers[2].end_key, 1001u);
    EXPECT_EQ(store_->size(), 1001u);
}

TEST_F(WriteOrchestratorTest, RejectsUnpartitionableKeySpace) {
    auto orchestrator = makeOrchestrator();
    AggregateWriteReport report;
    EXPECT_TRUE(orchestrator.runImport("v1", 3, report).IsInvalidArgument());
    options_.num_workers = 0;
    auto no_workers = makeOrchestrator();
    EXPECT_TRUE(no_workers.runImport("v1", 100, report).IsInvalidArgument());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(WriteOrchestratorTest, ConnectionFailureIsReportedPerWorker) {
    store_->refuse_connections = true;
    auto orchestrator = makeOrchestrator();
    AggregateWriteReport report;
    ASSERT_TRUE(orchestrator.runImport("v1", 400, report).ok());
    EXPECT_EQ(report.total_written, 0u);
    ASSERT_EQ(report.workers.size(), 4u);
    for (const auto& worker : report.workers) {
        EXPECT_EQ(worker.keys_written, 0u);
        EXPECT_FALSE(worker.error.empty());
    }
}

TEST_F(WriteOrchestratorTest, PipelineFailuresStillWriteEveryKey) {
    store_->fail_pipelines = true;
    auto orchestrator = makeOrchestrator();
    AggregateWriteReport report;
    ASSERT_TRUE(orchestrator.runImport("v2", 200, report).ok());
    EXPECT_EQ(report.total_written, 200u);
    EXPECT_EQ(store_->size(), 200u);
}

TEST_F(WriteOrchestratorTest, MultiVersionImport) {
    auto orchestrator = makeOrchestrator();
    MultiVersionReport report;
    ASSERT_TRUE(orchestrator
                    .runMultiVersionImport({"v20", "v21", "v22"}, 400,
                                           uint64_t{1000000}, report)
                    .ok());
    ASSERT_EQ(report.versions.size(), 3u);
    EXPECT_EQ(report.versions[1].version, "v21");
    EXPECT_EQ(report.total_written, 1200u);
    EXPECT_EQ(store_->size(), 1200u);
    EXPECT_EQ(store_->keys("ip:v22:*").size(), 400u);
    EXPECT_FALSE(report.interrupted);

    auto projected = report.projectedSeconds();
    ASSERT_TRUE(projected.has_value());
    EXPECT_NEAR(*projected, 1000000.0 / report.combinedRate(), 1e-6);
}

TEST_F(WriteOrchestratorTest, MultiVersionRequiresVersions) {
    auto orchestrator = makeOrchestrator();
    MultiVersionReport report;
    EXPECT_TRUE(orchestrator.runMultiVersionImport({}, 100, std::nullopt, report)
                    .IsInvalidArgument());
}

TEST_F(WriteOrchestratorTest, StopRequestSkipsRemainingVersions) {
    CancellationSource cancellation;
    cancellation.requestStop();
    auto orchestrator = makeOrchestrator(cancellation.token());
    MultiVersionReport report;
    ASSERT_TRUE(orchestrator
                    .runMultiVersionImport({"v1", "v2"}, 400, std::nullopt,
                                           report)
                    .ok());
    EXPECT_TRUE(report.versions.empty());
    EXPECT_EQ(report.total_written, 0u);
    EXPECT_TRUE(report.interrupted);
    EXPECT_FALSE(report.projectedSeconds().has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(WriteOrchestratorTest, StopDuringVersionPauseSkipsNextVersion) {
    options_.version_pause_ms = 5000;
    CancellationSource cancellation;
    auto orchestrator = makeOrchestrator(cancellation.token());

    std::thread stopper([this, &cancellation] {
        while (store_->keys("ip:v1:*").size() < 400) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        cancellation.requestStop();
    });
    MultiVersionReport report;
    Status s =
        orchestrator.runMultiVersionImport({"v1", "v2"}, 400, std::nullopt,
                                           report);
    stopper.join();

    ASSERT_TRUE(s.ok()) << s.ToString();
    ASSERT_EQ(report.versions.size(), 1u);
    EXPECT_EQ(report.total_written, 400u);
    EXPECT_TRUE(report.interrupted);
    EXPECT_TRUE(store_->keys("ip:v2:*").empty());
    EXPECT_LT(report.overall_duration_sec, 4.0);
}

TEST_F(WriteOrchestratorTest, StoppedImportReportsPartialResults) {
    CancellationSource cancellation;
    cancellation.requestStop();
    auto orchestrator = makeOrchestrator(cancellation.token());
    AggregateWriteReport report;
    ASSERT_TRUE(orchestrator.runImport("v1", 400, report).ok());
    EXPECT_TRUE(report.interrupted);
    EXPECT_EQ(report.total_written, 0u);
    EXPECT_EQ(report.workers.size(), 4u);
}

}  // namespace geoload
