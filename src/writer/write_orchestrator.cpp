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

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iomanip>
#include <thread>

#include "geoload/common/thread_pool.h"
#include "geoload/common/utils/timer.h"

namespace geoload {

WriteOrchestratorOptions WriteOrchestratorOptions::fromConfig(
    const GeoloadConfig& config) {
    WriteOrchestratorOptions options;
    options.num_workers = config.writer.num_writers;
    options.writer =
        BatchWriterOptions::fromConfig(config, config.key_space.primary_version);
    options.progress_interval_sec = config.writer.progress_interval_sec;
    options.version_pause_ms = config.writer.version_pause_ms;
    return options;
}

WriteOrchestrator::WriteOrchestrator(StoreFactory factory,
                                     std::shared_ptr<const RecordSource> source,
                                     WriteOrchestratorOptions options,
                                     CancellationToken token)
    : factory_(std::move(factory)),
      source_(std::move(source)),
      options_(std::move(options)),
      token_(std::move(token)) {}

WriteReport WriteOrchestrator::runWorker(const KeyRange& range,
                                         const std::string& version,
                                         WriteProgress* progress) const {
    WriteReport report;
    report.worker_id = range.worker_id;
    report.version = version;
    report.start_key = range.start_id;
    report.end_key = range.end_id;

    BenchTimer timer;
    std::unique_ptr<StoreClient> client;
    Status status = openClient(factory_, client);
    if (!status.ok()) {
        LOG(ERROR) << "Writer " << range.worker_id
                   << " cannot connect: " << status.ToString();
        report.error = status.ToString();
        report.duration_sec = timer.elapsed_seconds();
        return report;
    }

    BatchWriterOptions writer_options = options_.writer;
    writer_options.version = version;
    writer_options.start_id = range.start_id;
    writer_options.max_keys = range.end_id;
    writer_options.label = "writer " + std::to_string(range.worker_id);
    if (writer_options.seed) *writer_options.seed += range.worker_id;

    try {
        BatchWriter writer(*client, *source_, std::move(writer_options),
                           token_);
        writer.attachProgress(progress);
        WriteCounts counts = writer.runUntil(range.size(), std::nullopt);
        report.keys_written = counts.written;
        report.keys_skipped = counts.skipped;
        report.keys_failed = counts.failed;
        report.duration_sec = writer.elapsedSeconds();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Writer " << range.worker_id << " failed: " << e.what();
        report.error = e.what();
        report.duration_sec = timer.elapsed_seconds();
    }
    client->disconnect();

    LOG(INFO) << "Writer " << range.worker_id << " completed: "
              << report.keys_written << " keys in " << std::fixed
              << std::setprecision(1) << report.duration_sec << " s ("
              << static_cast<uint64_t>(report.rate()) << " keys/s)";
    return report;
}

Status WriteOrchestrator::runImport(const std::string& version,
                                    uint64_t target_keys,
                                    AggregateWriteReport& report) {
    std::vector<KeyRange> ranges;
    CHECK_STATUS(partition(target_keys, options_.num_workers, ranges));

    report = AggregateWriteReport();
    report.version = version;
    report.num_workers = static_cast<uint32_t>(ranges.size());
    report.target_keys = target_keys;
    report.avg_payload_bytes = source_->averagePayloadSize();

    LOG(INFO) << "Starting parallel import of " << version << ": "
              << target_keys << " keys across " << ranges.size()
              << " writers, " << ranges.front().size() << " keys per writer";

    BenchTimer timer;
    std::vector<WriteProgress> progress(ranges.size());
    std::vector<std::future<WriteReport>> futures;
    futures.reserve(ranges.size());
    {
        ThreadPool pool(ranges.size());
        for (size_t i = 0; i < ranges.size(); ++i) {
            WriteProgress* worker_progress = &progress[i];
            futures.push_back(pool.enqueue(
                [this, &version, range = ranges[i], worker_progress] {
                    return runWorker(range, version, worker_progress);
                }));
        }

        const auto interval = std::chrono::duration<double>(
            options_.progress_interval_sec > 0 ? options_.progress_interval_sec
                                               : 5.0);
        for (auto& future : futures) {
            while (future.wait_for(interval) != std::future_status::ready) {
                uint64_t written = 0, skipped = 0, failed = 0;
                for (const auto& p : progress) {
                    written += p.written.load(std::memory_order_relaxed);
                    skipped += p.skipped.load(std::memory_order_relaxed);
                    failed += p.failed.load(std::memory_order_relaxed);
                }
                double elapsed = timer.elapsed_seconds();
                LOG(INFO) << version << " progress: " << written << "/"
                          << target_keys << " written, " << skipped
                          << " skipped, " << failed << " failed | "
                          << static_cast<uint64_t>(
                                 elapsed > 0 ? written / elapsed : 0)
                          << " keys/s";
            }
        }
        pool.stop();
    }
    report.duration_sec = timer.elapsed_seconds();

    for (auto& future : futures) {
        report.add(future.get());
    }
    report.interrupted = token_.stopRequested();
    if (report.interrupted) {
        LOG(WARNING) << "Parallel import of " << version
                     << " interrupted, reporting partial results";
    }

    LOG(INFO) << "Parallel import of " << version << " done: "
              << report.total_written << " written, " << report.total_skipped
              << " skipped in " << std::fixed << std::setprecision(1)
              << report.duration_sec << " s ("
              << static_cast<uint64_t>(report.totalRate()) << " keys/s)";
    return Status::OK();
}

Status WriteOrchestrator::pauseBetweenVersions() const {
    const auto step = std::chrono::milliseconds(100);
    auto remaining = std::chrono::milliseconds(options_.version_pause_ms);
    while (remaining.count() > 0) {
        if (token_.stopRequested()) {
            return Status::Cancelled("stop requested during version pause");
        }
        auto slice = std::min(step, remaining);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return Status::OK();
}

Status WriteOrchestrator::runMultiVersionImport(
    const std::vector<std::string>& versions, uint64_t target_keys_each,
    std::optional<uint64_t> projection_keys, MultiVersionReport& report) {
    if (versions.empty()) {
        return Status::InvalidArgument("no versions to import" LOC_MARK);
    }

    report = MultiVersionReport();
    report.projection_keys = projection_keys;
    LOG(INFO) << "Starting import of " << versions.size() << " versions, "
              << target_keys_each << " keys each, "
              << target_keys_each * versions.size() << " keys in total";

    BenchTimer timer;
    for (size_t i = 0; i < versions.size(); ++i) {
        if (token_.stopRequested()) {
            LOG(WARNING) << "Stop requested, skipping " << versions.size() - i
                         << " remaining version(s)";
            break;
        }
        AggregateWriteReport version_report;
        CHECK_STATUS(runImport(versions[i], target_keys_each, version_report));
        report.total_written += version_report.total_written;
        report.total_skipped += version_report.total_skipped;
        report.versions.push_back(std::move(version_report));

        if (i + 1 < versions.size() && options_.version_pause_ms > 0) {
            LOG(INFO) << "Pausing " << options_.version_pause_ms
                      << " ms before the next version";
            Status pause = pauseBetweenVersions();
            if (pause.IsCancelled()) {
                LOG(WARNING) << pause.message() << ", skipping "
                             << versions.size() - i - 1
                             << " remaining version(s)";
                break;
            }
        }
    }
    report.overall_duration_sec = timer.elapsed_seconds();
    report.interrupted = token_.stopRequested();

    LOG(INFO) << "Multi-version import done: " << report.total_written
              << " keys in " << std::fixed << std::setprecision(1)
              << report.overall_duration_sec << " s ("
              << static_cast<uint64_t>(report.combinedRate()) << " keys/s)";
    return Status::OK();
}

}  // namespace geoload
