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

#include "geoload/reader/read_benchmark.h"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <limits>

#include "geoload/common/thread_pool.h"
#include "geoload/common/utils/random.h"
#include "geoload/common/utils/timer.h"
#include "geoload/key_space.h"

namespace geoload {

ReadBenchmarkOptions ReadBenchmarkOptions::fromConfig(
    const GeoloadConfig& config) {
    ReadBenchmarkOptions options;
    options.key_prefix = config.key_space.key_prefix;
    options.max_keys = config.key_space.max_keys;
    options.primary_version = config.key_space.primary_version;
    options.secondary_version = config.key_space.secondary_version;
    options.num_threads = config.reader.num_readers;
    options.batch_size = config.reader.batch_size;
    options.progress_interval_sec = config.reader.progress_interval_sec;
    return options;
}

ReadBenchmark::ReadBenchmark(StoreFactory factory, ReadBenchmarkOptions options,
                             CancellationToken token)
    : factory_(std::move(factory)),
      options_(std::move(options)),
      token_(std::move(token)) {
    if (options_.num_threads == 0) options_.num_threads = 1;
    if (options_.batch_size == 0) options_.batch_size = 1;
    if (options_.max_keys == 0) options_.max_keys = 1;
    if (options_.progress_interval_sec <= 0) {
        options_.progress_interval_sec = 5.0;
    }
}

uint64_t ReadBenchmark::baseSeed() const {
    return options_.seed ? *options_.seed
                         : SimpleRandom::Get().next(
                               std::numeric_limits<uint64_t>::max());
}

std::vector<uint64_t> ReadBenchmark::generateKeyIds(uint64_t count) const {
    SimpleRandom rng(baseSeed());
    std::vector<uint64_t> ids;
    ids.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        ids.push_back(rng.next(options_.max_keys));
    }
    return ids;
}

ReadResult ReadBenchmark::readWithFallback(StoreClient& client,
                                           uint64_t key_id) const {
    BenchTimer timer;
    ReadResult result;
    result.key_id = key_id;

    std::string value;
    const std::string primary_key =
        makeStoreKey(options_.key_prefix, options_.primary_version, key_id);
    Status status = client.get(primary_key, value);
    if (status.ok() && !value.empty()) {
        result.tier = ReadTier::kPrimary;
    } else {
        if (!status.ok() && !status.IsNotFound()) {
            VLOG(1) << "Primary lookup of " << primary_key
                    << " failed: " << status.ToString();
        }
        value.clear();
        const std::string secondary_key = makeStoreKey(
            options_.key_prefix, options_.secondary_version, key_id);
        status = client.get(secondary_key, value);
        if (status.ok() && !value.empty()) {
            result.tier = ReadTier::kSecondary;
        } else if (!status.ok() && !status.IsNotFound()) {
            VLOG(1) << "Secondary lookup of " << secondary_key
                    << " failed: " << status.ToString();
        }
    }

    result.success = result.tier != ReadTier::kNone;
    result.value_size = result.success ? value.size() : 0;
    result.latency_sec = timer.elapsed_seconds();
    return result;
}

std::vector<ReadResult> ReadBenchmark::readBatchPipelined(
    StoreClient& client, const std::vector<uint64_t>& key_ids) const {
    std::vector<ReadResult> results;
    if (key_ids.empty()) return results;
    results.reserve(key_ids.size());

    BenchTimer timer;
    Pipeline pipeline;
    for (uint64_t key_id : key_ids) {
        pipeline.get(
            makeStoreKey(options_.key_prefix, options_.primary_version, key_id));
        pipeline.get(makeStoreKey(options_.key_prefix,
                                  options_.secondary_version, key_id));
    }

    std::vector<StoreReply> replies;
    Status status = client.execute(pipeline, replies);
    if (!status.ok() || replies.size() != pipeline.size()) {
        LOG(WARNING) << "Pipelined read of " << key_ids.size()
                     << " keys failed, reading them individually: "
                     << (status.ok() ? "reply count mismatch"
                                     : status.ToString());
        for (uint64_t key_id : key_ids) {
            results.push_back(readWithFallback(client, key_id));
        }
        return results;
    }

    // Replies arrive as (primary, secondary) pairs in request order.
    for (size_t i = 0; i < key_ids.size(); ++i) {
        const StoreReply& primary = replies[2 * i];
        const StoreReply& secondary = replies[2 * i + 1];
        ReadResult result;
        result.key_id = key_ids[i];
        if (primary.type == StoreReply::Type::kString && !primary.str.empty()) {
            result.tier = ReadTier::kPrimary;
            result.value_size = primary.str.size();
        } else if (secondary.type == StoreReply::Type::kString &&
                   !secondary.str.empty()) {
            result.tier = ReadTier::kSecondary;
            result.value_size = secondary.str.size();
        }
        result.success = result.tier != ReadTier::kNone;
        result.latency_sec = timer.elapsed_seconds();
        results.push_back(result);
    }
    return results;
}

void ReadBenchmark::logProgress(const std::string& mode, uint64_t completed,
                                uint64_t total, double elapsed_sec) const {
    LOG(INFO) << mode << " progress: " << completed << "/" << total << " ("
              << std::fixed << std::setprecision(1)
              << (total ? 100.0 * completed / total : 0.0) << "%) | "
              << static_cast<uint64_t>(
                     elapsed_sec > 0 ? completed / elapsed_sec : 0)
              << " reads/s";
}

Status ReadBenchmark::openClients(
    size_t count, std::vector<std::unique_ptr<StoreClient>>& clients) const {
    clients.clear();
    clients.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::unique_ptr<StoreClient> client;
        CHECK_STATUS(openClient(factory_, client));
        clients.push_back(std::move(client));
    }
    return Status::OK();
}

ReadStatistics ReadBenchmark::sequentialWorker(
    StoreClient& client, uint64_t num_reads, uint64_t seed,
    std::atomic<uint64_t>* completed) const {
    SimpleRandom rng(seed);
    ReadStatistics stats;
    for (uint64_t i = 0; i < num_reads; ++i) {
        if (token_.stopRequested()) {
            stats.interrupted = true;
            break;
        }
        stats.record(readWithFallback(client, rng.next(options_.max_keys)));
        completed->fetch_add(1, std::memory_order_relaxed);
    }
    return stats;
}

ReadStatistics ReadBenchmark::pipelinedWorker(
    StoreClient& client, const std::vector<uint64_t>& key_ids,
    std::atomic<uint64_t>* completed) const {
    ReadStatistics stats;
    std::vector<uint64_t> batch;
    batch.reserve(options_.batch_size);
    for (size_t offset = 0; offset < key_ids.size();
         offset += options_.batch_size) {
        if (token_.stopRequested()) {
            stats.interrupted = true;
            break;
        }
        size_t end = std::min(key_ids.size(), offset + options_.batch_size);
        batch.assign(key_ids.begin() + offset, key_ids.begin() + end);
        for (const auto& result : readBatchPipelined(client, batch)) {
            stats.record(result);
        }
        completed->fetch_add(batch.size(), std::memory_order_relaxed);
    }
    return stats;
}

Status ReadBenchmark::runSequential(uint64_t total_reads,
                                    ReadStatistics& stats) {
    const uint32_t num_threads = options_.num_threads;
    std::vector<std::unique_ptr<StoreClient>> clients;
    CHECK_STATUS(openClients(num_threads, clients));

    LOG(INFO) << "Sequential read benchmark: " << total_reads << " reads on "
              << num_threads << " threads, versions "
              << options_.primary_version << " -> "
              << options_.secondary_version;

    stats = ReadStatistics();
    stats.mode = "sequential";
    const uint64_t per_thread = total_reads / num_threads;
    const uint64_t remainder = total_reads % num_threads;
    const uint64_t seed = baseSeed();
    std::atomic<uint64_t> completed{0};

    BenchTimer timer;
    std::vector<std::future<ReadStatistics>> futures;
    {
        ThreadPool pool(num_threads);
        for (uint32_t i = 0; i < num_threads; ++i) {
            uint64_t num_reads = per_thread + (i < remainder ? 1 : 0);
            StoreClient* client = clients[i].get();
            futures.push_back(pool.enqueue(
                [this, client, num_reads, seed, i, &completed] {
                    return sequentialWorker(*client, num_reads, seed + i,
                                            &completed);
                }));
        }
        const auto interval =
            std::chrono::duration<double>(options_.progress_interval_sec);
        for (auto& future : futures) {
            while (future.wait_for(interval) != std::future_status::ready) {
                logProgress(stats.mode, completed.load(), total_reads,
                            timer.elapsed_seconds());
            }
        }
        pool.stop();
    }
    for (auto& future : futures) stats.merge(future.get());
    stats.duration_sec = timer.elapsed_seconds();
    stats.interrupted = stats.interrupted || token_.stopRequested();

    for (auto& client : clients) client->disconnect();
    return Status::OK();
}

Status ReadBenchmark::runPipelined(uint64_t total_reads,
                                   ReadStatistics& stats) {
    return runPipelinedOnIds(generateKeyIds(total_reads), stats);
}

Status ReadBenchmark::runPipelinedOnIds(const std::vector<uint64_t>& key_ids,
                                        ReadStatistics& stats) {
    std::unique_ptr<StoreClient> client;
    CHECK_STATUS(openClient(factory_, client));

    LOG(INFO) << "Pipelined read benchmark: " << key_ids.size()
              << " reads in batches of " << options_.batch_size;

    stats = ReadStatistics();
    stats.mode = "pipeline";
    BenchTimer timer;
    BenchTimer report_timer;
    std::vector<uint64_t> batch;
    batch.reserve(options_.batch_size);
    for (size_t offset = 0; offset < key_ids.size();
         offset += options_.batch_size) {
        if (token_.stopRequested()) {
            stats.interrupted = true;
            break;
        }
        size_t end = std::min(key_ids.size(), offset + options_.batch_size);
        batch.assign(key_ids.begin() + offset, key_ids.begin() + end);
        for (const auto& result : readBatchPipelined(*client, batch)) {
            stats.record(result);
        }
        if (report_timer.elapsed_seconds() >= options_.progress_interval_sec) {
            logProgress(stats.mode, stats.total_reads, key_ids.size(),
                        timer.elapsed_seconds());
            report_timer.reset();
        }
    }
    stats.duration_sec = timer.elapsed_seconds();
    client->disconnect();
    return Status::OK();
}

Status ReadBenchmark::runMultiThreadedPipelined(uint64_t total_reads,
                                                ReadStatistics& stats) {
    auto slices = sliceEvenly(generateKeyIds(total_reads), options_.num_threads);
    std::vector<std::unique_ptr<StoreClient>> clients;
    CHECK_STATUS(openClients(slices.size(), clients));

    LOG(INFO) << "Multi-threaded pipelined read benchmark: " << total_reads
              << " reads on " << slices.size() << " threads in batches of "
              << options_.batch_size;

    stats = ReadStatistics();
    stats.mode = "mt_pipeline";
    std::atomic<uint64_t> completed{0};

    BenchTimer timer;
    std::vector<std::future<ReadStatistics>> futures;
    if (!slices.empty()) {
        ThreadPool pool(slices.size());
        for (size_t i = 0; i < slices.size(); ++i) {
            StoreClient* client = clients[i].get();
            const std::vector<uint64_t>* slice = &slices[i];
            futures.push_back(pool.enqueue([this, client, slice, &completed] {
                return pipelinedWorker(*client, *slice, &completed);
            }));
        }
        const auto interval =
            std::chrono::duration<double>(options_.progress_interval_sec);
        for (auto& future : futures) {
            while (future.wait_for(interval) != std::future_status::ready) {
                logProgress(stats.mode, completed.load(), total_reads,
                            timer.elapsed_seconds());
            }
        }
        pool.stop();
    }
    for (auto& future : futures) stats.merge(future.get());
    stats.duration_sec = timer.elapsed_seconds();
    stats.interrupted = stats.interrupted || token_.stopRequested();

    for (auto& client : clients) client->disconnect();
    return Status::OK();
}

}  // namespace geoload
