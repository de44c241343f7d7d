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

#ifndef GEOLOAD_READ_BENCHMARK_H
#define GEOLOAD_READ_BENCHMARK_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geoload/common/cancellation.h"
#include "geoload/common/config.h"
#include "geoload/common/status.h"
#include "geoload/report.h"
#include "geoload/store/store_client.h"

namespace geoload {

struct ReadBenchmarkOptions {
    std::string key_prefix = "ip";
    uint64_t max_keys = 200000;
    std::string primary_version = "v23";
    std::string secondary_version = "v22";
    uint32_t num_threads = 4;
    uint32_t batch_size = 100;
    double progress_interval_sec = 5.0;
    std::optional<uint64_t> seed;  // random ids are clock-seeded if unset

    static ReadBenchmarkOptions fromConfig(const GeoloadConfig& config);
};

// Resolves random key ids through the primary version and then the
// secondary one. All run* methods fill the same ReadStatistics shape and
// return an error only when a store client cannot be opened; partial
// results after a stop request are still reported.
class ReadBenchmark {
   public:
    ReadBenchmark(StoreFactory factory, ReadBenchmarkOptions options,
                  CancellationToken token = CancellationToken());

    // Primary GET, then secondary GET when the primary value is absent,
    // empty or the lookup failed.
    ReadResult readWithFallback(StoreClient& client, uint64_t key_id) const;

    // One pipelined request with a primary and a secondary GET per id.
    // Falls back to readWithFallback for every id of the batch if the
    // request fails.
    std::vector<ReadResult> readBatchPipelined(
        StoreClient& client, const std::vector<uint64_t>& key_ids) const;

    // |total_reads| individual lookups spread over num_threads threads;
    // thread i performs total / n reads, plus one if i < total % n.
    Status runSequential(uint64_t total_reads, ReadStatistics& stats);

    // Pre-generated ids read in pipelined batches on the calling thread.
    Status runPipelined(uint64_t total_reads, ReadStatistics& stats);

    // Pre-generated ids split into contiguous slices, one pipelined reader
    // per slice.
    Status runMultiThreadedPipelined(uint64_t total_reads,
                                     ReadStatistics& stats);

    // runPipelined over a caller-supplied id sequence.
    Status runPipelinedOnIds(const std::vector<uint64_t>& key_ids,
                             ReadStatistics& stats);

    std::vector<uint64_t> generateKeyIds(uint64_t count) const;

    const ReadBenchmarkOptions& options() const { return options_; }

   private:
    ReadStatistics sequentialWorker(StoreClient& client, uint64_t num_reads,
                                    uint64_t seed,
                                    std::atomic<uint64_t>* completed) const;

    ReadStatistics pipelinedWorker(StoreClient& client,
                                   const std::vector<uint64_t>& key_ids,
                                   std::atomic<uint64_t>* completed) const;

    Status openClients(size_t count,
                       std::vector<std::unique_ptr<StoreClient>>& clients) const;

    uint64_t baseSeed() const;

    void logProgress(const std::string& mode, uint64_t completed,
                     uint64_t total, double elapsed_sec) const;

   private:
    StoreFactory factory_;
    ReadBenchmarkOptions options_;
    CancellationToken token_;
};

}  // namespace geoload

#endif  // GEOLOAD_READ_BENCHMARK_H
