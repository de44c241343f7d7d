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

#ifndef GEOLOAD_BATCH_WRITER_H
#define GEOLOAD_BATCH_WRITER_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "geoload/common/cancellation.h"
#include "geoload/common/config.h"
#include "geoload/common/status.h"
#include "geoload/common/utils/random.h"
#include "geoload/common/utils/timer.h"
#include "geoload/record/record_source.h"
#include "geoload/report.h"
#include "geoload/store/store_client.h"

namespace geoload {

enum class BatchOutcome {
    kPipelined,  // the pipelined request succeeded
    kFallback,   // the request failed and every key was written on its own
};

const char* batchOutcomeToString(BatchOutcome outcome);

struct BatchWriteResult {
    BatchOutcome outcome = BatchOutcome::kPipelined;
    uint64_t attempted = 0;  // ids taken from the cursor
    uint64_t written = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;
    Status pipeline_status;  // set when outcome is kFallback
};

struct WriteCounts {
    uint64_t written = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;

    WriteCounts& operator+=(const WriteCounts& other) {
        written += other.written;
        skipped += other.skipped;
        failed += other.failed;
        return *this;
    }
};

// Live counters another thread may sample while the writer runs.
struct WriteProgress {
    std::atomic<uint64_t> written{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> failed{0};
};

struct BatchWriterOptions {
    std::string key_prefix = "ip";
    std::string version = "v23";
    uint64_t start_id = 0;
    uint64_t max_keys = 200000;  // the cursor never passes this id
    uint32_t batch_size = 50;
    uint32_t write_chunk = 100;
    int64_t ttl_seconds = 259200;
    double skip_probability = 0.0;
    uint32_t loop_pause_us = 1000;
    double progress_interval_sec = 5.0;
    std::optional<uint64_t> seed;  // skip simulation, clock-seeded if unset
    std::string label = "writer";

    static BatchWriterOptions fromConfig(const GeoloadConfig& config,
                                         const std::string& version);
};

// Writes consecutive key ids starting at options.start_id. Owned by a single
// thread; only the attached WriteProgress is safe to read concurrently.
class BatchWriter {
   public:
    BatchWriter(StoreClient& client, const RecordSource& source,
                BatchWriterOptions options,
                CancellationToken token = CancellationToken());

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    // Writes up to |count| ids in pipelined batches of |batch_size|. Stops
    // early at the key-space bound or on cancellation. Counts are added to
    // the writer totals and returned for this call only.
    WriteCounts write(uint64_t count, uint32_t batch_size);

    // Takes up to |max_ids| ids from the cursor and writes them as one
    // pipelined request, falling back to individual writes if the request
    // fails as a whole. Does not touch the writer totals.
    BatchWriteResult writeBatch(uint64_t max_ids);

    // Loops over write(write_chunk) until the target is written, the
    // duration has elapsed, the cursor reaches the bound or a stop is
    // requested. Logs a progress line every progress_interval_sec.
    WriteCounts runUntil(std::optional<uint64_t> target_keys,
                         std::optional<double> duration_sec);

    void attachProgress(WriteProgress* progress) { progress_ = progress; }

    uint64_t cursor() const { return cursor_; }

    bool exhausted() const { return cursor_ >= options_.max_keys; }

    bool interrupted() const { return interrupted_; }

    const WriteCounts& totals() const { return totals_; }

    uint64_t pipelinedBatches() const { return pipelined_batches_; }

    uint64_t fallbackBatches() const { return fallback_batches_; }

    double elapsedSeconds() const { return timer_.elapsed_seconds(); }

    const BatchWriterOptions& options() const { return options_; }

    void printFinalStats(std::ostream& os, double avg_payload_bytes) const;

   private:
    void publish(const WriteCounts& delta);

    BatchWriteResult writeIndividually(
        const std::vector<std::pair<std::string, const std::string*>>& entries,
        BatchWriteResult result);

   private:
    StoreClient& client_;
    const RecordSource& source_;
    BatchWriterOptions options_;
    CancellationToken token_;
    SimpleRandom rng_;

    uint64_t cursor_;
    WriteCounts totals_;
    uint64_t pipelined_batches_ = 0;
    uint64_t fallback_batches_ = 0;
    bool interrupted_ = false;
    WriteProgress* progress_ = nullptr;
    BenchTimer timer_;
};

}  // namespace geoload

#endif  // GEOLOAD_BATCH_WRITER_H
