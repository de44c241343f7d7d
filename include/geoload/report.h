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

#ifndef GEOLOAD_REPORT_H
#define GEOLOAD_REPORT_H

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "geoload/common/status.h"

namespace geoload {

struct WriteReport {
    uint32_t worker_id = 0;
    std::string version;
    uint64_t start_key = 0;
    uint64_t end_key = 0;
    uint64_t keys_written = 0;
    uint64_t keys_skipped = 0;
    uint64_t keys_failed = 0;
    double duration_sec = 0.0;
    std::string error;  // empty when the worker ran

    double rate() const {
        return duration_sec > 0 ? keys_written / duration_sec : 0.0;
    }

    Json::Value toJson() const;
};

// Result of one partitioned import. duration_sec is the wall-clock span of
// the whole parallel phase, never the sum of per-worker durations.
struct AggregateWriteReport {
    std::string version;
    uint32_t num_workers = 0;
    uint64_t target_keys = 0;
    uint64_t total_written = 0;
    uint64_t total_skipped = 0;
    uint64_t total_failed = 0;
    double duration_sec = 0.0;
    double avg_payload_bytes = 0.0;
    bool interrupted = false;
    std::vector<WriteReport> workers;

    void add(const WriteReport& worker);

    double totalRate() const {
        return duration_sec > 0 ? total_written / duration_sec : 0.0;
    }

    double megabytesWritten() const {
        return total_written * avg_payload_bytes / (1024.0 * 1024.0);
    }

    Json::Value toJson() const;

    void print(std::ostream& os) const;
};

struct MultiVersionReport {
    std::vector<AggregateWriteReport> versions;
    uint64_t total_written = 0;
    uint64_t total_skipped = 0;
    double overall_duration_sec = 0.0;
    bool interrupted = false;
    std::optional<uint64_t> projection_keys;

    double combinedRate() const {
        return overall_duration_sec > 0 ? total_written / overall_duration_sec
                                        : 0.0;
    }

    // Linear estimate of the time needed to write |projection_keys| at the
    // combined rate. Empty without a projection target or a positive rate.
    std::optional<double> projectedSeconds() const;

    Json::Value toJson() const;

    void print(std::ostream& os) const;
};

enum class ReadTier { kNone = 0, kPrimary = 1, kSecondary = 2 };

const char* readTierToString(ReadTier tier);

struct ReadResult {
    uint64_t key_id = 0;
    ReadTier tier = ReadTier::kNone;
    size_t value_size = 0;
    double latency_sec = 0.0;
    bool success = false;
};

struct LatencyStats {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double p50 = 0.0;
    double p95 = 0.0;

    static LatencyStats compute(std::vector<double> samples);

    // Linear interpolation between the closest ranks of |sorted|, p in
    // [0, 100].
    static double percentile(const std::vector<double>& sorted, double p);
};

// Counters for one read run or one worker's share of it. Latency samples
// are kept for successful reads only.
struct ReadStatistics {
    std::string mode;
    uint64_t total_reads = 0;
    uint64_t successful_reads = 0;
    uint64_t cache_misses = 0;
    uint64_t primary_hits = 0;
    uint64_t secondary_hits = 0;
    uint64_t total_bytes = 0;
    double duration_sec = 0.0;
    bool interrupted = false;
    std::vector<double> latencies_sec;

    void record(const ReadResult& result);

    // Adds counters and samples of |other|; duration is left to the caller.
    void merge(const ReadStatistics& other);

    LatencyStats latency() const { return LatencyStats::compute(latencies_sec); }

    double hitRate() const;
    double readsPerSecond() const;
    double megabytesPerSecond() const;

    Json::Value toJson() const;

    void print(std::ostream& os) const;
};

// Writes |value| as indented JSON to |path|, replacing the file.
Status saveJson(const std::string& path, const Json::Value& value);

}  // namespace geoload

#endif  // GEOLOAD_REPORT_H
