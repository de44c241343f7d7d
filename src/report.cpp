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

#include <glog/logging.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>

namespace geoload {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

double percentOf(uint64_t part, uint64_t whole) {
    return whole > 0 ? 100.0 * part / whole : 0.0;
}

}  // namespace

Json::Value WriteReport::toJson() const {
    Json::Value out;
    out["writer_id"] = worker_id;
    out["version"] = version;
    out["start_key"] = Json::UInt64(start_key);
    out["end_key"] = Json::UInt64(end_key);
    out["keys_written"] = Json::UInt64(keys_written);
    out["keys_skipped"] = Json::UInt64(keys_skipped);
    out["keys_failed"] = Json::UInt64(keys_failed);
    out["duration"] = duration_sec;
    out["rate"] = rate();
    if (!error.empty()) out["error"] = error;
    return out;
}

void AggregateWriteReport::add(const WriteReport& worker) {
    total_written += worker.keys_written;
    total_skipped += worker.keys_skipped;
    total_failed += worker.keys_failed;
    workers.push_back(worker);
}

Json::Value AggregateWriteReport::toJson() const {
    Json::Value out;
    out["version"] = version;
    out["num_writers"] = num_workers;
    out["target_keys"] = Json::UInt64(target_keys);
    out["total_keys_written"] = Json::UInt64(total_written);
    out["total_keys_skipped"] = Json::UInt64(total_skipped);
    out["total_keys_failed"] = Json::UInt64(total_failed);
    out["total_duration"] = duration_sec;
    out["total_rate"] = totalRate();
    out["data_written_mb"] = megabytesWritten();
    out["interrupted"] = interrupted;
    Json::Value list(Json::arrayValue);
    for (const auto& worker : workers) list.append(worker.toJson());
    out["writer_stats"] = list;
    return out;
}

void AggregateWriteReport::print(std::ostream& os) const {
    // clang-format off
    os << "\nImport results for version " << version
       << (interrupted ? " (interrupted)" : "") << "\n";
    os << std::left
       << std::setw(8) << "Writer"
       << std::setw(24) << "Range"
       << std::setw(12) << "Written"
       << std::setw(10) << "Skipped"
       << std::setw(10) << "Failed"
       << std::setw(12) << "Time (s)"
       << std::setw(12) << "Keys/s"
       << "\n";
    os << std::string(88, '-') << "\n";
    for (const auto& w : workers) {
        std::string range = "[" + std::to_string(w.start_key) + ", " +
                            std::to_string(w.end_key) + ")";
        os << std::left << std::fixed << std::setprecision(1)
           << std::setw(8) << w.worker_id
           << std::setw(24) << range
           << std::setw(12) << w.keys_written
           << std::setw(10) << w.keys_skipped
           << std::setw(10) << w.keys_failed
           << std::setw(12) << w.duration_sec
           << std::setw(12) << w.rate();
        if (!w.error.empty()) os << w.error;
        os << "\n";
    }
    os << std::string(88, '-') << "\n";
    os << std::fixed << std::setprecision(2)
       << "Total written: " << total_written << " / " << target_keys << "\n"
       << "Total skipped: " << total_skipped << "\n"
       << "Total failed:  " << total_failed << "\n"
       << "Wall time:     " << duration_sec << " s\n"
       << "Rate:          " << totalRate() << " keys/s\n"
       << "Data:          " << megabytesWritten() << " MB\n";
    // clang-format on
}

std::optional<double> MultiVersionReport::projectedSeconds() const {
    double rate = combinedRate();
    if (!projection_keys || rate <= 0) return std::nullopt;
    return static_cast<double>(*projection_keys) / rate;
}

Json::Value MultiVersionReport::toJson() const {
    Json::Value out;
    Json::Value list(Json::arrayValue);
    for (const auto& report : versions) list.append(report.toJson());
    out["versions"] = list;
    out["total_keys_written"] = Json::UInt64(total_written);
    out["total_keys_skipped"] = Json::UInt64(total_skipped);
    out["overall_duration"] = overall_duration_sec;
    out["combined_rate"] = combinedRate();
    out["interrupted"] = interrupted;
    if (auto seconds = projectedSeconds()) {
        out["projection_keys"] = Json::UInt64(*projection_keys);
        out["projected_seconds"] = *seconds;
    }
    return out;
}

void MultiVersionReport::print(std::ostream& os) const {
    for (const auto& report : versions) report.print(os);
    os << std::fixed << std::setprecision(2)
       << "\nAll versions" << (interrupted ? " (interrupted)" : "") << "\n"
       << "Total written: " << total_written << "\n"
       << "Total skipped: " << total_skipped << "\n"
       << "Overall time:  " << overall_duration_sec << " s\n"
       << "Combined rate: " << combinedRate() << " keys/s\n";
    if (auto seconds = projectedSeconds()) {
        os << "Projection:    " << *projection_keys << " keys in "
           << *seconds / 60.0 << " min (" << *seconds / 3600.0 << " h)\n";
    }
}

const char* readTierToString(ReadTier tier) {
    switch (tier) {
        case ReadTier::kPrimary:
            return "primary";
        case ReadTier::kSecondary:
            return "secondary";
        default:
            return "none";
    }
}

double LatencyStats::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    if (p <= 0) return sorted.front();
    if (p >= 100) return sorted.back();
    double rank = (p / 100.0) * (sorted.size() - 1);
    size_t idx = static_cast<size_t>(rank);
    double frac = rank - idx;
    if (idx + 1 < sorted.size()) {
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    }
    return sorted[idx];
}

LatencyStats LatencyStats::compute(std::vector<double> samples) {
    LatencyStats stats;
    if (samples.empty()) return stats;
    std::sort(samples.begin(), samples.end());
    double sum = 0.0;
    for (double v : samples) sum += v;
    stats.min = samples.front();
    stats.max = samples.back();
    stats.avg = sum / samples.size();
    stats.p50 = percentile(samples, 50);
    stats.p95 = percentile(samples, 95);
    return stats;
}

void ReadStatistics::record(const ReadResult& result) {
    ++total_reads;
    if (!result.success) {
        ++cache_misses;
        return;
    }
    ++successful_reads;
    total_bytes += result.value_size;
    latencies_sec.push_back(result.latency_sec);
    if (result.tier == ReadTier::kPrimary) {
        ++primary_hits;
    } else {
        ++secondary_hits;
    }
}

void ReadStatistics::merge(const ReadStatistics& other) {
    total_reads += other.total_reads;
    successful_reads += other.successful_reads;
    cache_misses += other.cache_misses;
    primary_hits += other.primary_hits;
    secondary_hits += other.secondary_hits;
    total_bytes += other.total_bytes;
    interrupted = interrupted || other.interrupted;
    latencies_sec.insert(latencies_sec.end(), other.latencies_sec.begin(),
                         other.latencies_sec.end());
}

double ReadStatistics::hitRate() const {
    return percentOf(successful_reads, total_reads);
}

double ReadStatistics::readsPerSecond() const {
    return duration_sec > 0 ? total_reads / duration_sec : 0.0;
}

double ReadStatistics::megabytesPerSecond() const {
    return duration_sec > 0 ? total_bytes / kMiB / duration_sec : 0.0;
}

Json::Value ReadStatistics::toJson() const {
    LatencyStats lat = latency();
    Json::Value out;
    out["mode"] = mode;
    out["total_reads"] = Json::UInt64(total_reads);
    out["successful_reads"] = Json::UInt64(successful_reads);
    out["cache_misses"] = Json::UInt64(cache_misses);
    out["primary_hits"] = Json::UInt64(primary_hits);
    out["secondary_hits"] = Json::UInt64(secondary_hits);
    out["total_bytes"] = Json::UInt64(total_bytes);
    out["duration"] = duration_sec;
    out["hit_rate"] = hitRate();
    out["reads_per_second"] = readsPerSecond();
    out["mb_per_second"] = megabytesPerSecond();
    out["interrupted"] = interrupted;
    Json::Value latency_ms;
    latency_ms["min"] = lat.min * 1000.0;
    latency_ms["max"] = lat.max * 1000.0;
    latency_ms["avg"] = lat.avg * 1000.0;
    latency_ms["p50"] = lat.p50 * 1000.0;
    latency_ms["p95"] = lat.p95 * 1000.0;
    out["latency_ms"] = latency_ms;
    return out;
}

void ReadStatistics::print(std::ostream& os) const {
    LatencyStats lat = latency();
    // clang-format off
    os << std::fixed << std::setprecision(2)
       << "\nRead benchmark (" << mode << ")"
       << (interrupted ? " (interrupted)" : "") << "\n"
       << std::string(48, '-') << "\n"
       << std::left
       << std::setw(22) << "Total reads" << total_reads << "\n"
       << std::setw(22) << "Successful" << successful_reads
       << " (" << hitRate() << "%)\n"
       << std::setw(22) << "Cache misses" << cache_misses
       << " (" << percentOf(cache_misses, total_reads) << "%)\n"
       << std::setw(22) << "Primary hits" << primary_hits
       << " (" << percentOf(primary_hits, successful_reads) << "%)\n"
       << std::setw(22) << "Secondary hits" << secondary_hits
       << " (" << percentOf(secondary_hits, successful_reads) << "%)\n"
       << std::setw(22) << "Duration (s)" << duration_sec << "\n"
       << std::setw(22) << "Reads/s" << readsPerSecond() << "\n"
       << std::setw(22) << "Throughput (MB/s)" << megabytesPerSecond() << "\n"
       << std::setprecision(3)
       << std::setw(22) << "Latency min (ms)" << lat.min * 1000.0 << "\n"
       << std::setw(22) << "Latency avg (ms)" << lat.avg * 1000.0 << "\n"
       << std::setw(22) << "Latency p50 (ms)" << lat.p50 * 1000.0 << "\n"
       << std::setw(22) << "Latency p95 (ms)" << lat.p95 * 1000.0 << "\n"
       << std::setw(22) << "Latency max (ms)" << lat.max * 1000.0 << "\n";
    // clang-format on
}

Status saveJson(const std::string& path, const Json::Value& value) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return Status::InvalidArgument("cannot open " + path +
                                       " for writing" + LOC_MARK);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &file);
    file << "\n";
    if (!file.good()) {
        return Status::InternalError("failed to write " + path + LOC_MARK);
    }
    LOG(INFO) << "Saved report to " << path;
    return Status::OK();
}

}  // namespace geoload
