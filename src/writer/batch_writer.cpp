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

#include "geoload/writer/batch_writer.h"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <limits>
#include <thread>
#include <utility>
#include <vector>

#include "geoload/key_space.h"

namespace geoload {

const char* batchOutcomeToString(BatchOutcome outcome) {
    switch (outcome) {
        case BatchOutcome::kPipelined:
            return "pipelined";
        case BatchOutcome::kFallback:
            return "fallback";
    }
    return "unknown";
}

BatchWriterOptions BatchWriterOptions::fromConfig(const GeoloadConfig& config,
                                                  const std::string& version) {
    BatchWriterOptions options;
    options.key_prefix = config.key_space.key_prefix;
    options.version = version;
    options.start_id = 0;
    options.max_keys = config.key_space.max_keys;
    options.batch_size = config.writer.batch_size;
    options.write_chunk = config.writer.write_chunk;
    options.ttl_seconds = config.writer.key_ttl_seconds;
    options.skip_probability = config.writer.skip_probability;
    options.loop_pause_us = config.writer.loop_pause_us;
    options.progress_interval_sec = config.writer.progress_interval_sec;
    return options;
}

BatchWriter::BatchWriter(StoreClient& client, const RecordSource& source,
                         BatchWriterOptions options, CancellationToken token)
    : client_(client),
      source_(source),
      options_(std::move(options)),
      token_(std::move(token)),
      rng_(options_.seed ? *options_.seed
                         : SimpleRandom::Get().next(
                               std::numeric_limits<uint64_t>::max())),
      cursor_(options_.start_id) {
    if (options_.batch_size == 0) options_.batch_size = 1;
    if (options_.write_chunk == 0) options_.write_chunk = options_.batch_size;
    if (options_.progress_interval_sec <= 0) {
        options_.progress_interval_sec = 5.0;
    }
}

void BatchWriter::publish(const WriteCounts& delta) {
    totals_ += delta;
    if (progress_) {
        progress_->written.fetch_add(delta.written, std::memory_order_relaxed);
        progress_->skipped.fetch_add(delta.skipped, std::memory_order_relaxed);
        progress_->failed.fetch_add(delta.failed, std::memory_order_relaxed);
    }
}

BatchWriteResult BatchWriter::writeBatch(uint64_t max_ids) {
    BatchWriteResult result;
    std::vector<std::pair<std::string, const std::string*>> entries;
    entries.reserve(std::min<uint64_t>(max_ids, options_.batch_size));

    while (result.attempted < max_ids && cursor_ < options_.max_keys) {
        uint64_t key_id = cursor_++;
        ++result.attempted;
        if (rng_.chance(options_.skip_probability)) {
            ++result.skipped;
            continue;
        }
        entries.emplace_back(
            makeStoreKey(options_.key_prefix, options_.version, key_id),
            &source_.generate(key_id));
    }
    if (entries.empty()) return result;

    Pipeline pipeline;
    for (const auto& entry : entries) {
        pipeline.setex(entry.first, options_.ttl_seconds, *entry.second);
    }

    std::vector<StoreReply> replies;
    Status status = client_.execute(pipeline, replies);
    if (!status.ok()) {
        result.pipeline_status = status;
        return writeIndividually(entries, std::move(result));
    }

    result.outcome = BatchOutcome::kPipelined;
    for (const auto& reply : replies) {
        if (reply.truthy()) ++result.written;
    }
    result.failed = entries.size() - result.written;
    return result;
}

BatchWriteResult BatchWriter::writeIndividually(
    const std::vector<std::pair<std::string, const std::string*>>& entries,
    BatchWriteResult result) {
    LOG(WARNING) << options_.label << ": pipelined batch of " << entries.size()
                 << " keys failed, writing them individually: "
                 << result.pipeline_status.ToString();
    result.outcome = BatchOutcome::kFallback;
    for (const auto& entry : entries) {
        Status status =
            client_.setex(entry.first, options_.ttl_seconds, *entry.second);
        if (status.ok()) {
            ++result.written;
        } else {
            ++result.failed;
            LOG_EVERY_N(WARNING, 100)
                << options_.label << ": failed to write " << entry.first
                << ": " << status.ToString();
        }
    }
    return result;
}

WriteCounts BatchWriter::write(uint64_t count, uint32_t batch_size) {
    if (batch_size == 0) batch_size = 1;
    WriteCounts counts;
    uint64_t remaining = count;
    while (remaining > 0 && cursor_ < options_.max_keys) {
        if (token_.stopRequested()) {
            interrupted_ = true;
            break;
        }
        BatchWriteResult batch =
            writeBatch(std::min<uint64_t>(batch_size, remaining));
        if (batch.attempted == 0) break;
        VLOG(2) << options_.label << ": batch of " << batch.attempted
                << " ids " << batchOutcomeToString(batch.outcome);
        if (batch.outcome == BatchOutcome::kFallback) {
            ++fallback_batches_;
        } else {
            ++pipelined_batches_;
        }
        WriteCounts delta{batch.written, batch.skipped, batch.failed};
        publish(delta);
        counts += delta;
        remaining -= batch.attempted;
    }
    return counts;
}

WriteCounts BatchWriter::runUntil(std::optional<uint64_t> target_keys,
                                  std::optional<double> duration_sec) {
    timer_.reset();
    BenchTimer report_timer;
    const auto pause = std::chrono::microseconds(options_.loop_pause_us);

    LOG(INFO) << options_.label << ": writing " << options_.version
              << " ids [" << cursor_ << ", " << options_.max_keys << ")"
              << (target_keys ? ", target " + std::to_string(*target_keys)
                              : std::string())
              << (duration_sec
                      ? ", duration " + std::to_string(*duration_sec) + " s"
                      : std::string());

    while (true) {
        if (token_.stopRequested()) {
            interrupted_ = true;
            break;
        }
        if (target_keys && totals_.written >= *target_keys) break;
        if (duration_sec && timer_.elapsed_seconds() >= *duration_sec) break;
        if (exhausted()) {
            LOG(INFO) << options_.label << ": reached end of key space ("
                      << options_.max_keys << " keys)";
            break;
        }

        uint64_t chunk = options_.write_chunk;
        if (target_keys) {
            chunk = std::min<uint64_t>(chunk, *target_keys - totals_.written);
        }
        write(chunk, options_.batch_size);

        if (report_timer.elapsed_seconds() >= options_.progress_interval_sec) {
            double elapsed = timer_.elapsed_seconds();
            uint64_t attempts = totals_.written + totals_.skipped;
            LOG(INFO) << options_.label << ": " << totals_.written
                      << " written, " << totals_.skipped << " skipped, "
                      << totals_.failed << " failed | rate "
                      << static_cast<uint64_t>(
                             elapsed > 0 ? totals_.written / elapsed : 0)
                      << " keys/s | skip rate " << std::fixed
                      << std::setprecision(1)
                      << (attempts ? 100.0 * totals_.skipped / attempts : 0.0)
                      << "%";
            report_timer.reset();
        }

        if (options_.loop_pause_us > 0) std::this_thread::sleep_for(pause);
    }

    LOG(INFO) << options_.label << ": finished with " << totals_.written
              << " written, " << totals_.skipped << " skipped, "
              << totals_.failed << " failed in " << std::fixed
              << std::setprecision(2) << timer_.elapsed_seconds() << " s"
              << (interrupted_ ? " (interrupted)" : "");
    return totals_;
}

void BatchWriter::printFinalStats(std::ostream& os,
                                  double avg_payload_bytes) const {
    const double elapsed = timer_.elapsed_seconds();
    const uint64_t attempts = totals_.written + totals_.skipped;
    const uint64_t attempted_ids = cursor_ - options_.start_id;
    const uint64_t range = options_.max_keys > options_.start_id
                               ? options_.max_keys - options_.start_id
                               : 0;
    const double mb = totals_.written * avg_payload_bytes / (1024.0 * 1024.0);

    // clang-format off
    os << std::fixed << std::setprecision(1)
       << "\nWriting complete" << (interrupted_ ? " (interrupted)" : "") << "\n"
       << std::string(40, '=') << "\n"
       << std::left
       << std::setw(22) << "Duration (s)" << elapsed << "\n"
       << std::setw(22) << "Keys written" << totals_.written << "\n"
       << std::setw(22) << "Keys skipped" << totals_.skipped << "\n"
       << std::setw(22) << "Keys failed" << totals_.failed << "\n"
       << std::setw(22) << "Total attempts" << attempts << "\n"
       << std::setw(22) << "Write rate (keys/s)"
       << (elapsed > 0 ? totals_.written / elapsed : 0.0) << "\n"
       << std::setw(22) << "Skip rate (%)"
       << (attempts ? 100.0 * totals_.skipped / attempts : 0.0) << "\n"
       << std::setw(22) << "Data written (MB)" << mb << "\n"
       << std::setw(22) << "Avg value size (B)" << avg_payload_bytes << "\n"
       << std::setw(22) << "Range attempted" << attempted_ids << " of "
       << range << " ("
       << (range ? 100.0 * std::min<uint64_t>(attempted_ids, range) / range
                 : 0.0)
       << "%)\n"
       << std::setw(22) << "Success rate (%)"
       << (attempted_ids ? 100.0 * totals_.written / attempted_ids : 0.0)
       << "\n"
       << std::setw(22) << "Batches"
       << pipelined_batches_ << " pipelined, " << fallback_batches_
       << " fallback\n"
       << std::setw(22) << "Throughput (MB/s)"
       << (elapsed > 0 ? mb / elapsed : 0.0) << "\n";
    // clang-format on
}

}  // namespace geoload
