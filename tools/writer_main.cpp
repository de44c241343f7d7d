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

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "geoload/common/cancellation.h"
#include "geoload/report.h"
#include "geoload/store/redis_store.h"
#include "geoload/writer/batch_writer.h"
#include "geoload/writer/write_orchestrator.h"
#include "tool_common.h"

DEFINE_string(mode, "parallel",
              "Write mode: single|parallel|multi. multi imports every "
              "version of --versions in turn");
DEFINE_string(version, "", "Version tag to write; primary version if empty");
DEFINE_string(versions, "",
              "Comma-separated versions for multi mode; "
              "secondary,primary if empty");
DEFINE_uint64(target_keys, 0,
              "Keys to write per version; the whole key space if 0");
DEFINE_double(duration, 0, "Single mode only: stop after this many seconds");
DEFINE_uint64(start_id, 0, "Single mode only: first key id to write");
DEFINE_uint32(num_writers, 4, "Number of parallel writers");
DEFINE_uint32(batch_size, 50, "Keys per pipelined request");
DEFINE_int64(ttl, 259200, "Key expiry in seconds");
DEFINE_double(skip_probability, 0.0,
              "Probability of skipping a key to simulate misses");
DEFINE_uint64(projection_keys, 0,
              "Multi mode: estimate the time to write this many keys");
DEFINE_uint64(seed, 0, "Seed for skip simulation; clock-seeded if 0");
DEFINE_string(output, "", "Write the JSON report to this file");

using namespace geoload;

namespace {

std::vector<std::string> splitVersions(const std::string& list) {
    std::vector<std::string> versions;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) versions.push_back(item);
    }
    return versions;
}

void applyWriterFlags(GeoloadConfig& config) {
    if (tools::flagIsSet("num_writers")) {
        config.writer.num_writers = FLAGS_num_writers;
    }
    if (tools::flagIsSet("batch_size")) {
        config.writer.batch_size = FLAGS_batch_size;
    }
    if (tools::flagIsSet("ttl")) config.writer.key_ttl_seconds = FLAGS_ttl;
    if (tools::flagIsSet("skip_probability")) {
        config.writer.skip_probability = FLAGS_skip_probability;
    }
}

int saveReport(const Json::Value& value) {
    if (FLAGS_output.empty()) return 0;
    Status status = saveJson(FLAGS_output, value);
    if (!status.ok()) {
        LOG(ERROR) << "Failed to save report: " << status.ToString();
        return 1;
    }
    return 0;
}

int runSingle(const GeoloadConfig& config,
              std::shared_ptr<const RecordSource> source,
              const CancellationToken& token) {
    if (FLAGS_start_id >= config.key_space.max_keys) {
        LOG(ERROR) << "--start_id " << FLAGS_start_id
                   << " is outside the key space of "
                   << config.key_space.max_keys << " keys";
        return 1;
    }

    std::unique_ptr<StoreClient> client;
    Status status = tools::connectAndPing(config.store, client);
    if (!status.ok()) {
        LOG(ERROR) << "Cannot reach store at " << config.store.endpoint()
                   << ": " << status.ToString();
        return 1;
    }

    std::string version =
        FLAGS_version.empty() ? config.key_space.primary_version : FLAGS_version;
    BatchWriterOptions options = BatchWriterOptions::fromConfig(config, version);
    options.start_id = FLAGS_start_id;
    if (FLAGS_seed != 0) options.seed = FLAGS_seed;

    std::optional<uint64_t> target;
    if (FLAGS_target_keys > 0) target = FLAGS_target_keys;
    std::optional<double> duration;
    if (FLAGS_duration > 0) duration = FLAGS_duration;

    BatchWriter writer(*client, *source, options, token);
    WriteCounts counts = writer.runUntil(target, duration);
    writer.printFinalStats(std::cout, source->averagePayloadSize());

    WriteReport report;
    report.version = version;
    report.start_key = options.start_id;
    report.end_key = writer.cursor();
    report.keys_written = counts.written;
    report.keys_skipped = counts.skipped;
    report.keys_failed = counts.failed;
    report.duration_sec = writer.elapsedSeconds();
    return saveReport(report.toJson());
}

int runParallel(const GeoloadConfig& config,
                std::shared_ptr<const RecordSource> source,
                const CancellationToken& token) {
    WriteOrchestratorOptions options =
        WriteOrchestratorOptions::fromConfig(config);
    if (FLAGS_seed != 0) options.writer.seed = FLAGS_seed;
    WriteOrchestrator orchestrator(RedisStoreClient::factory(config.store),
                                   std::move(source), options, token);

    const uint64_t target = FLAGS_target_keys > 0 ? FLAGS_target_keys
                                                  : config.key_space.max_keys;
    if (FLAGS_mode == "parallel") {
        std::string version = FLAGS_version.empty()
                                  ? config.key_space.primary_version
                                  : FLAGS_version;
        AggregateWriteReport report;
        Status status = orchestrator.runImport(version, target, report);
        if (!status.ok()) {
            LOG(ERROR) << "Import failed: " << status.ToString();
            return 1;
        }
        report.print(std::cout);
        return saveReport(report.toJson());
    }

    std::vector<std::string> versions = splitVersions(FLAGS_versions);
    if (versions.empty()) {
        versions = {config.key_space.secondary_version,
                    config.key_space.primary_version};
    }
    std::optional<uint64_t> projection;
    if (FLAGS_projection_keys > 0) projection = FLAGS_projection_keys;

    MultiVersionReport report;
    Status status =
        orchestrator.runMultiVersionImport(versions, target, projection, report);
    if (!status.ok()) {
        LOG(ERROR) << "Import failed: " << status.ToString();
        return 1;
    }
    report.print(std::cout);
    return saveReport(report.toJson());
}

}  // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage(
        "Bulk-populates the store with versioned synthetic records.\n"
        "  geoload_writer --mode=parallel --target_keys=1000000\n"
        "  geoload_writer --mode=multi --versions=v22,v23 "
        "--projection_keys=66000000");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    GeoloadConfig config;
    Status status = tools::loadToolConfig(config);
    if (status.ok()) {
        applyWriterFlags(config);
        status = config.validate();
    }
    Status log_status = tools::initLogging(config, argv[0]);
    if (!log_status.ok()) {
        LOG(WARNING) << "Logging to stderr only: " << log_status.ToString();
    }
    if (!status.ok()) {
        LOG(ERROR) << "Invalid configuration: " << status.ToString();
        return 1;
    }
    if (FLAGS_mode != "single" && FLAGS_mode != "parallel" &&
        FLAGS_mode != "multi") {
        LOG(ERROR) << "Unknown --mode " << FLAGS_mode;
        return 1;
    }
    LOG(INFO) << "Effective configuration:\n" << config.stringify();

    std::shared_ptr<const RecordSource> source;
    status = tools::loadRecordSource(config, source);
    if (!status.ok()) {
        LOG(ERROR) << "Cannot build record source: " << status.ToString();
        return 1;
    }

    // Fail fast when the store is unreachable, before any worker starts.
    if (FLAGS_mode != "single") {
        std::unique_ptr<StoreClient> ping_client;
        status = tools::connectAndPing(config.store, ping_client);
        if (!status.ok()) {
            LOG(ERROR) << "Cannot reach store at " << config.store.endpoint()
                       << ": " << status.ToString();
            return 1;
        }
        ping_client->disconnect();
    }

    int rc = 0;
    {
        CancellationSource cancellation;
        InterruptWatcher watcher(cancellation);
        rc = FLAGS_mode == "single"
                 ? runSingle(config, source, cancellation.token())
                 : runParallel(config, source, cancellation.token());
    }
    google::ShutdownGoogleLogging();
    return rc;
}
