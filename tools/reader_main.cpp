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
#include <memory>
#include <string>

#include "geoload/common/cancellation.h"
#include "geoload/reader/read_benchmark.h"
#include "geoload/report.h"
#include "geoload/store/redis_store.h"
#include "tool_common.h"

DEFINE_string(mode, "mt_pipeline",
              "Read mode: sequential|pipeline|mt_pipeline");
DEFINE_uint64(reads, 10000, "Total number of reads");
DEFINE_uint32(num_readers, 4, "Reader threads for sequential|mt_pipeline");
DEFINE_uint32(batch_size, 100, "Ids per pipelined request");
DEFINE_uint64(seed, 0, "Seed for key id generation; clock-seeded if 0");
DEFINE_string(output, "", "Write the JSON report to this file");

using namespace geoload;

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage(
        "Benchmarks versioned fallback reads.\n"
        "  geoload_reader --mode=mt_pipeline --reads=100000 "
        "--num_readers=8");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    GeoloadConfig config;
    Status status = tools::loadToolConfig(config);
    if (status.ok()) {
        if (tools::flagIsSet("num_readers")) {
            config.reader.num_readers = FLAGS_num_readers;
        }
        if (tools::flagIsSet("batch_size")) {
            config.reader.batch_size = FLAGS_batch_size;
        }
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
    if (FLAGS_mode != "sequential" && FLAGS_mode != "pipeline" &&
        FLAGS_mode != "mt_pipeline") {
        LOG(ERROR) << "Unknown --mode " << FLAGS_mode;
        return 1;
    }
    LOG(INFO) << "Effective configuration:\n" << config.stringify();

    std::unique_ptr<StoreClient> ping_client;
    status = tools::connectAndPing(config.store, ping_client);
    if (!status.ok()) {
        LOG(ERROR) << "Cannot reach store at " << config.store.endpoint()
                   << ": " << status.ToString();
        return 1;
    }
    ping_client->disconnect();

    ReadBenchmarkOptions options = ReadBenchmarkOptions::fromConfig(config);
    if (FLAGS_seed != 0) options.seed = FLAGS_seed;

    ReadStatistics stats;
    {
        CancellationSource cancellation;
        InterruptWatcher watcher(cancellation);
        ReadBenchmark benchmark(RedisStoreClient::factory(config.store),
                                options, cancellation.token());
        if (FLAGS_mode == "sequential") {
            status = benchmark.runSequential(FLAGS_reads, stats);
        } else if (FLAGS_mode == "pipeline") {
            status = benchmark.runPipelined(FLAGS_reads, stats);
        } else {
            status = benchmark.runMultiThreadedPipelined(FLAGS_reads, stats);
        }
    }
    if (!status.ok()) {
        LOG(ERROR) << "Read benchmark failed: " << status.ToString();
        return 1;
    }

    std::cout << "Versions: primary " << options.primary_version
              << ", secondary " << options.secondary_version << "\n";
    stats.print(std::cout);

    int rc = 0;
    if (!FLAGS_output.empty()) {
        Json::Value report = stats.toJson();
        report["primary_version"] = options.primary_version;
        report["secondary_version"] = options.secondary_version;
        status = saveJson(FLAGS_output, report);
        if (!status.ok()) {
            LOG(ERROR) << "Failed to save report: " << status.ToString();
            rc = 1;
        }
    }
    google::ShutdownGoogleLogging();
    return rc;
}
