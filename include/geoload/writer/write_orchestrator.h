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

#ifndef GEOLOAD_WRITE_ORCHESTRATOR_H
#define GEOLOAD_WRITE_ORCHESTRATOR_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geoload/common/cancellation.h"
#include "geoload/common/config.h"
#include "geoload/common/status.h"
#include "geoload/key_space.h"
#include "geoload/record/record_source.h"
#include "geoload/report.h"
#include "geoload/store/store_client.h"
#include "geoload/writer/batch_writer.h"

namespace geoload {

struct WriteOrchestratorOptions {
    uint32_t num_workers = 4;
    // Per-writer settings; key range, version and label are filled in for
    // each worker.
    BatchWriterOptions writer;
    double progress_interval_sec = 5.0;
    uint32_t version_pause_ms = 2000;

    static WriteOrchestratorOptions fromConfig(const GeoloadConfig& config);
};

// Runs one BatchWriter per key range on a fixed pool of workers. Each worker
// opens its own store client and hands its WriteReport back through a
// future; the reports are merged once all workers are done.
class WriteOrchestrator {
   public:
    WriteOrchestrator(StoreFactory factory,
                      std::shared_ptr<const RecordSource> source,
                      WriteOrchestratorOptions options,
                      CancellationToken token = CancellationToken());

    static Status partition(uint64_t total_keys, uint32_t num_workers,
                            std::vector<KeyRange>& ranges) {
        return partitionKeySpace(total_keys, num_workers, ranges);
    }

    // Writes ids [0, target_keys) of |version|. Fails only when the key
    // space cannot be partitioned; worker failures are recorded in the
    // per-worker reports.
    Status runImport(const std::string& version, uint64_t target_keys,
                     AggregateWriteReport& report);

    // Runs runImport for each version in turn with a short pause between
    // them. Versions not started before a stop request are skipped.
    Status runMultiVersionImport(const std::vector<std::string>& versions,
                                 uint64_t target_keys_each,
                                 std::optional<uint64_t> projection_keys,
                                 MultiVersionReport& report);

    const WriteOrchestratorOptions& options() const { return options_; }

   private:
    WriteReport runWorker(const KeyRange& range, const std::string& version,
                          WriteProgress* progress) const;

    // Cancelled when a stop is requested before the pause ends.
    Status pauseBetweenVersions() const;

   private:
    StoreFactory factory_;
    std::shared_ptr<const RecordSource> source_;
    WriteOrchestratorOptions options_;
    CancellationToken token_;
};

}  // namespace geoload

#endif  // GEOLOAD_WRITE_ORCHESTRATOR_H
