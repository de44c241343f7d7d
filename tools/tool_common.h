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

#ifndef GEOLOAD_TOOL_COMMON_H
#define GEOLOAD_TOOL_COMMON_H

#include <gflags/gflags.h>

#include <memory>
#include <string>

#include "geoload/common/config.h"
#include "geoload/common/status.h"
#include "geoload/record/record_source.h"
#include "geoload/store/store_client.h"

DECLARE_string(config);
DECLARE_string(host);
DECLARE_int32(port);
DECLARE_int32(db);
DECLARE_string(password);
DECLARE_uint64(max_keys);
DECLARE_string(primary_version);
DECLARE_string(secondary_version);
DECLARE_string(log_dir);
DECLARE_string(log_level);

namespace geoload {
namespace tools {

// Builds the effective configuration: defaults, then --config, then
// GEOLOAD_* variables, then flags given on the command line.
Status loadToolConfig(GeoloadConfig& config);

// True when |name| was passed explicitly on the command line.
bool flagIsSet(const char* name);

// Falls back to stderr logging when the log directory is unusable.
Status initLogging(const GeoloadConfig& config, const char* argv0);

// Opens a client and pings the store.
Status connectAndPing(const StoreConfig& config,
                      std::unique_ptr<StoreClient>& client);

Status loadRecordSource(const GeoloadConfig& config,
                        std::shared_ptr<const RecordSource>& source);

}  // namespace tools
}  // namespace geoload

#endif  // GEOLOAD_TOOL_COMMON_H
