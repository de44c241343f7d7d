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

#ifndef GEOLOAD_KEY_SPACE_H
#define GEOLOAD_KEY_SPACE_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "geoload/common/status.h"

namespace geoload {

// "<prefix>:<version>:<id>", e.g. "ip:v23:42".
std::string makeStoreKey(std::string_view prefix, std::string_view version,
                         uint64_t id);

struct StoreKey {
    std::string prefix;
    std::string version;
    uint64_t id = 0;
};

// Inverse of makeStoreKey. The prefix may itself contain ':'; version and
// id are the last two fields.
Status parseStoreKey(std::string_view key, StoreKey& out);

// Half-open id range [start_id, end_id) owned by one worker.
struct KeyRange {
    uint32_t worker_id = 0;
    uint64_t start_id = 0;
    uint64_t end_id = 0;

    uint64_t size() const { return end_id - start_id; }
};

// Splits [0, total_keys) into |num_workers| contiguous ranges of
// total_keys / num_workers ids; the last range absorbs the remainder.
Status partitionKeySpace(uint64_t total_keys, uint32_t num_workers,
                         std::vector<KeyRange>& ranges);

// Same division rule applied to a pre-generated sequence. Never returns
// empty slices: with fewer items than slices, fewer slices are produced.
template <typename T>
std::vector<std::vector<T>> sliceEvenly(const std::vector<T>& items,
                                        uint32_t num_slices) {
    std::vector<std::vector<T>> slices;
    if (items.empty()) return slices;
    if (num_slices == 0) num_slices = 1;
    if (items.size() < num_slices) {
        num_slices = static_cast<uint32_t>(items.size());
    }
    std::vector<KeyRange> ranges;
    if (!partitionKeySpace(items.size(), num_slices, ranges).ok()) {
        return slices;
    }
    slices.reserve(ranges.size());
    for (const auto& range : ranges) {
        slices.emplace_back(items.begin() + range.start_id,
                            items.begin() + range.end_id);
    }
    return slices;
}

}  // namespace geoload

#endif  // GEOLOAD_KEY_SPACE_H
