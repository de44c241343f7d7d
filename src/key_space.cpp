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

#include "geoload/key_space.h"

#include <charconv>

namespace geoload {

std::string makeStoreKey(std::string_view prefix, std::string_view version,
                         uint64_t id) {
    std::string key;
    key.reserve(prefix.size() + version.size() + 22);
    key.append(prefix);
    key.push_back(':');
    key.append(version);
    key.push_back(':');
    key.append(std::to_string(id));
    return key;
}

Status parseStoreKey(std::string_view key, StoreKey& out) {
    auto id_sep = key.rfind(':');
    if (id_sep == std::string_view::npos || id_sep == 0) {
        return Status::InvalidArgument("store key without version field: " +
                                       std::string(key) + LOC_MARK);
    }
    auto version_sep = key.rfind(':', id_sep - 1);
    if (version_sep == std::string_view::npos) {
        return Status::InvalidArgument("store key without prefix field: " +
                                       std::string(key) + LOC_MARK);
    }
    auto version = key.substr(version_sep + 1, id_sep - version_sep - 1);
    auto id_text = key.substr(id_sep + 1);
    if (version.empty() || id_text.empty()) {
        return Status::InvalidArgument("store key has empty fields: " +
                                       std::string(key) + LOC_MARK);
    }
    uint64_t id = 0;
    auto [ptr, ec] =
        std::from_chars(id_text.data(), id_text.data() + id_text.size(), id);
    if (ec != std::errc() || ptr != id_text.data() + id_text.size()) {
        return Status::InvalidArgument("store key id is not a number: " +
                                       std::string(key) + LOC_MARK);
    }
    out.prefix = std::string(key.substr(0, version_sep));
    out.version = std::string(version);
    out.id = id;
    return Status::OK();
}

Status partitionKeySpace(uint64_t total_keys, uint32_t num_workers,
                         std::vector<KeyRange>& ranges) {
    ranges.clear();
    if (num_workers == 0) {
        return Status::InvalidArgument("number of workers must be positive" +
                                       std::string(LOC_MARK));
    }
    if (total_keys == 0) {
        return Status::InvalidArgument("key space must not be empty" +
                                       std::string(LOC_MARK));
    }
    if (total_keys < num_workers) {
        return Status::InvalidArgument(
            "cannot split " + std::to_string(total_keys) + " keys across " +
            std::to_string(num_workers) + " workers" + LOC_MARK);
    }

    const uint64_t per_worker = total_keys / num_workers;
    ranges.reserve(num_workers);
    for (uint32_t i = 0; i < num_workers; ++i) {
        KeyRange range;
        range.worker_id = i;
        range.start_id = i * per_worker;
        range.end_id =
            (i + 1 == num_workers) ? total_keys : (i + 1) * per_worker;
        ranges.push_back(range);
    }
    return Status::OK();
}

}  // namespace geoload
