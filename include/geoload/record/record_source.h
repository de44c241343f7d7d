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

#ifndef GEOLOAD_RECORD_SOURCE_H
#define GEOLOAD_RECORD_SOURCE_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "geoload/common/status.h"

namespace geoload {

// Produces the value stored for a key id. Implementations are immutable
// after construction and may be shared by all worker threads.
class RecordSource {
   public:
    virtual ~RecordSource() = default;

    virtual const std::string& generate(uint64_t id) const = 0;

    // Numeric identifiers map to the same payload as generate(id); any
    // other text is hashed onto the sample set.
    virtual const std::string& generate(std::string_view id) const = 0;

    virtual size_t sampleCount() const = 0;

    virtual double averagePayloadSize() const = 0;
};

// Fixed set of pre-built payloads, cycled by id modulo the set size.
class SyntheticRecordSource : public RecordSource {
   public:
    static constexpr uint32_t kDefaultSampleSetSize = 100;

    // Builds |sample_set_size| deterministic JSON documents of about 1 KB.
    explicit SyntheticRecordSource(
        uint32_t sample_set_size = kDefaultSampleSetSize);

    // Loads samples from a JSON object {"0": {...}, "1": {...}, ...}. Entry
    // i is stored as the compact serialization of member "i".
    static Status fromFile(const std::string& path,
                           std::shared_ptr<SyntheticRecordSource>& out);

    const std::string& generate(uint64_t id) const override;

    const std::string& generate(std::string_view id) const override;

    size_t sampleCount() const override { return samples_.size(); }

    double averagePayloadSize() const override { return average_size_; }

    // Deterministic sample document for |index|.
    static std::string buildSample(uint32_t index);

   private:
    explicit SyntheticRecordSource(std::vector<std::string> samples);

    void computeAverage();

    std::vector<std::string> samples_;
    double average_size_ = 0.0;
};

// Builds the record source described by |sample_file| (when set) or a
// synthetic one with |sample_set_size| samples.
Status createRecordSource(const std::string& sample_file,
                          uint32_t sample_set_size,
                          std::shared_ptr<const RecordSource>& out);

}  // namespace geoload

#endif  // GEOLOAD_RECORD_SOURCE_H
