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

#ifndef GEOLOAD_TIMER_H
#define GEOLOAD_TIMER_H

#include <chrono>
#include <cstdint>

namespace geoload {

class BenchTimer {
   public:
    BenchTimer() : start_ts_(getCurrentTimeNs()) {}

    void reset() { start_ts_ = getCurrentTimeNs(); }

    uint64_t lap_us(bool reset = true) {
        auto now_ts = getCurrentTimeNs();
        auto duration = now_ts - start_ts_;
        if (reset) start_ts_ = now_ts;
        return duration / 1000;
    }

    double elapsed_seconds() const {
        return static_cast<double>(getCurrentTimeNs() - start_ts_) / 1e9;
    }

   private:
    static uint64_t getCurrentTimeNs() {
        auto ret = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(ret)
            .count();
    }

    uint64_t start_ts_;
};

}  // namespace geoload

#endif  // GEOLOAD_TIMER_H
