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

#ifndef GEOLOAD_RANDOM_H
#define GEOLOAD_RANDOM_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>

namespace geoload {

// Uniform draws over [0, bound). Seeded instances are reproducible; Get()
// returns a per-thread instance seeded from the clock.
class SimpleRandom {
   public:
    explicit SimpleRandom(uint64_t seed) : engine_(seed) {}

    static SimpleRandom &Get() {
        static std::atomic<uint64_t> g_incr_val(0);
        thread_local SimpleRandom g_random(
            static_cast<uint64_t>(
                std::chrono::steady_clock::now().time_since_epoch().count()) +
            g_incr_val.fetch_add(1));
        return g_random;
    }

    uint64_t next(uint64_t bound) {
        if (bound <= 1) return 0;
        std::uniform_int_distribution<uint64_t> dist(0, bound - 1);
        return dist(engine_);
    }

    // True with probability |p|.
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(engine_) < p;
    }

   private:
    std::mt19937_64 engine_;
};

}  // namespace geoload

#endif  // GEOLOAD_RANDOM_H
