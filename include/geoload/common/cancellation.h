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

#ifndef GEOLOAD_CANCELLATION_H
#define GEOLOAD_CANCELLATION_H

#include <atomic>
#include <memory>
#include <thread>

namespace geoload {

// Read side of a stop request. Copies share state with the source that
// created them; a default-constructed token is never cancelled.
class CancellationToken {
   public:
    CancellationToken() = default;

    bool stopRequested() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

   private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
   public:
    CancellationSource()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }

    void requestStop() { flag_->store(true, std::memory_order_release); }

    bool stopRequested() const {
        return flag_->load(std::memory_order_acquire);
    }

   private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Turns SIGINT/SIGTERM into a stop request on |source|. The signals are
// blocked process-wide and consumed by a dedicated sigwait thread, so worker
// threads never run signal handlers. A second signal restores the default
// disposition and re-raises it.
class InterruptWatcher {
   public:
    explicit InterruptWatcher(CancellationSource source);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

   private:
    CancellationSource source_;
    std::jthread signal_thread_;
};

}  // namespace geoload

#endif  // GEOLOAD_CANCELLATION_H
