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

#include "geoload/common/cancellation.h"

#include <glog/logging.h>
#include <pthread.h>
#include <signal.h>

#include <cstring>
#include <future>

namespace geoload {

InterruptWatcher::InterruptWatcher(CancellationSource source)
    : source_(std::move(source)) {
    std::promise<void> ready;
    auto ready_future = ready.get_future();

    // Block signals in this thread; new threads inherit this mask
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);  // used to interrupt sigwait on stop
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    signal_thread_ = std::jthread([set, source = source_,
                                   ready = std::move(ready)](
                                      std::stop_token st) mutable {
        pthread_t self = pthread_self();
        std::stop_callback cb(st, [self]() { pthread_kill(self, SIGUSR1); });
        ready.set_value();
        for (;;) {
            int sig = 0;
            int rc = sigwait(&set, &sig);
            if (rc != 0) {
                LOG(ERROR) << "sigwait failed: " << strerror(rc);
                continue;
            }

            if (sig == SIGUSR1) {
                if (st.stop_requested()) {
                    break;
                }
                continue;
            }

            if (!source.stopRequested()) {
                LOG(WARNING) << "Received signal " << sig
                             << ", stopping after the current batch";
                source.requestStop();
                continue;
            }

            LOG(WARNING) << "Received signal " << sig << " again, terminating";
            struct sigaction sa;
            sa.sa_handler = SIG_DFL;
            sigemptyset(&sa.sa_mask);
            sa.sa_flags = 0;
            sigaction(sig, &sa, nullptr);
            sigset_t unblock;
            sigemptyset(&unblock);
            sigaddset(&unblock, sig);
            pthread_sigmask(SIG_UNBLOCK, &unblock, nullptr);
            raise(sig);
            break;
        }
    });
    ready_future.wait();
}

InterruptWatcher::~InterruptWatcher() {
    if (signal_thread_.joinable()) {
        signal_thread_.request_stop();
        signal_thread_.join();
    }
}

}  // namespace geoload
