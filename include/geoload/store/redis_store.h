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

#ifndef GEOLOAD_REDIS_STORE_H
#define GEOLOAD_REDIS_STORE_H

#include <hiredis/hiredis.h>

#include <atomic>
#include <string>
#include <vector>

#include "geoload/common/config.h"
#include "geoload/store/store_client.h"

namespace geoload {

class RedisStoreClient : public StoreClient {
   public:
    explicit RedisStoreClient(const StoreConfig& config);

    ~RedisStoreClient() override;

    RedisStoreClient(const RedisStoreClient&) = delete;
    RedisStoreClient& operator=(const RedisStoreClient&) = delete;

    Status connect() override;

    void disconnect() override;

    Status ping() override;

    Status get(const std::string& key, std::string& value) override;

    Status setex(const std::string& key, int64_t ttl_seconds,
                 const std::string& value) override;

    Status remove(const std::string& key) override;

    Status exists(const std::string& key, bool& found) override;

    Status ttl(const std::string& key, int64_t& seconds) override;

    Status keys(const std::string& pattern,
                std::vector<std::string>& out) override;

    Status flushAll() override;

    Status execute(const Pipeline& pipeline,
                   std::vector<StoreReply>& replies) override;

    std::string endpoint() const override { return config_.endpoint(); }

    static StoreFactory factory(const StoreConfig& config);

   private:
    // Reconnects once if the previous call left the context unusable.
    Status ensureConnected();

    void cleanupFailedConnection();

    // Runs one command and stores the raw reply. The reply is owned by the
    // caller through RedisReplyGuard.
    redisReply* command(const std::vector<std::string>& argv);

    Status handleRedisReply(redisReply* reply,
                            const std::string& operation) const;

    static StoreReply convertReply(const redisReply* reply);

   private:
    StoreConfig config_;
    std::atomic<bool> connected_{false};
    redisContext* client_ = nullptr;
};

}  // namespace geoload

#endif  // GEOLOAD_REDIS_STORE_H
