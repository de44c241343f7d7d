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

#ifndef GEOLOAD_STORE_CLIENT_H
#define GEOLOAD_STORE_CLIENT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "geoload/common/status.h"

namespace geoload {

struct StoreReply {
    enum class Type { kNil, kString, kStatus, kInteger, kError, kArray };

    Type type = Type::kNil;
    std::string str;
    int64_t integer = 0;

    bool isNil() const { return type == Type::kNil; }
    bool isError() const { return type == Type::kError; }

    // Whether the reply acknowledges the command: an OK status, a non-empty
    // bulk string or a non-zero integer.
    bool truthy() const;
};

// Ordered list of independent commands sent in one round trip. No MULTI/EXEC
// wrapping, so commands may land on different cluster slots.
class Pipeline {
   public:
    Pipeline& get(const std::string& key);

    Pipeline& setex(const std::string& key, int64_t ttl_seconds,
                    const std::string& value);

    size_t size() const { return commands_.size(); }

    bool empty() const { return commands_.empty(); }

    void clear() { commands_.clear(); }

    // Commands in argv form, e.g. {"SETEX", key, ttl, value}.
    const std::vector<std::vector<std::string>>& commands() const {
        return commands_;
    }

   private:
    std::vector<std::vector<std::string>> commands_;
};

// Connection to the remote key-value store. Instances are not thread safe;
// every worker thread owns its own client.
class StoreClient {
   public:
    virtual ~StoreClient() = default;

    virtual Status connect() = 0;

    virtual void disconnect() = 0;

    virtual Status ping() = 0;

    // Returns NotFound when the key is absent.
    virtual Status get(const std::string& key, std::string& value) = 0;

    virtual Status setex(const std::string& key, int64_t ttl_seconds,
                         const std::string& value) = 0;

    virtual Status remove(const std::string& key) = 0;

    virtual Status exists(const std::string& key, bool& found) = 0;

    // -1 when the key has no expiry, -2 when it does not exist.
    virtual Status ttl(const std::string& key, int64_t& seconds) = 0;

    virtual Status keys(const std::string& pattern,
                        std::vector<std::string>& out) = 0;

    virtual Status flushAll() = 0;

    // Sends the whole pipeline and collects one reply per command, in
    // request order. A transport failure or any error reply fails the
    // request as a whole with PipelineError.
    virtual Status execute(const Pipeline& pipeline,
                           std::vector<StoreReply>& replies) = 0;

    virtual std::string endpoint() const = 0;
};

using StoreFactory = std::function<std::unique_ptr<StoreClient>()>;

// Creates a client through |factory| and connects it.
Status openClient(const StoreFactory& factory,
                  std::unique_ptr<StoreClient>& client);

}  // namespace geoload

#endif  // GEOLOAD_STORE_CLIENT_H
