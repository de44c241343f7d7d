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

#include "geoload/store/store_client.h"

namespace geoload {

bool StoreReply::truthy() const {
    switch (type) {
        case Type::kStatus:
            return str == "OK" || str == "PONG";
        case Type::kString:
            return !str.empty();
        case Type::kInteger:
            return integer != 0;
        default:
            return false;
    }
}

Pipeline& Pipeline::get(const std::string& key) {
    commands_.push_back({"GET", key});
    return *this;
}

Pipeline& Pipeline::setex(const std::string& key, int64_t ttl_seconds,
                          const std::string& value) {
    commands_.push_back({"SETEX", key, std::to_string(ttl_seconds), value});
    return *this;
}

Status openClient(const StoreFactory& factory,
                  std::unique_ptr<StoreClient>& client) {
    if (!factory) {
        return Status::InvalidArgument("store factory is empty" LOC_MARK);
    }
    client = factory();
    if (!client) {
        return Status::InternalError("store factory returned null" LOC_MARK);
    }
    return client->connect();
}

}  // namespace geoload
