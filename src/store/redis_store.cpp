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

#include "geoload/store/redis_store.h"

#include <glog/logging.h>
#include <sys/time.h>

#include <memory>

namespace geoload {

namespace {

// RAII wrapper for redisReply
class RedisReplyGuard {
   public:
    explicit RedisReplyGuard(redisReply* reply) : reply_(reply) {}
    ~RedisReplyGuard() {
        if (reply_) freeReplyObject(reply_);
    }

    redisReply* get() const { return reply_; }
    redisReply* operator->() const { return reply_; }
    operator bool() const { return reply_ != nullptr; }

    RedisReplyGuard(const RedisReplyGuard&) = delete;
    RedisReplyGuard& operator=(const RedisReplyGuard&) = delete;

   private:
    redisReply* reply_;
};

struct timeval toTimeval(uint32_t timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return tv;
}

void buildArgv(const std::vector<std::string>& args,
               std::vector<const char*>& argv, std::vector<size_t>& argvlen) {
    argv.clear();
    argvlen.clear();
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }
}

}  // namespace

RedisStoreClient::RedisStoreClient(const StoreConfig& config)
    : config_(config) {}

RedisStoreClient::~RedisStoreClient() { disconnect(); }

StoreFactory RedisStoreClient::factory(const StoreConfig& config) {
    return [config]() -> std::unique_ptr<StoreClient> {
        return std::make_unique<RedisStoreClient>(config);
    };
}

Status RedisStoreClient::connect() {
    if (connected_) {
        return Status::OK();
    }
    if (config_.host.empty()) {
        return Status::InvalidArgument("Redis host cannot be empty" LOC_MARK);
    }

    client_ = redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                      toTimeval(config_.connect_timeout_ms));
    if (!client_) {
        return Status::ConnectionError("Redis cannot allocate context for " +
                                       endpoint() + LOC_MARK);
    }
    if (client_->err) {
        std::string message = "Redis cannot connect '" + endpoint() +
                              "': " + std::string(client_->errstr);
        cleanupFailedConnection();
        return Status::ConnectionError(message + LOC_MARK);
    }
    if (config_.socket_timeout_ms > 0 &&
        redisSetTimeout(client_, toTimeval(config_.socket_timeout_ms)) !=
            REDIS_OK) {
        LOG(WARNING) << "Failed to set socket timeout on " << endpoint();
    }

    if (!config_.password.empty()) {
        redisReply* reply =
            (redisReply*)redisCommand(client_, "AUTH %b",
                                      config_.password.data(),
                                      config_.password.size());
        RedisReplyGuard reply_guard(reply);
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            cleanupFailedConnection();
            return Status::ConnectionError(
                "Redis authentication failed for " + endpoint() + LOC_MARK);
        }
    }

    if (config_.db != 0) {
        redisReply* reply =
            (redisReply*)redisCommand(client_, "SELECT %d", config_.db);
        RedisReplyGuard reply_guard(reply);
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            cleanupFailedConnection();
            return Status::ConnectionError("Redis failed to select database " +
                                           std::to_string(config_.db) +
                                           LOC_MARK);
        }
    }

    connected_ = true;
    VLOG(1) << "Connected to Redis at " << endpoint();
    return Status::OK();
}

void RedisStoreClient::disconnect() {
    if (client_) {
        redisFree(client_);
        client_ = nullptr;
    }
    connected_ = false;
}

void RedisStoreClient::cleanupFailedConnection() {
    if (client_) {
        redisFree(client_);
        client_ = nullptr;
    }
    connected_ = false;
}

Status RedisStoreClient::ensureConnected() {
    if (connected_ && client_ && client_->err == 0) {
        return Status::OK();
    }
    if (client_) {
        LOG(WARNING) << "Redis connection to " << endpoint()
                     << " is broken (" << client_->errstr
                     << "), reconnecting";
    }
    disconnect();
    return connect();
}

redisReply* RedisStoreClient::command(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    buildArgv(args, argv, argvlen);
    return (redisReply*)redisCommandArgv(client_, static_cast<int>(argv.size()),
                                         argv.data(), argvlen.data());
}

Status RedisStoreClient::handleRedisReply(redisReply* reply,
                                          const std::string& operation) const {
    if (!reply) {
        std::string detail =
            (client_ && client_->err) ? client_->errstr : "connection error";
        return Status::ConnectionError("Redis " + operation +
                                       " failed: " + detail + LOC_MARK);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string error_msg = reply->str ? reply->str : "unknown error";
        return Status::StoreError("Redis " + operation + " failed: " +
                                  error_msg + LOC_MARK);
    }
    return Status::OK();
}

StoreReply RedisStoreClient::convertReply(const redisReply* reply) {
    StoreReply out;
    switch (reply->type) {
        case REDIS_REPLY_NIL:
            out.type = StoreReply::Type::kNil;
            break;
        case REDIS_REPLY_STRING:
            out.type = StoreReply::Type::kString;
            out.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_STATUS:
            out.type = StoreReply::Type::kStatus;
            out.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_INTEGER:
            out.type = StoreReply::Type::kInteger;
            out.integer = reply->integer;
            break;
        case REDIS_REPLY_ERROR:
            out.type = StoreReply::Type::kError;
            out.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_ARRAY:
            out.type = StoreReply::Type::kArray;
            out.integer = static_cast<int64_t>(reply->elements);
            break;
        default:
            // RESP3 scalar types carry their text in str.
            out.type = StoreReply::Type::kString;
            if (reply->str) out.str.assign(reply->str, reply->len);
            break;
    }
    return out;
}

Status RedisStoreClient::ping() {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"PING"}));
    return handleRedisReply(reply.get(), "PING");
}

Status RedisStoreClient::get(const std::string& key, std::string& value) {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"GET", key}));
    CHECK_STATUS(handleRedisReply(reply.get(), "GET '" + key + "'"));
    if (reply->type == REDIS_REPLY_NIL) {
        return Status::NotFound(key);
    }
    value.assign(reply->str, reply->len);
    return Status::OK();
}

Status RedisStoreClient::setex(const std::string& key, int64_t ttl_seconds,
                               const std::string& value) {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(
        command({"SETEX", key, std::to_string(ttl_seconds), value}));
    return handleRedisReply(reply.get(), "SETEX '" + key + "'");
}

Status RedisStoreClient::remove(const std::string& key) {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"DEL", key}));
    return handleRedisReply(reply.get(), "DEL '" + key + "'");
}

Status RedisStoreClient::exists(const std::string& key, bool& found) {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"EXISTS", key}));
    CHECK_STATUS(handleRedisReply(reply.get(), "EXISTS '" + key + "'"));
    found = reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
    return Status::OK();
}

Status RedisStoreClient::ttl(const std::string& key, int64_t& seconds) {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"TTL", key}));
    CHECK_STATUS(handleRedisReply(reply.get(), "TTL '" + key + "'"));
    if (reply->type != REDIS_REPLY_INTEGER) {
        return Status::StoreError("Redis TTL returned a non-integer reply" +
                                  std::string(LOC_MARK));
    }
    seconds = reply->integer;
    return Status::OK();
}

Status RedisStoreClient::keys(const std::string& pattern,
                              std::vector<std::string>& out) {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"KEYS", pattern}));
    CHECK_STATUS(handleRedisReply(reply.get(), "KEYS '" + pattern + "'"));
    out.clear();
    if (reply->type != REDIS_REPLY_ARRAY) {
        return Status::StoreError("Redis KEYS returned a non-array reply" +
                                  std::string(LOC_MARK));
    }
    out.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        const redisReply* element = reply->element[i];
        if (element && element->str) {
            out.emplace_back(element->str, element->len);
        }
    }
    return Status::OK();
}

Status RedisStoreClient::flushAll() {
    CHECK_STATUS(ensureConnected());
    RedisReplyGuard reply(command({"FLUSHALL"}));
    return handleRedisReply(reply.get(), "FLUSHALL");
}

Status RedisStoreClient::execute(const Pipeline& pipeline,
                                 std::vector<StoreReply>& replies) {
    replies.clear();
    if (pipeline.empty()) return Status::OK();
    CHECK_STATUS(ensureConnected());

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    for (const auto& args : pipeline.commands()) {
        buildArgv(args, argv, argvlen);
        if (redisAppendCommandArgv(client_, static_cast<int>(argv.size()),
                                   argv.data(), argvlen.data()) != REDIS_OK) {
            return Status::PipelineError(
                "Redis failed to queue pipelined command: " +
                std::string(client_->errstr) + LOC_MARK);
        }
    }

    // Every queued reply is drained even after an error reply, so the
    // connection stays in sync for the next request.
    replies.reserve(pipeline.size());
    std::string first_error;
    for (size_t i = 0; i < pipeline.size(); ++i) {
        redisReply* raw = nullptr;
        if (redisGetReply(client_, (void**)&raw) != REDIS_OK) {
            RedisReplyGuard guard(raw);
            return Status::PipelineError(
                "Redis pipeline of " + std::to_string(pipeline.size()) +
                " commands failed after " + std::to_string(i) +
                " replies: " + std::string(client_->errstr) + LOC_MARK);
        }
        RedisReplyGuard guard(raw);
        replies.push_back(convertReply(raw));
        if (replies.back().isError() && first_error.empty()) {
            first_error = replies.back().str;
        }
    }
    if (!first_error.empty()) {
        return Status::PipelineError("Redis pipeline returned an error reply: " +
                                     first_error + LOC_MARK);
    }
    return Status::OK();
}

}  // namespace geoload
