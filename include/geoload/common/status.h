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

// Status follows the RocksDB status design: a code plus an optional message,
// returned by value from every fallible store and config operation.

#ifndef GEOLOAD_STATUS_H
#define GEOLOAD_STATUS_H

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

// X(name, value) for every non-OK code.
#define GEOLOAD_STATUS_CODES(X) \
    X(InvalidArgument, 1)       \
    X(NotFound, 2)              \
    X(Cancelled, 3)             \
    X(ConnectionError, 100)     \
    X(StoreError, 101)          \
    X(PipelineError, 102)       \
    X(MalformedConfig, 131)     \
    X(InternalError, 199)

#define GEOLOAD_STRINGIFY(x) #x
#define GEOLOAD_TOSTRING(x) GEOLOAD_STRINGIFY(x)
#define LOC_MARK "\n    Raised at " __FILE__ ":" GEOLOAD_TOSTRING(__LINE__)

#define CHECK_STATUS(call)               \
    do {                                 \
        Status status = call;            \
        if (!status.ok()) return status; \
    } while (0)

namespace geoload {

class Status final {
   public:
#define GEOLOAD_STATUS_ENUM(name, value) k##name = value,
    enum class Code : uint16_t {
        kOk = 0,
        GEOLOAD_STATUS_CODES(GEOLOAD_STATUS_ENUM)
    };
#undef GEOLOAD_STATUS_ENUM

    Status() = default;

    // A kOk code drops |message|.
    Status(Code code, std::string_view message)
        : code_(code),
          message_(code == Code::kOk ? std::string() : std::string(message)) {}

    Status(const Status&) = default;
    Status& operator=(const Status&) = default;

    Status(Status&& other) noexcept
        : code_(std::exchange(other.code_, Code::kOk)),
          message_(std::move(other.message_)) {}

    Status& operator=(Status&& other) noexcept {
        code_ = std::exchange(other.code_, Code::kOk);
        message_ = std::move(other.message_);
        return *this;
    }

    bool operator==(const Status& other) const {
        return code_ == other.code_ && message_ == other.message_;
    }
    bool operator!=(const Status& other) const { return !(*this == other); }

    Code code() const { return code_; }

    std::string_view message() const { return message_; }

    [[nodiscard]] bool ok() const { return code_ == Code::kOk; }

    static Status OK() { return Status(); }

#define GEOLOAD_STATUS_FACTORY(name, value)                                \
    [[nodiscard]] bool Is##name() const { return code_ == Code::k##name; } \
    static Status name(std::string_view msg) {                             \
        return Status(Code::k##name, msg);                                 \
    }
    GEOLOAD_STATUS_CODES(GEOLOAD_STATUS_FACTORY)
#undef GEOLOAD_STATUS_FACTORY

    // "OK", or "<CodeName>: <message>".
    std::string ToString() const;

    static std::string_view CodeToString(Code code);

   private:
    Code code_ = Code::kOk;
    std::string message_;
};

std::ostream& operator<<(std::ostream& os, Status::Code code);

std::ostream& operator<<(std::ostream& os, const Status& s);

}  // namespace geoload

#endif  // GEOLOAD_STATUS_H
