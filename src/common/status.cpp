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

#include "geoload/common/status.h"

#include <glog/logging.h>

namespace geoload {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string out(CodeToString(code_));
    out += ": ";
    out += message_;
    return out;
}

std::string_view Status::CodeToString(Code code) {
#define GEOLOAD_STATUS_NAME(name, value) \
    case Code::k##name:                  \
        return #name;
    switch (code) {
        case Code::kOk:
            return "OK";
        GEOLOAD_STATUS_CODES(GEOLOAD_STATUS_NAME)
    }
#undef GEOLOAD_STATUS_NAME
    LOG(ERROR) << "Unknown status code " << static_cast<uint16_t>(code);
    return "UnknownCode";
}

std::ostream& operator<<(std::ostream& os, Status::Code code) {
    return os << Status::CodeToString(code);
}

std::ostream& operator<<(std::ostream& os, const Status& s) {
    return os << s.ToString();
}

}  // namespace geoload
