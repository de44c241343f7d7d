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

#include <gtest/gtest.h>

#include <sstream>

namespace geoload {

namespace {

Status failingStep() {
    return Status::PipelineError("batch rejected");
}

Status chained(bool fail) {
    if (fail) CHECK_STATUS(failingStep());
    return Status::OK();
}

}  // namespace

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
    EXPECT_TRUE(s.message().empty());
}

TEST(StatusTest, TypedFactoriesSetCode) {
    EXPECT_TRUE(Status::ConnectionError("down").IsConnectionError());
    EXPECT_TRUE(Status::StoreError("WRONGTYPE").IsStoreError());
    EXPECT_TRUE(Status::PipelineError("x").IsPipelineError());
    EXPECT_TRUE(Status::MalformedConfig("x").IsMalformedConfig());
    EXPECT_TRUE(Status::NotFound("k").IsNotFound());
    EXPECT_FALSE(Status::NotFound("k").ok());
    EXPECT_EQ(Status::StoreError("WRONGTYPE").ToString(),
              "StoreError: WRONGTYPE");
}

TEST(StatusTest, CopyAndMoveKeepMessage) {
    Status original = Status::InvalidArgument("bad port");
    Status copy = original;
    EXPECT_EQ(copy, original);
    EXPECT_EQ(copy.message(), "bad port");

    Status moved = std::move(copy);
    EXPECT_TRUE(moved.IsInvalidArgument());
    EXPECT_EQ(moved.message(), "bad port");

    Status assigned;
    assigned = moved;
    EXPECT_EQ(assigned, original);
    EXPECT_NE(assigned, Status::InvalidArgument("other"));
}

TEST(StatusTest, CheckStatusReturnsEarly) {
    EXPECT_TRUE(chained(false).ok());
    Status s = chained(true);
    EXPECT_TRUE(s.IsPipelineError());
    EXPECT_EQ(s.message(), "batch rejected");
}

TEST(StatusTest, StreamsCodeName) {
    std::ostringstream os;
    os << Status::Code::kConnectionError << " " << Status::Cancelled("stop");
    EXPECT_EQ(os.str(), "ConnectionError Cancelled: stop");
}

}  // namespace geoload
