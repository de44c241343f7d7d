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

#include "geoload/key_space.h"

#include <gtest/gtest.h>

#include <numeric>
#include <vector>

namespace geoload {

TEST(KeySpaceTest, MakeStoreKey) {
    EXPECT_EQ(makeStoreKey("ip", "v23", 42), "ip:v23:42");
    EXPECT_EQ(makeStoreKey("ip", "v22", 0), "ip:v22:0");
}

TEST(KeySpaceTest, ParseStoreKey) {
    StoreKey key;
    ASSERT_TRUE(parseStoreKey("ip:v23:199999", key).ok());
    EXPECT_EQ(key.prefix, "ip");
    EXPECT_EQ(key.version, "v23");
    EXPECT_EQ(key.id, 199999u);

    ASSERT_TRUE(parseStoreKey("geo:ip:v1:7", key).ok());
    EXPECT_EQ(key.prefix, "geo:ip");
    EXPECT_EQ(key.version, "v1");
    EXPECT_EQ(key.id, 7u);

    EXPECT_TRUE(parseStoreKey("ip:v23:abc", key).IsInvalidArgument());
    EXPECT_TRUE(parseStoreKey("ip:v23:", key).IsInvalidArgument());
    EXPECT_TRUE(parseStoreKey("v23:12", key).IsInvalidArgument());
    EXPECT_TRUE(parseStoreKey("plain", key).IsInvalidArgument());
}

TEST(KeySpaceTest, ThousandKeysFourWorkers) {
    std::vector<KeyRange> ranges;
    ASSERT_TRUE(partitionKeySpace(1000, 4, ranges).ok());
    ASSERT_EQ(ranges.size(), 4u);
    const uint64_t expected[4][2] = {
        {0, 250}, {250, 500}, {500, 750}, {750, 1000}};
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(ranges[i].worker_id, i);
        EXPECT_EQ(ranges[i].start_id, expected[i][0]);
        EXPECT_EQ(ranges[i].end_id, expected[i][1]);
    }
}

TEST(KeySpaceTest, LastRangeAbsorbsRemainder) {
    std::vector<KeyRange> ranges;
    ASSERT_TRUE(partitionKeySpace(10, 3, ranges).ok());
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].size(), 3u);
    EXPECT_EQ(ranges[1].size(), 3u);
    EXPECT_EQ(ranges[2].size(), 4u);
    EXPECT_EQ(ranges[2].end_id, 10u);
}

TEST(KeySpaceTest, PartitionCoversEveryIdOnce) {
    for (uint64_t total = 1; total <= 64; ++total) {
        for (uint32_t workers = 1; workers <= total; ++workers) {
            std::vector<KeyRange> ranges;
            ASSERT_TRUE(partitionKeySpace(total, workers, ranges).ok());
            ASSERT_EQ(ranges.size(), workers);
            std::vector<int> hits(total, 0);
            uint64_t expected_start = 0;
            for (const auto& range : ranges) {
                EXPECT_EQ(range.start_id, expected_start);
                for (uint64_t id = range.start_id; id < range.end_id; ++id) {
                    ++hits[id];
                }
                expected_start = range.end_id;
            }
            EXPECT_EQ(expected_start, total);
            for (uint64_t id = 0; id < total; ++id) {
                ASSERT_EQ(hits[id], 1) << "total=" << total
                                       << " workers=" << workers;
            }
        }
    }
}

TEST(KeySpaceTest, PartitionRejectsBadInput) {
    std::vector<KeyRange> ranges;
    EXPECT_TRUE(partitionKeySpace(100, 0, ranges).IsInvalidArgument());
    EXPECT_TRUE(partitionKeySpace(0, 1, ranges).IsInvalidArgument());
    EXPECT_TRUE(partitionKeySpace(3, 4, ranges).IsInvalidArgument());
    EXPECT_TRUE(ranges.empty());
}

TEST(KeySpaceTest, SliceEvenlyKeepsOrder) {
    std::vector<uint64_t> ids(11);
    std::iota(ids.begin(), ids.end(), 100);
    auto slices = sliceEvenly(ids, 4);
    ASSERT_EQ(slices.size(), 4u);
    EXPECT_EQ(slices[0], (std::vector<uint64_t>{100, 101}));
    EXPECT_EQ(slices[3], (std::vector<uint64_t>{106, 107, 108, 109, 110}));

    std::vector<uint64_t> joined;
    for (const auto& slice : slices) {
        joined.insert(joined.end(), slice.begin(), slice.end());
    }
    EXPECT_EQ(joined, ids);
}

TEST(KeySpaceTest, SliceEvenlyWithFewItems) {
    std::vector<uint64_t> ids = {1, 2};
    auto slices = sliceEvenly(ids, 8);
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_TRUE(sliceEvenly(std::vector<uint64_t>{}, 4).empty());
}

}  // namespace geoload
