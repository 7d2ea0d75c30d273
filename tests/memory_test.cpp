// SPDX-License-Identifier: MIT

// tests/memory_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "lib/stream/memory.hpp"
#include "lib/stream/pipes.hpp"
#include "test_util.hpp"

using namespace byte_pipe;
using namespace byte_pipe::test;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(FromStringTest, SingleChunk) {
    EXPECT_THAT(Strings(FromString("hello")), ElementsAre("hello"));
}

TEST(FromStringTest, EmptyTextYieldsNoChunk) {
    EXPECT_THAT(Strings(FromString("")), IsEmpty());
}

TEST(FromBufferTest, SlicesWithoutCopying) {
    Chunk buffer = Chunk::FromString("abcdefg");
    auto chunks = CollectChunks(FromBuffer(buffer, 3));
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0].ToString(), "abc");
    EXPECT_EQ(chunks[1].ToString(), "def");
    EXPECT_EQ(chunks[2].ToString(), "g");
    EXPECT_EQ(chunks[0].Data(), buffer.Data());
    EXPECT_EQ(chunks[1].Data(), buffer.Data() + 3);
}

TEST(FromBufferTest, EmptyBufferYieldsNoChunk) {
    EXPECT_THAT(CollectChunks(FromBuffer(Chunk{}, 4)), IsEmpty());
}

TEST(FromBufferTest, ZeroSliceThrows) {
    EXPECT_THROW(FromBuffer(Chunk::FromString("abc"), 0), std::invalid_argument);
}

TEST(MemorySourceTest, StreamReplaysFromStart) {
    auto source = MemorySource::FromStrings({"ab", "", "cd"});
    EXPECT_EQ(source.Size(), 4);
    EXPECT_THAT(Strings(source.Stream()), ElementsAre("ab", "", "cd"));
    EXPECT_THAT(Strings(source.Stream() | Drop(1)), ElementsAre("b", "", "cd"));
    EXPECT_THAT(Strings(source.Stream()), ElementsAre("ab", "", "cd"));
}

TEST(MemorySourceTest, ChunksAreShared) {
    auto source = MemorySource::FromStrings({"shared"});
    auto chunks = CollectChunks(source.Stream());
    ASSERT_EQ(chunks.size(), 1);
    EXPECT_EQ(chunks[0].Data(), source.Chunks()[0].Data());
}

TEST(CollectTest, ConcatenatesAtTheBoundary) {
    EXPECT_EQ(CollectString(Chunks({"He", "llo, ", "", "world"})), "Hello, world");

    auto bytes = Collect(Chunks({"a", "b"}));
    ASSERT_EQ(bytes.size(), 2);
    EXPECT_EQ(bytes[0], B('a'));
    EXPECT_EQ(bytes[1], B('b'));
}

TEST(CollectTest, KeepsChunkBoundaries) {
    auto chunks = CollectChunks(Chunks({"x", "", "yz"}));
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_TRUE(chunks[1].Empty());
}
