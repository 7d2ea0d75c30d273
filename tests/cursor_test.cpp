// SPDX-License-Identifier: MIT

// tests/cursor_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "lib/stream/cursor.hpp"
#include "lib/stream/memory.hpp"
#include "test_util.hpp"

using namespace byte_pipe;
using namespace byte_pipe::test;
using ::testing::ElementsAre;

TEST(CursorTest, DrawSkipsEmptyChunks) {
    Cursor cursor(Chunks({"", "ab", "", "", "c"}));
    EXPECT_EQ(cursor.Draw().Value().ToString(), "ab");
    EXPECT_EQ(cursor.Draw().Value().ToString(), "c");
    EXPECT_TRUE(cursor.Draw().IsDone());
}

TEST(CursorTest, PeekIsRepeatable) {
    auto pulls = std::make_shared<int>(0);
    Cursor cursor(Counted({"ab", "cd"}, pulls));
    EXPECT_EQ(cursor.Peek().Value().ToString(), "ab");
    EXPECT_EQ(cursor.Peek().Value().ToString(), "ab");
    EXPECT_EQ(cursor.Peek().Value().ToString(), "ab");
    EXPECT_EQ(*pulls, 1);
    EXPECT_TRUE(cursor.HasLeftover());
}

TEST(CursorTest, DrawAfterPeekConsumesSameChunk) {
    Cursor cursor(Chunks({"ab", "cd"}));
    Chunk peeked = cursor.Peek().Value();
    Chunk drawn = cursor.Draw().Value();
    EXPECT_EQ(peeked, drawn);
    EXPECT_EQ(peeked.Data(), drawn.Data());
    EXPECT_FALSE(cursor.HasLeftover());
    EXPECT_EQ(cursor.Draw().Value().ToString(), "cd");
}

TEST(CursorTest, IsEndOfInputMatchesDraw) {
    Cursor cursor(ChunksReturning({"x", ""}, 7));
    EXPECT_FALSE(cursor.IsEndOfInput());
    EXPECT_EQ(cursor.Draw().Value().ToString(), "x");
    EXPECT_TRUE(cursor.IsEndOfInput());
    auto step = cursor.Draw();
    ASSERT_TRUE(step.IsDone());
    EXPECT_EQ(step.Result(), 7);
}

TEST(CursorTest, TerminalValueRepeatsAfterCompletion) {
    Cursor cursor(ChunksReturning({}, std::string("end")));
    EXPECT_EQ(cursor.Draw().Result(), "end");
    EXPECT_EQ(cursor.Peek().Result(), "end");
    EXPECT_EQ(cursor.Draw().Result(), "end");
}

TEST(CursorTest, UnDrawPushesBack) {
    Cursor cursor(Chunks({"world"}));
    cursor.UnDraw(Chunk::FromString("hello "));
    EXPECT_EQ(cursor.Draw().Value().ToString(), "hello ");
    EXPECT_EQ(cursor.Draw().Value().ToString(), "world");
}

TEST(CursorTest, UnDrawIgnoresEmptyChunk) {
    Cursor cursor(Chunks({"a"}));
    cursor.UnDraw(Chunk{});
    EXPECT_FALSE(cursor.HasLeftover());
}

TEST(CursorTest, SecondUnDrawThrows) {
    Cursor cursor(Chunks({"a"}));
    cursor.Peek();
    EXPECT_THROW(cursor.UnDraw(Chunk::FromString("b")), std::logic_error);
}

TEST(CursorTest, PartialConsumptionPushesRemainderBack) {
    Cursor cursor(Chunks({"key=value", "\nrest"}));
    Chunk first = cursor.Draw().Value();
    auto [key, remainder] = first.SplitAt(4);
    cursor.UnDraw(remainder);
    EXPECT_EQ(key.ToString(), "key=");
    EXPECT_THAT(Strings(std::move(cursor).Release()), ElementsAre("value", "\nrest"));
}

TEST(CursorTest, ReleaseAfterCompletionReturnsResult) {
    Cursor cursor(ChunksReturning({"a"}, 2));
    cursor.Draw();
    EXPECT_TRUE(cursor.IsEndOfInput());
    auto rest = std::move(cursor).Release();
    auto step = rest.Next();
    ASSERT_TRUE(step.IsDone());
    EXPECT_EQ(step.Result(), 2);
}

TEST(CursorTest, ReleaseKeepsChunkPushedBackAfterCompletion) {
    Cursor cursor(ChunksReturning({"ab"}, 7));
    Chunk chunk = cursor.Draw().Value();
    ASSERT_TRUE(cursor.Draw().IsDone());
    cursor.UnDraw(chunk);
    auto rest = std::move(cursor).Release();
    auto first = rest.Next();
    ASSERT_FALSE(first.IsDone());
    EXPECT_EQ(first.Value().ToString(), "ab");
    auto last = rest.Next();
    ASSERT_TRUE(last.IsDone());
    EXPECT_EQ(last.Result(), 7);
}
