#include <gtest/gtest.h>
#include <stream/output_buffer.hpp>
#include <string>

TEST(OutputBuffer, AppendThenDrainPreservesOrder) {
    OutputBuffer buf(1024, OverflowPolicy::Block);
    buf.append("abc", 3);
    buf.append(std::string("def"));
    EXPECT_EQ(buf.len(), 6u);
    EXPECT_EQ(buf.chunk_count(), 2u);

    auto out = buf.drain();
    EXPECT_EQ(out.data, "abcdef");
    EXPECT_FALSE(out.truncated);
    EXPECT_EQ(buf.len(), 0u);
    EXPECT_EQ(buf.chunk_count(), 0u);
}

TEST(OutputBuffer, ManySmallChunksStayChunked) {
    // 10,000 appends of 1 KiB each, never more than the cap pending
    const size_t cap = 1024 * 1024;
    OutputBuffer buf(cap, OverflowPolicy::Block);
    const std::string kib(1024, 'x');

    size_t delivered = 0;
    for (int i = 0; i < 10000; ++i) {
        auto status = buf.append(kib);
        if (status == OutputBuffer::AppendStatus::WouldBlock) {
            delivered += buf.drain().data.size();
            status = buf.append(kib);
        }
        ASSERT_EQ(status, OutputBuffer::AppendStatus::Appended);
        ASSERT_LE(buf.len(), cap);
    }
    delivered += buf.drain().data.size();
    EXPECT_EQ(delivered, 10000u * 1024u);
}

TEST(OutputBuffer, BlockPolicyRefusesWhenFull) {
    OutputBuffer buf(8, OverflowPolicy::Block);
    EXPECT_EQ(buf.append("12345678", 8), OutputBuffer::AppendStatus::Appended);
    EXPECT_TRUE(buf.full());
    EXPECT_EQ(buf.space(), 0u);
    EXPECT_EQ(buf.append("9", 1), OutputBuffer::AppendStatus::WouldBlock);
    EXPECT_EQ(buf.drain().data, "12345678");
    EXPECT_EQ(buf.append("9", 1), OutputBuffer::AppendStatus::Appended);
}

TEST(OutputBuffer, DropOldestKeepsNewestBytes) {
    OutputBuffer buf(8, OverflowPolicy::DropOldest);
    buf.append("abcdef", 6);
    EXPECT_EQ(buf.append("ghij", 4), OutputBuffer::AppendStatus::Truncated);
    EXPECT_EQ(buf.len(), 8u);
    EXPECT_TRUE(buf.truncated());

    auto out = buf.drain();
    EXPECT_EQ(out.data, "cdefghij");
    EXPECT_TRUE(out.truncated);
    EXPECT_FALSE(buf.truncated());
}

TEST(OutputBuffer, DropOldestOversizedChunkKeepsItsTail) {
    OutputBuffer buf(4, OverflowPolicy::DropOldest);
    EXPECT_EQ(buf.append("0123456789", 10), OutputBuffer::AppendStatus::Truncated);
    EXPECT_EQ(buf.drain().data, "6789");
}

TEST(OutputBuffer, TailDoesNotConsume) {
    OutputBuffer buf(64, OverflowPolicy::DropOldest);
    buf.append("hello ", 6);
    buf.append("world", 5);
    EXPECT_EQ(buf.tail(3), "rld");
    EXPECT_EQ(buf.tail(8), "lo world");
    EXPECT_EQ(buf.tail(100), "hello world");
    EXPECT_EQ(buf.len(), 11u);
}

TEST(OutputBuffer, TailAfterPartialDrop) {
    OutputBuffer buf(6, OverflowPolicy::DropOldest);
    buf.append("abcd", 4);
    buf.append("ef", 2);
    buf.append("g", 1);      // drops "a" from the front chunk
    EXPECT_EQ(buf.tail(6), "bcdefg");
    EXPECT_EQ(buf.drain().data, "bcdefg");
}

TEST(OutputBuffer, CloseRefusesLaterAppends) {
    OutputBuffer buf(1, OverflowPolicy::Block);
    buf.append("x", 1);
    buf.close();
    EXPECT_EQ(buf.append("z", 1), OutputBuffer::AppendStatus::Closed);
    EXPECT_TRUE(buf.closed());
    EXPECT_EQ(buf.drain().data, "x");
}
