// GoogleTest unit tests for FrameCodec
#include "jframepp/FrameCodec.hpp"
#include "jframepp/MessageExceptions.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

using namespace jframepp;

namespace
{

// Byte source that hands out at most `chunk` bytes per read, then reports end of stream.
class ChunkedReader
{
  public:
    ChunkedReader(std::string data, const std::size_t chunk) : _data(std::move(data)), _chunk(chunk) {}

    std::size_t operator()(char* out, const std::size_t n)
    {
        const std::size_t count = std::min({n, _chunk, _data.size() - _offset});
        std::memcpy(out, _data.data() + _offset, count);
        _offset += count;
        ++_reads;
        return count;
    }

    [[nodiscard]] std::size_t reads() const { return _reads; }
    [[nodiscard]] std::size_t remaining() const { return _data.size() - _offset; }

  private:
    std::string _data;
    std::size_t _chunk;
    std::size_t _offset = 0;
    std::size_t _reads = 0;
};

std::string decodeWith(const FrameCodec& codec, ChunkedReader& reader)
{
    return codec.decode([&reader](char* out, const std::size_t n) { return reader(out, n); });
}

} // namespace

TEST(FrameCodecTest, EncodesBigEndianHeader)
{
    const FrameCodec codec(4);
    const std::string frame = codec.encode("hello");
    ASSERT_EQ(frame.size(), 9u);
    EXPECT_EQ(frame.substr(0, 4), std::string("\0\0\0\x05", 4));
    EXPECT_EQ(frame.substr(4), "hello");
}

TEST(FrameCodecTest, EncodesMultiByteLength)
{
    const FrameCodec codec(2);
    const std::string payload(300, 'x');
    const std::string frame = codec.encode(payload);
    EXPECT_EQ(static_cast<unsigned char>(frame[0]), 0x01);
    EXPECT_EQ(static_cast<unsigned char>(frame[1]), 0x2C);
    EXPECT_EQ(FrameCodec::readLength(frame, 2), 300u);
}

TEST(FrameCodecTest, RoundTripAcrossHeaderWidths)
{
    const std::vector<std::string> messages = {"", "a", "hello world", "héllo wörld ✓ 日本語", std::string(255, 'z')};
    for (const std::size_t width : {1u, 2u, 4u, 8u})
    {
        const FrameCodec codec(width);
        for (const auto& message : messages)
        {
            ChunkedReader reader(codec.encode(message), 1024);
            EXPECT_EQ(decodeWith(codec, reader), message) << "width " << width;
        }
    }
}

TEST(FrameCodecTest, EmptyMessageIsHeaderOnly)
{
    const FrameCodec codec(4);
    EXPECT_EQ(codec.encode(""), std::string(4, '\0'));
}

TEST(FrameCodecTest, DecodesOneByteAtATime)
{
    const FrameCodec codec(4);
    const std::string message = "partial delivery must still produce the whole message";
    ChunkedReader reader(codec.encode(message), 1);
    EXPECT_EQ(decodeWith(codec, reader), message);
    EXPECT_EQ(reader.reads(), 4 + message.size());
}

TEST(FrameCodecTest, DecodesUnevenChunks)
{
    const FrameCodec codec(4);
    const std::string message(1000, 'q');
    for (const std::size_t chunk : {3u, 7u, 64u, 999u})
    {
        ChunkedReader reader(codec.encode(message), chunk);
        EXPECT_EQ(decodeWith(codec, reader), message) << "chunk " << chunk;
    }
}

TEST(FrameCodecTest, DecodesConsecutiveFramesFromOneStream)
{
    const FrameCodec codec(2);
    ChunkedReader reader(codec.encode("m1") + codec.encode("m2") + codec.encode("m3"), 3);
    EXPECT_EQ(decodeWith(codec, reader), "m1");
    EXPECT_EQ(decodeWith(codec, reader), "m2");
    EXPECT_EQ(decodeWith(codec, reader), "m3");
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(FrameCodecTest, OversizedForHeaderWidthThrows)
{
    const FrameCodec codec(1);
    EXPECT_NO_THROW(static_cast<void>(codec.encode(std::string(255, 'a'))));
    EXPECT_THROW(static_cast<void>(codec.encode(std::string(256, 'a'))), EncodingException);
}

TEST(FrameCodecTest, InvalidUtf8IsRejectedOnEncode)
{
    const FrameCodec codec(4);
    EXPECT_THROW(static_cast<void>(codec.encode("\xC3\x28")), EncodingException);
}

TEST(FrameCodecTest, ClosedBeforeHeaderThrows)
{
    const FrameCodec codec(4);
    ChunkedReader reader(std::string("\0\0", 2), 16);
    EXPECT_THROW(static_cast<void>(decodeWith(codec, reader)), ConnectionClosedException);
}

TEST(FrameCodecTest, ClosedMidPayloadThrows)
{
    const FrameCodec codec(4);
    const std::string frame = codec.encode("truncated payload");
    ChunkedReader reader(frame.substr(0, frame.size() - 3), 5);
    EXPECT_THROW(static_cast<void>(decodeWith(codec, reader)), ConnectionClosedException);
}

TEST(FrameCodecTest, DeclaredLengthAboveCeilingThrows)
{
    const FrameCodec codec(4, 16);
    ChunkedReader reader(std::string("\0\0\0\x11", 4) + std::string(17, 'x'), 64);
    try
    {
        static_cast<void>(decodeWith(codec, reader));
        FAIL() << "expected FrameTooLargeException";
    }
    catch (const FrameTooLargeException& e)
    {
        EXPECT_EQ(e.getDeclaredSize(), 17u);
        EXPECT_EQ(e.getLimit(), 16u);
    }
}

TEST(FrameCodecTest, InvalidUtf8PayloadConsumesWholeFrame)
{
    const FrameCodec codec(1);
    const std::string bad = std::string("\x02", 1) + "\xFF\xFE";
    ChunkedReader reader(bad + codec.encode("next"), 2);
    EXPECT_THROW(static_cast<void>(decodeWith(codec, reader)), EncodingException);
    EXPECT_EQ(decodeWith(codec, reader), "next");
}

TEST(FrameCodecTest, InvalidConfigurationThrows)
{
    EXPECT_THROW(FrameCodec(0), ConfigurationException);
    EXPECT_THROW(FrameCodec(9), ConfigurationException);
    EXPECT_THROW(FrameCodec(4, 0), ConfigurationException);
}

TEST(FrameCodecTest, MaxPayloadForWidth)
{
    EXPECT_EQ(FrameCodec::maxPayloadFor(1), 255u);
    EXPECT_EQ(FrameCodec::maxPayloadFor(2), 65535u);
    EXPECT_EQ(FrameCodec::maxPayloadFor(4), 4294967295u);
    EXPECT_EQ(FrameCodec::maxPayloadFor(8), std::numeric_limits<std::uint64_t>::max());
}

TEST(FrameCodecTest, ReadLengthNeedsFullHeader)
{
    EXPECT_EQ(FrameCodec::readLength(std::string("\0\0\1\0", 4), 4), 256u);
    EXPECT_THROW(static_cast<void>(FrameCodec::readLength("ab", 4)), EncodingException);
}

TEST(Utf8Test, AcceptsWellFormedText)
{
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("\xC3\xA9"));         // é
    EXPECT_TRUE(isValidUtf8("\xE2\x9C\x93"));     // ✓
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80")); // U+1F600
}

TEST(Utf8Test, RejectsMalformedText)
{
    EXPECT_FALSE(isValidUtf8("\x80"));             // lone continuation
    EXPECT_FALSE(isValidUtf8("\xC3"));             // truncated sequence
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));         // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));     // surrogate U+D800
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80")); // above U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xFF"));
}
