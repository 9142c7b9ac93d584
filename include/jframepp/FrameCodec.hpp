/**
 * @file FrameCodec.hpp
 * @brief Length-prefixed framing of UTF-8 text over a byte stream.
 */

#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace jframepp
{

/**
 * @brief Check that @p text is well-formed UTF-8.
 * @ingroup messaging
 *
 * Rejects overlong encodings, surrogate code points (U+D800..U+DFFF) and code points above U+10FFFF.
 * The empty string is valid.
 */
[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

/**
 * @class FrameCodec
 * @ingroup messaging
 * @brief Encodes text into `[H-byte big-endian length][payload]` frames and decodes them back.
 *
 * The header width `H` (1..8) is fixed per codec and must match on both ends; it is not negotiated.
 * A frame with width `H` carries at most `2^(8H) - 1` payload bytes.
 *
 * Decoding pulls bytes through a caller-supplied read function so that the codec works on any byte
 * source: a Socket, a test buffer, or a source that deliberately returns one byte at a time.
 *
 * @code
 * FrameCodec codec(4);
 * const std::string frame = codec.encode("hello"); // "\0\0\0\x05hello"
 *
 * std::size_t offset = 0;
 * const auto reader = [&](char* out, std::size_t n) {
 *     const auto count = std::min(n, frame.size() - offset);
 *     std::memcpy(out, frame.data() + offset, count);
 *     offset += count;
 *     return count;
 * };
 * const std::string text = codec.decode(reader); // "hello"
 * @endcode
 *
 * Thread-safety: a FrameCodec is immutable after construction and may be shared.
 */
class FrameCodec
{
  public:
    /**
     * @brief One underlying read of at most `n` bytes into `buffer`; returns the count, `0` at end of stream.
     */
    using ReadFunction = std::function<std::size_t(char* buffer, std::size_t n)>;

    /**
     * @param headerWidth  Header width in bytes, 1..8.
     * @param maxFrameSize Largest payload decode() accepts before giving up on the stream.
     * @throws ConfigurationException if either argument is out of range.
     */
    explicit FrameCodec(std::size_t headerWidth = DefaultHeaderWidth, std::size_t maxFrameSize = DefaultMaxFrameSize);

    /**
     * @brief Build a frame for @p message.
     * @throws EncodingException if @p message is not valid UTF-8 or its length does not fit in the header.
     */
    [[nodiscard]] std::string encode(std::string_view message) const;

    /**
     * @brief Read exactly one frame through @p readSome and return its payload.
     *
     * Short reads are accumulated until the header and then the payload are complete.
     *
     * @throws ConnectionClosedException if @p readSome returns 0 before the frame is complete.
     * @throws FrameTooLargeException if the declared length exceeds the configured ceiling. The stream is
     *         left positioned inside the oversized frame and cannot be resynchronised.
     * @throws EncodingException if the payload is not valid UTF-8. The frame has been consumed in full, so
     *         the stream stays in sync.
     * @throws Anything @p readSome throws.
     */
    [[nodiscard]] std::string decode(const ReadFunction& readSome) const;

    [[nodiscard]] std::size_t getHeaderWidth() const noexcept { return _headerWidth; }

    [[nodiscard]] std::size_t getMaxFrameSize() const noexcept { return _maxFrameSize; }

    /**
     * @brief Largest payload a header of @p headerWidth bytes can describe.
     * @throws ConfigurationException if @p headerWidth is outside 1..8.
     */
    [[nodiscard]] static std::uint64_t maxPayloadFor(std::size_t headerWidth);

    /**
     * @brief Parse the length prefix at the start of an encoded frame.
     * @throws EncodingException if @p frame is shorter than @p headerWidth.
     * @throws ConfigurationException if @p headerWidth is outside 1..8.
     */
    [[nodiscard]] static std::uint64_t readLength(std::string_view frame, std::size_t headerWidth);

  private:
    static void readExactly(const ReadFunction& readSome, char* out, std::size_t n);

    std::size_t _headerWidth;
    std::size_t _maxFrameSize;
};

} // namespace jframepp
