#include "jframepp/FrameCodec.hpp"
#include "jframepp/MessageExceptions.hpp"

#include <array>

using namespace jframepp;

namespace
{

void checkHeaderWidth(const std::size_t headerWidth)
{
    if (headerWidth < 1 || headerWidth > MaxHeaderWidth)
        throw ConfigurationException("Header width must be between 1 and " + std::to_string(MaxHeaderWidth) +
                                     " bytes, got " + std::to_string(headerWidth));
}

std::uint64_t parseBigEndian(const unsigned char* bytes, const std::size_t width)
{
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i)
        value = (value << 8) | bytes[i];
    return value;
}

} // namespace

bool jframepp::isValidUtf8(const std::string_view text) noexcept
{
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n)
    {
        const unsigned char c = s[i];
        if (c < 0x80)
        {
            ++i;
            continue;
        }

        std::size_t extra;
        std::uint32_t cp;
        std::uint32_t minCp;
        if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp = c & 0x1F;
            minCp = 0x80;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp = c & 0x0F;
            minCp = 0x800;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp = c & 0x07;
            minCp = 0x10000;
        }
        else
        {
            return false;
        }

        if (n - i <= extra)
            return false;

        for (std::size_t k = 1; k <= extra; ++k)
        {
            const unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}

FrameCodec::FrameCodec(const std::size_t headerWidth, const std::size_t maxFrameSize)
    : _headerWidth(headerWidth), _maxFrameSize(maxFrameSize)
{
    checkHeaderWidth(headerWidth);
    if (maxFrameSize == 0)
        throw ConfigurationException("Maximum frame size must be greater than zero");
}

std::uint64_t FrameCodec::maxPayloadFor(const std::size_t headerWidth)
{
    checkHeaderWidth(headerWidth);
    if (headerWidth == MaxHeaderWidth)
        return std::numeric_limits<std::uint64_t>::max();
    return (std::uint64_t{1} << (8 * headerWidth)) - 1;
}

std::uint64_t FrameCodec::readLength(const std::string_view frame, const std::size_t headerWidth)
{
    checkHeaderWidth(headerWidth);
    if (frame.size() < headerWidth)
        throw EncodingException("Frame shorter than its " + std::to_string(headerWidth) + "-byte header");
    return parseBigEndian(reinterpret_cast<const unsigned char*>(frame.data()), headerWidth);
}

std::string FrameCodec::encode(const std::string_view message) const
{
    if (!isValidUtf8(message))
        throw EncodingException("Message is not valid UTF-8");

    const std::uint64_t length = message.size();
    if (length > maxPayloadFor(_headerWidth))
        throw EncodingException("Message of " + std::to_string(length) + " bytes does not fit in a " +
                                std::to_string(_headerWidth) + "-byte length header");

    std::string frame(_headerWidth + message.size(), '\0');
    for (std::size_t i = 0; i < _headerWidth; ++i)
        frame[_headerWidth - 1 - i] = static_cast<char>((length >> (8 * i)) & 0xFF);
    frame.replace(_headerWidth, message.size(), message);
    return frame;
}

void FrameCodec::readExactly(const ReadFunction& readSome, char* out, const std::size_t n)
{
    std::size_t total = 0;
    while (total < n)
    {
        const std::size_t got = readSome(out + total, n - total);
        if (got == 0)
            throw ConnectionClosedException("Connection closed after " + std::to_string(total) + " of " +
                                            std::to_string(n) + " bytes");
        total += got;
    }
}

std::string FrameCodec::decode(const ReadFunction& readSome) const
{
    std::array<unsigned char, MaxHeaderWidth> header{};
    readExactly(readSome, reinterpret_cast<char*>(header.data()), _headerWidth);

    const std::uint64_t length = parseBigEndian(header.data(), _headerWidth);
    if (length > _maxFrameSize)
        throw FrameTooLargeException(length, _maxFrameSize);

    std::string payload(static_cast<std::size_t>(length), '\0');
    readExactly(readSome, payload.data(), payload.size());

    if (!isValidUtf8(payload))
        throw EncodingException("Received frame of " + std::to_string(length) + " bytes is not valid UTF-8");

    return payload;
}
