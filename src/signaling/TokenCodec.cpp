#include "TokenCodec.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

#include <openssl/evp.h>
#include <zlib.h>

using namespace pairchat::signaling;

namespace {

// windowBits + 16 selects the gzip wrapper in zlib.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 9;
constexpr std::size_t kChunkSize = 16 * 1024;
constexpr double kCompressionRatio = 0.75;

bool isUrlSafeBase64(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

auto deflateText(std::string_view text) -> std::expected<std::vector<unsigned char>, CodecError> {
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                     Z_DEFAULT_STRATEGY) != Z_OK)
        return std::unexpected(CodecError::CompressionFailed);

    std::vector<unsigned char> out(deflateBound(&stream, static_cast<uLong>(text.size())));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    stream.avail_in = static_cast<uInt>(text.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    deflateEnd(&stream);

    if (rc != Z_STREAM_END)
        return std::unexpected(CodecError::CompressionFailed);
    out.resize(produced);
    return out;
}

auto inflateText(const std::vector<unsigned char>& compressed) -> std::expected<std::string, CodecError> {
    z_stream stream{};
    if (inflateInit2(&stream, kGzipWindowBits) != Z_OK)
        return std::unexpected(CodecError::CorruptPayload);

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::string text;
    unsigned char chunk[kChunkSize];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = chunk;
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::unexpected(CodecError::CorruptPayload);
        }

        const std::size_t produced = sizeof(chunk) - stream.avail_out;
        if (text.size() + produced > kMaxPayloadSize) {
            inflateEnd(&stream);
            return std::unexpected(CodecError::OversizedPayload);
        }
        text.append(reinterpret_cast<const char*>(chunk), produced);

        // Truncated stream: input exhausted without reaching the end marker.
        if (rc == Z_OK && stream.avail_in == 0 && produced == 0) {
            inflateEnd(&stream);
            return std::unexpected(CodecError::CorruptPayload);
        }
    }
    inflateEnd(&stream);
    return text;
}

std::string toBase64Url(const std::vector<unsigned char>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                              static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(std::max(len, 0)));

    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    while (!out.empty() && out.back() == '=')
        out.pop_back();
    return out;
}

auto fromBase64Url(std::string_view token) -> std::expected<std::vector<unsigned char>, CodecError> {
    std::string padded(token);
    std::replace(padded.begin(), padded.end(), '-', '+');
    std::replace(padded.begin(), padded.end(), '_', '/');

    std::size_t padding = 0;
    switch (padded.size() % 4) {
        case 2: padding = 2; break;
        case 3: padding = 1; break;
        case 1: return std::unexpected(CodecError::InvalidEncoding);
        default: break;
    }
    padded.append(padding, '=');

    std::vector<unsigned char> out(3 * (padded.size() / 4));
    int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                              static_cast<int>(padded.size()));
    if (len < 0 || static_cast<std::size_t>(len) < padding)
        return std::unexpected(CodecError::InvalidEncoding);

    // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
    out.resize(static_cast<std::size_t>(len) - padding);
    return out;
}

// Accepts printable ASCII, tab, CR, LF and any well-formed non-ASCII code point.
bool isPrintableText(std::string_view text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();
    while (p < end) {
        const unsigned char lead = *p;
        if (lead < 0x80) {
            if ((lead < 0x20 || lead == 0x7F) && lead != '\t' && lead != '\n' && lead != '\r')
                return false;
            ++p;
            continue;
        }

        std::size_t extra;
        std::uint32_t cp;
        if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; }
        else return false;

        if (static_cast<std::size_t>(end - p) <= extra)
            return false;
        for (std::size_t i = 1; i <= extra; ++i) {
            if ((p[i] & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (p[i] & 0x3F);
        }

        constexpr std::uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        p += extra + 1;
    }
    return true;
}

}

std::string_view pairchat::signaling::toString(CodecError error) {
    switch (error) {
        case CodecError::EmptyInput:        return "input is empty";
        case CodecError::TooLarge:          return "text exceeds the 4 MiB limit";
        case CodecError::TooShort:          return "token is too short to be valid";
        case CodecError::InvalidAlphabet:   return "token contains characters outside the URL-safe base64 alphabet";
        case CodecError::InvalidEncoding:   return "token is not valid base64";
        case CodecError::CompressionFailed: return "compression failed";
        case CodecError::CorruptPayload:    return "token payload could not be decompressed";
        case CodecError::OversizedPayload:  return "decompressed text exceeds the 4 MiB limit";
        case CodecError::NonPrintable:      return "decoded text contains non-printable characters";
    }
    return "unknown codec error";
}

auto pairchat::signaling::encode(std::string_view text) -> std::expected<std::string, CodecError> {
    if (text.empty())
        return std::unexpected(CodecError::EmptyInput);
    if (text.size() > kMaxPayloadSize)
        return std::unexpected(CodecError::TooLarge);

    auto compressed = deflateText(text);
    if (!compressed)
        return std::unexpected(compressed.error());
    return toBase64Url(*compressed);
}

auto pairchat::signaling::decode(std::string_view token) -> std::expected<std::string, CodecError> {
    if (token.empty())
        return std::unexpected(CodecError::EmptyInput);
    if (token.size() < kMinTokenLength)
        return std::unexpected(CodecError::TooShort);
    if (!std::all_of(token.begin(), token.end(), isUrlSafeBase64))
        return std::unexpected(CodecError::InvalidAlphabet);

    auto compressed = fromBase64Url(token);
    if (!compressed)
        return std::unexpected(compressed.error());

    auto text = inflateText(*compressed);
    if (!text)
        return std::unexpected(text.error());
    if (!isPrintableText(*text))
        return std::unexpected(CodecError::NonPrintable);
    return text;
}

std::size_t pairchat::signaling::estimateEncodedSize(std::size_t textLength) {
    return static_cast<std::size_t>(static_cast<double>(textLength) * kCompressionRatio);
}
