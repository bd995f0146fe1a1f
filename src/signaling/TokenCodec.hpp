#pragma once
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace pairchat::signaling {

// Upper bound for descriptor text, both before encoding and after inflating.
inline constexpr std::size_t kMaxPayloadSize = 4 * 1024 * 1024;

// Anything shorter cannot be a gzip stream in base64 form.
inline constexpr std::size_t kMinTokenLength = 10;

enum class CodecError {
    EmptyInput,
    TooLarge,
    TooShort,
    InvalidAlphabet,
    InvalidEncoding,
    CompressionFailed,
    CorruptPayload,
    OversizedPayload,
    NonPrintable
};

std::string_view toString(CodecError error);

// Deflates text (gzip framing, best compression) and renders it as unpadded
// URL-safe base64.
auto encode(std::string_view text) -> std::expected<std::string, CodecError>;

// Reverses encode(). The token must be trimmed by the caller.
auto decode(std::string_view token) -> std::expected<std::string, CodecError>;

std::size_t estimateEncodedSize(std::size_t textLength);

}
