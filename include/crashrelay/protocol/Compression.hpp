#pragma once

#include "crashrelay/Types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace crashrelay::protocol {

constexpr std::size_t kDefaultCompressionThreshold = 1024;

// gzip (RFC 1952) with zlib's default level.
Bytes gzip_compress(std::span<const std::uint8_t> input);
// Throws std::invalid_argument on corrupt or truncated streams.
Bytes gzip_decompress(std::span<const std::uint8_t> input);

// {"v":1,"compression":"gzip","payload":"<base64 gzip>"}
std::string compress_envelope(std::string_view plaintext);

bool should_compress(std::string_view plaintext, std::size_t threshold) noexcept;

// Wraps plaintext in the envelope only when it reaches `threshold` bytes.
std::string maybe_compress(std::string_view plaintext, std::size_t threshold = kDefaultCompressionThreshold);

// Accepts an envelope or raw text. Text that is not a well-formed gzip
// envelope is returned unchanged; a well-formed envelope with a corrupt
// payload throws std::invalid_argument.
std::string decompress_envelope(std::string_view text);

}  // namespace crashrelay::protocol
