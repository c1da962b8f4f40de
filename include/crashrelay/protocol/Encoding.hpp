#pragma once

#include "crashrelay/Types.hpp"

#include <span>
#include <string>
#include <string_view>

namespace crashrelay::protocol {

// Standard alphabet, padded. Decoding throws std::invalid_argument.
std::string base64_encode(std::span<const std::uint8_t> input);
Bytes base64_decode(std::string_view input);

}  // namespace crashrelay::protocol
