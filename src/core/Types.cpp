#include "crashrelay/Types.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

namespace crashrelay {

namespace {

std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

int hex_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

}  // namespace

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    std::string text;
    text.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        text += to_hex(byte);
    }
    return text;
}

std::string digest_to_hex(const Digest& digest) {
    return bytes_to_hex(std::span<const std::uint8_t>(digest.data(), digest.size()));
}

std::optional<Digest> digest_from_hex(std::string_view text) {
    if (text.size() != Digest{}.size() * 2) {
        return std::nullopt;
    }

    Digest digest{};
    for (std::size_t index = 0; index < digest.size(); ++index) {
        const auto high = hex_value(text[index * 2]);
        const auto low = hex_value(text[index * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        digest[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return digest;
}

}  // namespace crashrelay
