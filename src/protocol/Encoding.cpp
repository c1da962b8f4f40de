#include "crashrelay/protocol/Encoding.hpp"

#include <array>
#include <stdexcept>

namespace crashrelay::protocol {

namespace {

constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

std::string base64_encode(std::span<const std::uint8_t> input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size()) {
        const auto triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                            (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                            static_cast<std::uint32_t>(input[i + 2]);
        output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        output.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
        output.push_back(kBase64Alphabet[triple & 0x3F]);
        i += 3;
    }

    const auto remaining = input.size() - i;
    if (remaining == 0) {
        return output;
    }

    std::uint32_t triple = static_cast<std::uint32_t>(input[i]) << 16;
    if (remaining == 2) {
        triple |= static_cast<std::uint32_t>(input[i + 1]) << 8;
    }
    output.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
    output.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
    output.push_back(remaining == 2 ? kBase64Alphabet[(triple >> 6) & 0x3F] : '=');
    output.push_back('=');
    return output;
}

Bytes base64_decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("invalid base64 input length");
    }

    std::array<int, 256> decode{};
    decode.fill(-1);
    for (int i = 0; i < 64; ++i) {
        decode[static_cast<unsigned char>(kBase64Alphabet[i])] = i;
    }

    Bytes output;
    output.reserve((input.size() / 4) * 3);

    for (std::size_t i = 0; i < input.size(); i += 4) {
        const bool last_group = i + 4 == input.size();
        const bool pad_c = input[i + 2] == '=';
        const bool pad_d = input[i + 3] == '=';
        if ((pad_c || pad_d) && !last_group) {
            throw std::invalid_argument("base64 padding before end of input");
        }
        if (pad_c && !pad_d) {
            throw std::invalid_argument("invalid base64 padding");
        }

        const auto a = decode[static_cast<unsigned char>(input[i])];
        const auto b = decode[static_cast<unsigned char>(input[i + 1])];
        const auto c = pad_c ? 0 : decode[static_cast<unsigned char>(input[i + 2])];
        const auto d = pad_d ? 0 : decode[static_cast<unsigned char>(input[i + 3])];
        if (a < 0 || b < 0 || c < 0 || d < 0) {
            throw std::invalid_argument("invalid base64 character");
        }

        const auto triple = (a << 18) | (b << 12) | (c << 6) | d;
        output.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (!pad_c) {
            output.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (!pad_d) {
            output.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }

    return output;
}

}  // namespace crashrelay::protocol
