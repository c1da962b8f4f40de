#pragma once

#include "crashrelay/Types.hpp"

#include <cstddef>
#include <optional>
#include <span>

namespace crashrelay::crypto {

// Content-hash-key encryption: AES-256-CBC with PKCS#7 padding, keyed by the
// SHA-256 of the plaintext. Output layout is [16-byte IV][ciphertext].
class ChkCipher {
public:
    static constexpr std::size_t kIvSize = 16;
    static constexpr std::size_t kBlockSize = 16;

    static Bytes encrypt(std::span<const std::uint8_t> plaintext, const Digest& key);
    static std::optional<Bytes> decrypt(std::span<const std::uint8_t> data, const Digest& key);

    static std::size_t ciphertext_size(std::size_t plaintext_size) noexcept;

    // CSPRNG bytes from OpenSSL; throws when the generator is unavailable.
    static void random_bytes(std::span<std::uint8_t> buffer);
};

}  // namespace crashrelay::crypto
