#include "crashrelay/crypto/ChkCipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <climits>
#include <memory>
#include <stdexcept>

namespace crashrelay::crypto {

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* context) const noexcept { EVP_CIPHER_CTX_free(context); }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

CipherContext make_context() {
    CipherContext context(EVP_CIPHER_CTX_new());
    if (!context) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    return context;
}

int checked_length(std::size_t size) {
    if (size > static_cast<std::size_t>(INT_MAX - static_cast<int>(ChkCipher::kBlockSize))) {
        throw std::length_error("AES-CBC input too large");
    }
    return static_cast<int>(size);
}

}  // namespace

Bytes ChkCipher::encrypt(std::span<const std::uint8_t> plaintext, const Digest& key) {
    std::array<std::uint8_t, kIvSize> iv{};
    random_bytes(iv);

    auto context = make_context();
    if (EVP_EncryptInit_ex(context.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("AES-CBC encrypt init failed");
    }

    Bytes output(kIvSize + ciphertext_size(plaintext.size()));
    std::copy(iv.begin(), iv.end(), output.begin());

    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(context.get(), output.data() + kIvSize, &written, plaintext.data(),
                              checked_length(plaintext.size())) != 1) {
            throw std::runtime_error("AES-CBC encrypt failed");
        }
    }

    int final_written = 0;
    if (EVP_EncryptFinal_ex(context.get(), output.data() + kIvSize + written, &final_written) != 1) {
        throw std::runtime_error("AES-CBC encrypt final failed");
    }

    output.resize(kIvSize + static_cast<std::size_t>(written) + static_cast<std::size_t>(final_written));
    return output;
}

std::optional<Bytes> ChkCipher::decrypt(std::span<const std::uint8_t> data, const Digest& key) {
    if (data.size() < kIvSize + kBlockSize || (data.size() - kIvSize) % kBlockSize != 0) {
        return std::nullopt;
    }

    const auto iv = data.first(kIvSize);
    const auto ciphertext = data.subspan(kIvSize);

    auto context = make_context();
    if (EVP_DecryptInit_ex(context.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("AES-CBC decrypt init failed");
    }

    Bytes plaintext(ciphertext.size() + kBlockSize);
    int written = 0;
    if (EVP_DecryptUpdate(context.get(), plaintext.data(), &written, ciphertext.data(),
                          checked_length(ciphertext.size())) != 1) {
        return std::nullopt;
    }

    int final_written = 0;
    // Fails on malformed padding, which is how a wrong key usually surfaces.
    if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + written, &final_written) != 1) {
        return std::nullopt;
    }

    plaintext.resize(static_cast<std::size_t>(written) + static_cast<std::size_t>(final_written));
    return plaintext;
}

std::size_t ChkCipher::ciphertext_size(std::size_t plaintext_size) noexcept {
    return (plaintext_size / kBlockSize + 1) * kBlockSize;
}

void ChkCipher::random_bytes(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return;
    }
    if (RAND_bytes(buffer.data(), checked_length(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

}  // namespace crashrelay::crypto
