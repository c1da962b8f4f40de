#include "crashrelay/crypto/Sha256.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace crashrelay::crypto {

namespace {

EVP_MD_CTX* as_context(void* handle) noexcept {
    return static_cast<EVP_MD_CTX*>(handle);
}

}  // namespace

void Sha256::ContextDeleter::operator()(void* context) const noexcept {
    EVP_MD_CTX_free(as_context(context));
}

Sha256::Sha256()
    : context_(EVP_MD_CTX_new()) {
    if (!context_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::update(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(as_context(context_.get()), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Digest Sha256::finalize() {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(as_context(context_.get()), out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    if (out_len != Digest{}.size()) {
        throw std::runtime_error("unexpected SHA-256 digest length");
    }

    Digest digest{};
    std::copy(out, out + out_len, digest.begin());
    reset();
    return digest;
}

Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

void Sha256::reset() {
    if (EVP_DigestInit_ex(as_context(context_.get()), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

}  // namespace crashrelay::crypto
