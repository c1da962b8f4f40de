#include "crashrelay/crypto/Sha256.hpp"

#include "crashrelay/Types.hpp"

#include <cassert>
#include <string>

int main() {
    using crashrelay::as_bytes;
    using crashrelay::digest_to_hex;
    using crashrelay::crypto::Sha256;

    assert(digest_to_hex(Sha256::digest(as_bytes(""))) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(digest_to_hex(Sha256::digest(as_bytes("abc"))) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(digest_to_hex(Sha256::digest(as_bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"))) ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    // Incremental updates match the one-shot digest.
    Sha256 hasher;
    hasher.update(as_bytes("ab"));
    hasher.update(as_bytes(""));
    hasher.update(as_bytes("c"));
    const auto incremental = hasher.finalize();
    assert(incremental == Sha256::digest(as_bytes("abc")));

    // finalize() resets, so the next message starts fresh.
    hasher.update(as_bytes("abc"));
    assert(hasher.finalize() == incremental);

    const std::string million(1'000'000, 'a');
    assert(digest_to_hex(Sha256::digest(as_bytes(million))) ==
           "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");

    const auto parsed = crashrelay::digest_from_hex(digest_to_hex(incremental));
    assert(parsed && *parsed == incremental);
    assert(!crashrelay::digest_from_hex("abc"));
    assert(!crashrelay::digest_from_hex(std::string(64, 'g')));

    return 0;
}
