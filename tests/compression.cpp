#include "crashrelay/protocol/Compression.hpp"
#include "crashrelay/protocol/Encoding.hpp"
#include "crashrelay/protocol/Json.hpp"

#include "test_support.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

namespace {

using namespace crashrelay;
using namespace crashrelay::protocol;

void test_gzip_roundtrip() {
    const auto text = test::patterned_text(64 * 1024, 3);
    const auto compressed = gzip_compress(as_bytes(text));
    assert(compressed.size() > 10);
    // gzip magic
    assert(compressed[0] == 0x1f && compressed[1] == 0x8b);

    const auto restored = gzip_decompress(compressed);
    assert(std::string(restored.begin(), restored.end()) == text);

    const auto empty = gzip_decompress(gzip_compress({}));
    assert(empty.empty());
}

void test_corrupt_streams() {
    const auto compressed = gzip_compress(as_bytes(std::string(4096, 'x')));

    Bytes truncated(compressed.begin(), compressed.begin() + compressed.size() / 2);
    bool truncated_rejected = false;
    try {
        (void)gzip_decompress(truncated);
    } catch (const std::invalid_argument&) {
        truncated_rejected = true;
    }
    assert(truncated_rejected);

    Bytes garbage{0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    bool garbage_rejected = false;
    try {
        (void)gzip_decompress(garbage);
    } catch (const std::invalid_argument&) {
        garbage_rejected = true;
    }
    assert(garbage_rejected);

    const std::string bad_envelope = R"({"v":1,"compression":"gzip","payload":"AAAAAAAA"})";
    bool envelope_rejected = false;
    try {
        (void)decompress_envelope(bad_envelope);
    } catch (const std::invalid_argument&) {
        envelope_rejected = true;
    }
    assert(envelope_rejected);

    const std::string bad_base64 = R"({"v":1,"compression":"gzip","payload":"not base64!"})";
    bool base64_rejected = false;
    try {
        (void)decompress_envelope(bad_base64);
    } catch (const std::invalid_argument&) {
        base64_rejected = true;
    }
    assert(base64_rejected);
}

void test_envelope() {
    const std::string small(1023, 'a');
    assert(!should_compress(small, kDefaultCompressionThreshold));
    assert(maybe_compress(small) == small);

    const std::string large(1024, 'a');
    assert(should_compress(large, kDefaultCompressionThreshold));
    const auto wrapped = maybe_compress(large);
    assert(wrapped != large);
    assert(wrapped.size() < large.size());

    const auto envelope = json::parse(wrapped);
    assert(json::require_integer(envelope, "v") == 1);
    assert(json::require_string(envelope, "compression") == "gzip");
    assert(!base64_decode(json::require_string(envelope, "payload")).empty());

    assert(decompress_envelope(wrapped) == large);
    assert(decompress_envelope(compress_envelope("{\"v\":1}")) == "{\"v\":1}");
}

void test_passthrough() {
    assert(decompress_envelope("plain text report") == "plain text report");
    assert(decompress_envelope("") == "");
    assert(decompress_envelope(R"({"v":1,"crash":{}})") == R"({"v":1,"crash":{}})");
    // Mentions compression but is not valid JSON.
    assert(decompress_envelope(R"({"compression": broken)") == R"({"compression": broken)");
    assert(decompress_envelope(R"({"compression":"zstd","payload":"AA=="})") ==
           R"({"compression":"zstd","payload":"AA=="})");
    // Not an envelope: the payload is not a string.
    assert(decompress_envelope(R"({"compression":"gzip","payload":42})") ==
           R"({"compression":"gzip","payload":42})");
}

}  // namespace

int main() {
    test_gzip_roundtrip();
    test_corrupt_streams();
    test_envelope();
    test_passthrough();
    return 0;
}
