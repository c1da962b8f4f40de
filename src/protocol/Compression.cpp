#include "crashrelay/protocol/Compression.hpp"

#include "crashrelay/protocol/Encoding.hpp"
#include "crashrelay/protocol/Json.hpp"

#include <zlib.h>

#include <climits>
#include <stdexcept>

namespace crashrelay::protocol {

namespace {

constexpr int kGzipWindowBits = 15 + 16;
// 15 + 32 lets inflate detect gzip or zlib headers.
constexpr int kAutoDetectWindowBits = 15 + 32;
constexpr std::size_t kInflateChunk = 16 * 1024;
constexpr char kCompressionType[] = "gzip";

class DeflateStream {
public:
    DeflateStream() {
        if (deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
    }
    ~DeflateStream() { deflateEnd(&stream_); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    z_stream* get() noexcept { return &stream_; }

private:
    z_stream stream_{};
};

class InflateStream {
public:
    InflateStream() {
        if (inflateInit2(&stream_, kAutoDetectWindowBits) != Z_OK) {
            throw std::runtime_error("inflateInit2 failed");
        }
    }
    ~InflateStream() { inflateEnd(&stream_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() noexcept { return &stream_; }

private:
    z_stream stream_{};
};

uInt checked_size(std::size_t size) {
    if (size > UINT_MAX) {
        throw std::length_error("compression input too large");
    }
    return static_cast<uInt>(size);
}

}  // namespace

Bytes gzip_compress(std::span<const std::uint8_t> input) {
    DeflateStream deflate;
    auto* stream = deflate.get();

    Bytes output(deflateBound(stream, static_cast<uLong>(input.size())));
    stream->next_in = const_cast<Bytef*>(input.data());
    stream->avail_in = checked_size(input.size());
    stream->next_out = output.data();
    stream->avail_out = checked_size(output.size());

    if (::deflate(stream, Z_FINISH) != Z_STREAM_END) {
        throw std::runtime_error("gzip compression did not complete");
    }
    output.resize(static_cast<std::size_t>(stream->total_out));
    return output;
}

Bytes gzip_decompress(std::span<const std::uint8_t> input) {
    InflateStream inflate;
    auto* stream = inflate.get();
    stream->next_in = const_cast<Bytef*>(input.data());
    stream->avail_in = checked_size(input.size());

    Bytes output;
    int result = Z_OK;
    while (result != Z_STREAM_END) {
        const auto offset = output.size();
        output.resize(offset + kInflateChunk);
        stream->next_out = output.data() + offset;
        stream->avail_out = static_cast<uInt>(kInflateChunk);

        result = ::inflate(stream, Z_NO_FLUSH);
        output.resize(offset + (kInflateChunk - stream->avail_out));

        if (result == Z_STREAM_END) {
            break;
        }
        if (result != Z_OK) {
            throw std::invalid_argument("corrupt gzip stream");
        }
        if (stream->avail_in == 0 && stream->avail_out != 0) {
            throw std::invalid_argument("truncated gzip stream");
        }
    }
    return output;
}

std::string compress_envelope(std::string_view plaintext) {
    const auto compressed = gzip_compress(as_bytes(plaintext));

    auto envelope = json::Value::make_object();
    envelope.set("v", json::Value(static_cast<std::int64_t>(1)));
    envelope.set("compression", json::Value(kCompressionType));
    envelope.set("payload", json::Value(base64_encode(compressed)));
    return json::serialize(envelope);
}

bool should_compress(std::string_view plaintext, std::size_t threshold) noexcept {
    return plaintext.size() >= threshold;
}

std::string maybe_compress(std::string_view plaintext, std::size_t threshold) {
    if (!should_compress(plaintext, threshold)) {
        return std::string(plaintext);
    }
    return compress_envelope(plaintext);
}

std::string decompress_envelope(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos || text[first] != '{' ||
        text.find("\"compression\"") == std::string_view::npos) {
        return std::string(text);
    }

    json::Value envelope;
    try {
        envelope = json::parse(text);
    } catch (const json::ParseError&) {
        return std::string(text);
    }

    const auto* compression = envelope.find("compression");
    const auto* payload = envelope.find("payload");
    if (!compression || !compression->is_string() || compression->string_value != kCompressionType ||
        !payload || !payload->is_string()) {
        return std::string(text);
    }

    const auto decompressed = gzip_decompress(base64_decode(payload->string_value));
    return std::string(decompressed.begin(), decompressed.end());
}

}  // namespace crashrelay::protocol
