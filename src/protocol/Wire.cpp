#include "crashrelay/protocol/Wire.hpp"

#include "crashrelay/protocol/Encoding.hpp"
#include "crashrelay/protocol/Json.hpp"

#include <limits>
#include <stdexcept>

namespace crashrelay::protocol {

namespace {

void check_version(const json::Value& object) {
    const auto version = json::require_integer(object, "v");
    if (version != kWireVersion) {
        throw std::invalid_argument("unsupported payload version " + std::to_string(version));
    }
}

Digest require_digest(const json::Value& object, std::string_view key) {
    const auto text = json::require_string(object, key);
    const auto digest = digest_from_hex(text);
    if (!digest) {
        throw std::invalid_argument("field '" + std::string(key) + "' must be a 64 character hex digest");
    }
    return *digest;
}

template <typename T>
T require_unsigned(const json::Value& object, std::string_view key) {
    const auto value = json::require_integer(object, key);
    if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw std::invalid_argument("field '" + std::string(key) + "' out of range");
    }
    return static_cast<T>(value);
}

std::vector<std::string> require_string_array(const json::Value& value, std::string_view key) {
    if (!value.is_array()) {
        throw std::invalid_argument("field '" + std::string(key) + "' must be an array");
    }
    std::vector<std::string> items;
    items.reserve(value.as_array().size());
    for (const auto& element : value.as_array()) {
        if (!element.is_string()) {
            throw std::invalid_argument("field '" + std::string(key) + "' must contain strings");
        }
        items.push_back(element.string_value);
    }
    return items;
}

json::Value string_array(const std::vector<std::string>& items) {
    auto array = json::Value::make_array();
    for (const auto& item : items) {
        array.push_back(json::Value(item));
    }
    return array;
}

}  // namespace

TransportKind transport_kind_for_size(std::size_t size, std::size_t direct_threshold) {
    return size <= direct_threshold ? TransportKind::Direct : TransportKind::Chunked;
}

std::uint16_t event_kind_for(TransportKind kind) noexcept {
    return kind == TransportKind::Direct ? kKindDirect : kKindManifest;
}

bool is_crash_report_kind(std::uint16_t kind) noexcept {
    return kind == kKindLegacyDirectMessage || kind == kKindDirect || kind == kKindManifest;
}

bool is_chunked_kind(std::uint16_t kind) noexcept {
    return kind == kKindManifest;
}

std::string encode_chunk_payload(const ChunkPayload& chunk) {
    auto object = json::Value::make_object();
    object.set("v", json::Value(kWireVersion));
    object.set("index", json::Value(static_cast<std::int64_t>(chunk.index)));
    object.set("hash", json::Value(digest_to_hex(chunk.hash)));
    object.set("data", json::Value(base64_encode(chunk.data)));
    return json::serialize(object);
}

ChunkPayload decode_chunk_payload(std::string_view text) {
    const auto object = json::parse(text);
    check_version(object);

    ChunkPayload chunk;
    chunk.index = require_unsigned<std::uint32_t>(object, "index");
    chunk.hash = require_digest(object, "hash");
    chunk.data = base64_decode(json::require_string(object, "data"));
    return chunk;
}

std::string encode_manifest_payload(const ManifestPayload& manifest) {
    auto object = json::Value::make_object();
    object.set("v", json::Value(kWireVersion));
    object.set("root_hash", json::Value(digest_to_hex(manifest.root_hash)));
    object.set("total_size", json::Value(static_cast<std::int64_t>(manifest.total_size)));
    object.set("chunk_count", json::Value(static_cast<std::int64_t>(manifest.chunk_count)));
    object.set("chunk_ids", string_array(manifest.chunk_ids));
    if (!manifest.chunk_relays.empty()) {
        auto relays = json::Value::make_object();
        for (const auto& [chunk_id, channels] : manifest.chunk_relays) {
            relays.set(chunk_id, string_array(channels));
        }
        object.set("chunk_relays", std::move(relays));
    }
    return json::serialize(object);
}

ManifestPayload decode_manifest_payload(std::string_view text) {
    const auto object = json::parse(text);
    check_version(object);

    ManifestPayload manifest;
    manifest.root_hash = require_digest(object, "root_hash");
    manifest.total_size = require_unsigned<std::uint64_t>(object, "total_size");
    manifest.chunk_count = require_unsigned<std::uint32_t>(object, "chunk_count");
    manifest.chunk_ids = require_string_array(json::require(object, "chunk_ids"), "chunk_ids");
    if (manifest.chunk_ids.size() != manifest.chunk_count) {
        throw std::invalid_argument("chunk_ids length does not match chunk_count");
    }

    if (const auto* relays = object.find("chunk_relays"); relays && !relays->is_null()) {
        if (!relays->is_object()) {
            throw std::invalid_argument("field 'chunk_relays' must be an object");
        }
        for (const auto& [chunk_id, channels] : relays->as_object()) {
            manifest.chunk_relays.emplace(chunk_id, require_string_array(channels, "chunk_relays"));
        }
    }
    return manifest;
}

std::string encode_direct_payload(const Payload& payload) {
    auto object = json::Value::make_object();
    object.set("v", json::Value(kWireVersion));
    object.set("crash", payload.to_json());
    return json::serialize(object);
}

Payload decode_direct_payload(std::string_view text) {
    const auto object = json::parse(text);
    check_version(object);
    return Payload::from_json(json::require(object, "crash"));
}

}  // namespace crashrelay::protocol
