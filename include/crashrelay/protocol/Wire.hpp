#pragma once

#include "crashrelay/Types.hpp"
#include "crashrelay/core/Payload.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace crashrelay::protocol {

constexpr std::uint16_t kKindDirect = 10420;
constexpr std::uint16_t kKindManifest = 10421;
constexpr std::uint16_t kKindChunk = 10422;

// Legacy private direct message kind still accepted by receivers.
constexpr std::uint16_t kKindLegacyDirectMessage = 14;

constexpr std::int64_t kWireVersion = 1;

enum class TransportKind {
    Direct,
    Chunked
};

TransportKind transport_kind_for_size(std::size_t size, std::size_t direct_threshold);
std::uint16_t event_kind_for(TransportKind kind) noexcept;

bool is_crash_report_kind(std::uint16_t kind) noexcept;
bool is_chunked_kind(std::uint16_t kind) noexcept;

// Published openly as kind 10422.
struct ChunkPayload {
    std::uint32_t index{0};
    Digest hash{};
    Bytes data;
};

// Delivered only inside the secure envelope as kind 10421.
struct ManifestPayload {
    Digest root_hash{};
    std::uint64_t total_size{0};
    std::uint32_t chunk_count{0};
    std::vector<std::string> chunk_ids;
    // Chunk event id -> channels confirmed to host it. Lost chunks have no entry.
    std::map<std::string, std::vector<std::string>> chunk_relays;
};

std::string encode_chunk_payload(const ChunkPayload& chunk);
ChunkPayload decode_chunk_payload(std::string_view text);

std::string encode_manifest_payload(const ManifestPayload& manifest);
ManifestPayload decode_manifest_payload(std::string_view text);

// {"v":1,"crash":{...}}
std::string encode_direct_payload(const Payload& payload);
Payload decode_direct_payload(std::string_view text);

}  // namespace crashrelay::protocol
