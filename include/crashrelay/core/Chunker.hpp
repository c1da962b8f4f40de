#pragma once

#include "crashrelay/Types.hpp"
#include "crashrelay/protocol/Wire.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace crashrelay {

// One CHK-encrypted window of the payload. `hash` is SHA-256 of the
// plaintext window and is also its AES-256 key.
struct Chunk {
    std::uint32_t index{0};
    Digest hash{};
    Bytes ciphertext;
};

struct ChunkingResult {
    // SHA-256 over the chunk hashes concatenated in index order.
    Digest root_hash{};
    std::uint64_t total_size{0};
    std::vector<Chunk> chunks;
};

class ReassemblyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::size_t expected_chunk_count(std::size_t total_size, std::size_t max_chunk_size) noexcept;

// Throws std::invalid_argument when max_chunk_size is zero. An empty buffer
// yields no chunks and the root hash of the empty hash list.
ChunkingResult chunk_payload(std::span<const std::uint8_t> data, std::size_t max_chunk_size);

Digest compute_root_hash(std::span<const Chunk> chunks);

// nullopt when the ciphertext is malformed or does not decrypt to content
// whose hash matches chunk.hash.
std::optional<Bytes> decrypt_chunk(const Chunk& chunk);

// Orders chunks by index, checks completeness, the root hash and every
// chunk hash, then concatenates the plaintext. Throws ReassemblyError.
Bytes reassemble_payload(const Digest& root_hash, std::vector<Chunk> chunks);
Bytes reassemble_payload(const protocol::ManifestPayload& manifest, std::vector<Chunk> chunks);

protocol::ChunkPayload to_wire(const Chunk& chunk);
Chunk from_wire(const protocol::ChunkPayload& payload);

}  // namespace crashrelay
