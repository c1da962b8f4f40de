#include "crashrelay/core/Chunker.hpp"

#include "crashrelay/crypto/ChkCipher.hpp"
#include "crashrelay/crypto/Sha256.hpp"

#include <algorithm>

namespace crashrelay {

std::size_t expected_chunk_count(std::size_t total_size, std::size_t max_chunk_size) noexcept {
    if (max_chunk_size == 0) {
        return 0;
    }
    return (total_size + max_chunk_size - 1) / max_chunk_size;
}

ChunkingResult chunk_payload(std::span<const std::uint8_t> data, std::size_t max_chunk_size) {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("max_chunk_size must be positive");
    }

    ChunkingResult result;
    result.total_size = data.size();
    result.chunks.reserve(expected_chunk_count(data.size(), max_chunk_size));

    std::size_t offset = 0;
    std::uint32_t index = 0;
    while (offset < data.size()) {
        const auto length = std::min(max_chunk_size, data.size() - offset);
        const auto window = data.subspan(offset, length);

        Chunk chunk;
        chunk.index = index++;
        chunk.hash = crypto::Sha256::digest(window);
        chunk.ciphertext = crypto::ChkCipher::encrypt(window, chunk.hash);
        result.chunks.push_back(std::move(chunk));

        offset += length;
    }

    result.root_hash = compute_root_hash(result.chunks);
    return result;
}

Digest compute_root_hash(std::span<const Chunk> chunks) {
    crypto::Sha256 hasher;
    for (const auto& chunk : chunks) {
        hasher.update(chunk.hash);
    }
    return hasher.finalize();
}

std::optional<Bytes> decrypt_chunk(const Chunk& chunk) {
    auto plaintext = crypto::ChkCipher::decrypt(chunk.ciphertext, chunk.hash);
    if (!plaintext) {
        return std::nullopt;
    }
    if (crypto::Sha256::digest(*plaintext) != chunk.hash) {
        return std::nullopt;
    }
    return plaintext;
}

Bytes reassemble_payload(const Digest& root_hash, std::vector<Chunk> chunks) {
    std::sort(chunks.begin(), chunks.end(), [](const Chunk& lhs, const Chunk& rhs) {
        return lhs.index < rhs.index;
    });

    for (std::size_t position = 0; position < chunks.size(); ++position) {
        if (chunks[position].index != position) {
            throw ReassemblyError("missing chunk at index " + std::to_string(position));
        }
    }

    if (compute_root_hash(chunks) != root_hash) {
        throw ReassemblyError("root hash mismatch");
    }

    Bytes payload;
    for (const auto& chunk : chunks) {
        const auto plaintext = decrypt_chunk(chunk);
        if (!plaintext) {
            throw ReassemblyError("chunk " + std::to_string(chunk.index) + " failed to decrypt");
        }
        payload.insert(payload.end(), plaintext->begin(), plaintext->end());
    }
    return payload;
}

Bytes reassemble_payload(const protocol::ManifestPayload& manifest, std::vector<Chunk> chunks) {
    if (chunks.size() != manifest.chunk_count) {
        throw ReassemblyError("expected " + std::to_string(manifest.chunk_count) + " chunks, got " +
                              std::to_string(chunks.size()));
    }
    auto payload = reassemble_payload(manifest.root_hash, std::move(chunks));
    if (payload.size() != manifest.total_size) {
        throw ReassemblyError("reassembled size does not match manifest total_size");
    }
    return payload;
}

protocol::ChunkPayload to_wire(const Chunk& chunk) {
    return protocol::ChunkPayload{chunk.index, chunk.hash, chunk.ciphertext};
}

Chunk from_wire(const protocol::ChunkPayload& payload) {
    return Chunk{payload.index, payload.hash, payload.data};
}

}  // namespace crashrelay
