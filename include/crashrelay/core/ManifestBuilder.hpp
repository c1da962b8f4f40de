#pragma once

#include "crashrelay/Types.hpp"
#include "crashrelay/protocol/Wire.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace crashrelay {

// Collects chunk ids in publish order together with the channel that
// confirmed each one, and produces the manifest once every chunk has been
// attempted.
class ManifestBuilder {
public:
    ManifestBuilder(const Digest& root_hash, std::uint64_t total_size, std::size_t chunk_count);

    // `channel` is empty for a chunk that no channel confirmed.
    void add_chunk(const std::string& chunk_id, const std::optional<std::string>& channel);

    std::size_t recorded() const noexcept { return manifest_.chunk_ids.size(); }
    [[nodiscard]] bool complete() const noexcept { return recorded() == expected_; }
    std::vector<std::string> lost_chunks() const;

    // Throws std::logic_error if chunks are missing or build() already ran.
    protocol::ManifestPayload build();

private:
    protocol::ManifestPayload manifest_;
    std::size_t expected_{0};
    bool built_{false};
};

}  // namespace crashrelay
