#include "crashrelay/core/ManifestBuilder.hpp"

#include <limits>
#include <stdexcept>

namespace crashrelay {

ManifestBuilder::ManifestBuilder(const Digest& root_hash, std::uint64_t total_size, std::size_t chunk_count)
    : expected_(chunk_count) {
    if (chunk_count > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("chunk count exceeds manifest limit");
    }
    manifest_.root_hash = root_hash;
    manifest_.total_size = total_size;
    manifest_.chunk_count = static_cast<std::uint32_t>(chunk_count);
    manifest_.chunk_ids.reserve(chunk_count);
}

void ManifestBuilder::add_chunk(const std::string& chunk_id, const std::optional<std::string>& channel) {
    if (built_) {
        throw std::logic_error("manifest already built");
    }
    if (manifest_.chunk_ids.size() >= expected_) {
        throw std::logic_error("more chunks than declared");
    }

    manifest_.chunk_ids.push_back(chunk_id);
    if (channel) {
        manifest_.chunk_relays[chunk_id].push_back(*channel);
    }
}

std::vector<std::string> ManifestBuilder::lost_chunks() const {
    std::vector<std::string> lost;
    for (const auto& id : manifest_.chunk_ids) {
        if (manifest_.chunk_relays.find(id) == manifest_.chunk_relays.end()) {
            lost.push_back(id);
        }
    }
    return lost;
}

protocol::ManifestPayload ManifestBuilder::build() {
    if (built_) {
        throw std::logic_error("manifest already built");
    }
    if (!complete()) {
        throw std::logic_error("manifest is missing chunk records");
    }
    built_ = true;
    return manifest_;
}

}  // namespace crashrelay
