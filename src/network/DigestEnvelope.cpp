#include "crashrelay/network/DigestEnvelope.hpp"

#include "crashrelay/Types.hpp"
#include "crashrelay/crypto/ChkCipher.hpp"
#include "crashrelay/crypto/Sha256.hpp"
#include "crashrelay/protocol/Json.hpp"

#include <array>
#include <stdexcept>

namespace crashrelay::network {

namespace json = protocol::json;

namespace {

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

json::Value tags_to_json(const std::vector<std::vector<std::string>>& tags) {
    auto array = json::Value::make_array();
    for (const auto& tag : tags) {
        auto entry = json::Value::make_array();
        for (const auto& item : tag) {
            entry.push_back(json::Value(item));
        }
        array.push_back(std::move(entry));
    }
    return array;
}

}  // namespace

DigestEnvelope::DigestEnvelope(std::chrono::seconds timestamp_jitter)
    : timestamp_jitter_(timestamp_jitter),
      rng_(std::random_device{}()) {}

TransportEvent DigestEnvelope::seal_and_wrap(const std::string& recipient_key,
                                             std::uint16_t kind,
                                             std::string_view content) {
    auto rumor = json::Value::make_object();
    rumor.set("kind", json::Value(static_cast<std::int64_t>(kind)));
    rumor.set("content", json::Value(std::string(content)));

    TransportEvent event;
    event.pubkey = fresh_pubkey();
    event.created_at = randomized_timestamp();
    event.kind = kWrapKind;
    event.tags.push_back({"p", recipient_key});
    event.content = json::serialize(rumor);
    event.id = compute_event_id(event);
    return event;
}

TransportEvent DigestEnvelope::build_public_event(std::uint16_t kind, std::string_view content) {
    TransportEvent event;
    event.pubkey = fresh_pubkey();
    event.created_at = unix_now();
    event.kind = kind;
    event.content = std::string(content);
    event.id = compute_event_id(event);
    return event;
}

DigestEnvelope::Unwrapped DigestEnvelope::unwrap(const TransportEvent& event) {
    if (event.kind != kWrapKind) {
        throw std::invalid_argument("event is not a wrapped envelope");
    }

    Unwrapped result;
    for (const auto& tag : event.tags) {
        if (tag.size() >= 2 && tag[0] == "p") {
            result.recipient = tag[1];
            break;
        }
    }

    const auto rumor = json::parse(event.content);
    const auto kind = json::require_integer(rumor, "kind");
    if (kind < 0 || kind > 0xFFFF) {
        throw std::invalid_argument("wrapped kind out of range");
    }
    result.kind = static_cast<std::uint16_t>(kind);
    result.content = json::require_string(rumor, "content");
    return result;
}

std::string DigestEnvelope::compute_event_id(const TransportEvent& event) {
    auto canonical = json::Value::make_array();
    canonical.push_back(json::Value(static_cast<std::int64_t>(0)));
    canonical.push_back(json::Value(event.pubkey));
    canonical.push_back(json::Value(static_cast<std::int64_t>(event.created_at)));
    canonical.push_back(json::Value(static_cast<std::int64_t>(event.kind)));
    canonical.push_back(tags_to_json(event.tags));
    canonical.push_back(json::Value(event.content));

    const auto serialized = json::serialize(canonical);
    return digest_to_hex(crypto::Sha256::digest(as_bytes(serialized)));
}

std::string DigestEnvelope::fresh_pubkey() {
    std::array<std::uint8_t, 32> key{};
    crypto::ChkCipher::random_bytes(key);
    return bytes_to_hex(key);
}

std::int64_t DigestEnvelope::randomized_timestamp() {
    const auto window = timestamp_jitter_.count();
    if (window <= 0) {
        return unix_now();
    }
    std::uniform_int_distribution<std::int64_t> offset(0, window);
    std::scoped_lock lock(rng_mutex_);
    return unix_now() - offset(rng_);
}

}  // namespace crashrelay::network
