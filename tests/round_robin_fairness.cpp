#include "crashrelay/core/DeliveryContext.hpp"
#include "crashrelay/core/Dispatcher.hpp"
#include "crashrelay/core/Distributor.hpp"
#include "crashrelay/network/DigestEnvelope.hpp"
#include "crashrelay/network/MemoryRelay.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <memory>

namespace {

using namespace std::chrono_literals;
using namespace crashrelay;

void test_start_index() {
    assert(Distributor::start_index(0, 3) == 0);
    assert(Distributor::start_index(4, 3) == 1);
    assert(Distributor::start_index(5, 3) == 2);
    assert(Distributor::start_index(7, 0) == 0);
}

void check_fairness(std::size_t chunk_count, std::size_t channel_count) {
    auto config = test::fast_config(channel_count);
    config.direct_size_threshold = 64;
    config.max_chunk_size = 64;
    config.compression_threshold = 1u << 30;

    auto network = std::make_shared<network::MemoryRelayNetwork>(config.channels);
    auto context = std::make_shared<DeliveryContext>(config, network, std::make_shared<network::DigestEnvelope>());
    Dispatcher dispatcher(context);

    // Exactly chunk_count full windows.
    const auto content = test::patterned_text(chunk_count * config.max_chunk_size, 11);
    const auto report = dispatcher.send("recipient", content);
    assert(report.status.ok());
    assert(report.chunk_count == chunk_count);
    assert(report.chunks_delivered == chunk_count);

    const auto low = chunk_count / channel_count;
    const auto high = (chunk_count + channel_count - 1) / channel_count;
    std::size_t total = 0;
    for (const auto& url : config.channels) {
        const auto hosted = network->relay(url)->events_of_kind(protocol::kKindChunk).size();
        assert(hosted == low || hosted == high);
        total += hosted;
    }
    assert(total == chunk_count);

    // Chunk i starts on channel i % R.
    const auto& manifest = *report.manifest;
    for (std::size_t i = 0; i < manifest.chunk_ids.size(); ++i) {
        const auto& hosts = manifest.chunk_relays.at(manifest.chunk_ids[i]);
        assert(hosts.size() == 1);
        assert(hosts.front() == config.channels[i % channel_count]);
    }
}

void test_rate_limited_channels_pace_round_robin() {
    auto config = test::fast_config(2);
    config.default_rate_interval = 100ms;
    config.direct_size_threshold = 32;
    config.max_chunk_size = 32;
    config.compression_threshold = 1u << 30;

    auto network = std::make_shared<network::MemoryRelayNetwork>(config.channels);
    auto context = std::make_shared<DeliveryContext>(config, network, std::make_shared<network::DigestEnvelope>());
    Dispatcher dispatcher(context);

    // Four chunks over two channels: each channel publishes twice, plus the
    // manifest on channel 0.
    const auto start = std::chrono::steady_clock::now();
    const auto report = dispatcher.send("recipient", test::patterned_text(4 * 32, 5));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    assert(report.status.ok());
    assert(report.chunk_count == 4);
    // Channel 0 carries chunks 0, 2 and the manifest: two waits.
    assert(elapsed >= 200ms);
}

}  // namespace

int main() {
    test_start_index();
    check_fairness(9, 3);
    check_fairness(10, 3);
    check_fairness(7, 4);
    check_fairness(2, 5);
    test_rate_limited_channels_pace_round_robin();
    return 0;
}
