#include "crashrelay/core/Reporter.hpp"
#include "crashrelay/network/DigestEnvelope.hpp"
#include "crashrelay/network/MemoryRelay.hpp"
#include "crashrelay/protocol/Compression.hpp"
#include "crashrelay/protocol/Wire.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace crashrelay;

struct Fixture {
    explicit Fixture(Config config_in, ReporterHooks hooks = {})
        : config(std::move(config_in)),
          network(std::make_shared<network::MemoryRelayNetwork>(config.channels)),
          reporter(config, "recipient-key", network, std::make_shared<network::DigestEnvelope>(), std::move(hooks)) {}

    // Every report the recipient could decode, in relay order.
    std::vector<Payload> received() const {
        std::vector<Payload> payloads;
        for (const auto& url : network->urls()) {
            for (const auto& event : network->relay(url)->events_of_kind(network::DigestEnvelope::kWrapKind)) {
                const auto inner = network::DigestEnvelope::unwrap(event);
                if (inner.kind == protocol::kKindDirect) {
                    payloads.push_back(
                        protocol::decode_direct_payload(protocol::decompress_envelope(inner.content)));
                }
            }
        }
        return payloads;
    }

    Config config;
    std::shared_ptr<network::MemoryRelayNetwork> network;
    Reporter reporter;
};

void test_environment_from_config() {
    auto config = test::fast_config(1);
    config.environment = "production";
    config.release = "3.1.4";
    Fixture fixture(config);

    auto payload = Payload::now("NullPointerException", std::string("at A\nat B"));
    const auto report = fixture.reporter.send_now(payload);
    assert(report.status.ok());
    assert(fixture.reporter.reports_sent() == 1);

    const auto received = fixture.received();
    assert(received.size() == 1);
    assert(received[0].message == "NullPointerException");
    assert(received[0].environment == std::string("production"));
    assert(received[0].release == std::string("3.1.4"));
    assert(received[0].stack == payload.stack);

    // An explicit value on the payload wins.
    auto staged = Payload::now("second");
    staged.environment = "staging";
    assert(fixture.reporter.send_now(staged).status.ok());
    assert(fixture.received().size() == 2);
}

void test_before_send_can_edit_and_drop() {
    ReporterHooks hooks;
    hooks.before_send = [](Payload payload) -> std::optional<Payload> {
        if (payload.message.find("ignore") != std::string::npos) {
            return std::nullopt;
        }
        payload.device_info["scrubbed"] = "true";
        payload.stack.reset();
        return payload;
    };
    Fixture fixture(test::fast_config(1), hooks);

    const auto dropped = fixture.reporter.send_now(Payload::now("please ignore me"));
    assert(dropped.status.code == ErrorCode::Dropped);
    assert(fixture.network->relay("mem://relay-0")->publish_attempts() == 0);

    assert(fixture.reporter.send_now(Payload::now("keep", std::string("secret frame"))).status.ok());
    const auto received = fixture.received();
    assert(received.size() == 1);
    assert(received[0].device_info.at("scrubbed") == "true");
    assert(!received[0].stack);
    assert(fixture.reporter.reports_sent() == 1);
}

void test_confirm_send_sees_preview() {
    std::string seen_message;
    std::string seen_preview;
    bool allow = false;
    ReporterHooks hooks;
    hooks.confirm_send = [&](const std::string& message, const std::string& preview) {
        seen_message = message;
        seen_preview = preview;
        return allow;
    };
    Fixture fixture(test::fast_config(1), hooks);

    const auto payload = Payload::now("crash", std::string("frame 1\nframe 2\nframe 3\nframe 4"));
    assert(fixture.reporter.send_now(payload).status.code == ErrorCode::Dropped);
    assert(seen_message == "crash");
    assert(seen_preview == "frame 1\nframe 2\nframe 3");
    assert(fixture.received().empty());

    allow = true;
    assert(fixture.reporter.send_now(payload).status.ok());
    assert(fixture.received().size() == 1);
}

void test_throwing_hook_drops_without_escaping() {
    test::LogCapture capture;
    ReporterHooks hooks;
    hooks.before_send = [](Payload) -> std::optional<Payload> { throw std::runtime_error("hook exploded"); };
    Fixture fixture(test::fast_config(1), hooks);

    assert(!fixture.reporter.capture_message("boom"));
    const auto report = fixture.reporter.send_now(Payload::now("boom"));
    assert(report.status.code == ErrorCode::Dropped);
    assert(capture.contains("reporter.hook_failed"));
    assert(capture.contains("hook exploded"));
    assert(fixture.received().empty());
}

void test_capture_runs_in_background() {
    auto config = test::fast_config(2);
    config.worker_threads = 2;
    std::atomic<int> progress_events{0};
    ReporterHooks hooks;
    hooks.on_progress = [&](const ProgressEvent&) { progress_events.fetch_add(1); };
    Fixture fixture(config, hooks);

    for (int i = 0; i < 5; ++i) {
        assert(fixture.reporter.capture_message("report " + std::to_string(i)));
    }
    fixture.reporter.flush();

    assert(fixture.reporter.reports_sent() == 5);
    assert(fixture.reporter.reports_failed() == 0);
    assert(fixture.received().size() == 5);
    assert(fixture.reporter.last_report().has_value());
    // Direct sends report no chunk progress.
    assert(progress_events.load() == 0);
}

void test_large_report_is_compressed_and_chunked() {
    auto config = test::fast_config(3);
    config.direct_size_threshold = 512;
    config.max_chunk_size = 256;
    std::vector<ProgressEvent> events;
    ReporterHooks hooks;
    hooks.on_progress = [&](const ProgressEvent& event) { events.push_back(event); };
    Fixture fixture(config, hooks);

    // Random text does not shrink below the threshold once compressed.
    const auto report = fixture.reporter.send_now(Payload::now("big", test::patterned_text(4000, 9)));
    assert(report.status.ok());
    assert(report.transport == protocol::TransportKind::Chunked);
    assert(report.chunk_count > 1);
    assert(!events.empty());
    assert(events.front().phase == ProgressPhase::Preparing);
    assert(events.back().description == "Complete");
}

void test_failed_delivery_is_counted() {
    Fixture fixture(test::fast_config(1));
    fixture.network->relay("mem://relay-0")->set_offline(true);
    const auto report = fixture.reporter.send_now(Payload::now("unreachable"));
    assert(report.status.code == ErrorCode::DirectDelivery);
    assert(fixture.reporter.reports_failed() == 1);
    assert(fixture.reporter.last_report()->status.code == ErrorCode::DirectDelivery);
}

void test_destruction_delivers_queued_reports() {
    const auto config = test::fast_config(1);
    auto relays = std::make_shared<network::MemoryRelayNetwork>(config.channels);
    {
        Reporter reporter(config, "recipient-key", relays, std::make_shared<network::DigestEnvelope>());
        for (int i = 0; i < 3; ++i) {
            assert(reporter.capture_message("queued " + std::to_string(i)));
        }
    }
    assert(test::total_events(*relays, network::DigestEnvelope::kWrapKind) == 3);
}

void test_close_bounds_shutdown() {
    auto config = test::fast_config(1);
    config.default_rate_interval = std::chrono::milliseconds(1000);
    auto relays = std::make_shared<network::MemoryRelayNetwork>(config.channels);
    Reporter reporter(config, "recipient-key", relays, std::make_shared<network::DigestEnvelope>());

    // The first send passes the gate at once, the second waits on it and
    // the third is still queued when the grace period ends.
    for (int i = 0; i < 3; ++i) {
        assert(reporter.capture_message("backlog " + std::to_string(i)));
    }
    const auto discarded = reporter.close(std::chrono::milliseconds(100));
    assert(discarded >= 1);
    assert(reporter.reports_sent() + discarded == 3);
    assert(reporter.reports_failed() == 0);
    assert(!reporter.capture_message("after close"));
}

void test_empty_recipient_rejected() {
    bool rejected = false;
    try {
        Reporter reporter(test::fast_config(1), "", std::make_shared<network::MemoryRelayNetwork>(),
                          std::make_shared<network::DigestEnvelope>());
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
}

}  // namespace

int main() {
    test_environment_from_config();
    test_before_send_can_edit_and_drop();
    test_confirm_send_sees_preview();
    test_throwing_hook_drops_without_escaping();
    test_capture_runs_in_background();
    test_large_report_is_compressed_and_chunked();
    test_failed_delivery_is_counted();
    test_destruction_delivers_queued_reports();
    test_close_bounds_shutdown();
    test_empty_recipient_rejected();
    return 0;
}
