#include "crashrelay/core/Dispatcher.hpp"

#include "crashrelay/core/Chunker.hpp"
#include "crashrelay/core/Distributor.hpp"
#include "crashrelay/core/FanOut.hpp"
#include "crashrelay/core/ManifestBuilder.hpp"
#include "crashrelay/logging/StructuredLogger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

// The slowest configured channel bounds round-robin throughput.
std::chrono::milliseconds slowest_interval(const Config& config) {
    auto interval = std::chrono::milliseconds(0);
    for (const auto& channel : config.channels) {
        interval = std::max(interval, config.rate_interval_for(channel));
    }
    return interval;
}

}  // namespace

Dispatcher::Dispatcher(std::shared_ptr<DeliveryContext> context)
    : context_(std::move(context)) {
    if (!context_) {
        throw std::invalid_argument("dispatcher requires a delivery context");
    }
}

SendReport Dispatcher::send(const std::string& recipient_key,
                            std::string_view content,
                            const ProgressCallback& progress) {
    const auto& config = context_->config();
    const auto kind = protocol::transport_kind_for_size(content.size(), config.direct_size_threshold);

    if (config.channels.empty()) {
        SendReport report;
        report.transport = kind;
        report.status = Status::failure(ErrorCode::NoChannels, "no channels configured");
        logging::log_event(Level::Error, "dispatch.no_channels");
        return report;
    }

    if (kind == protocol::TransportKind::Direct) {
        return send_direct(recipient_key, content);
    }
    return send_chunked(recipient_key, content, progress);
}

SendReport Dispatcher::send_direct(const std::string& recipient_key, std::string_view content) {
    SendReport report;
    report.transport = protocol::TransportKind::Direct;

    network::TransportEvent event;
    try {
        event = context_->envelope().seal_and_wrap(recipient_key, protocol::kKindDirect, content);
    } catch (const std::exception& ex) {
        report.status = Status::failure(ErrorCode::Encoding, ex.what());
        logging::log_event(Level::Error, "dispatch.encoding_failed", {{"error", ex.what()}});
        return report;
    }

    logging::log_event(Level::Info,
                       "dispatch.direct",
                       {{"bytes", std::to_string(content.size())}, {"event", event.id}});

    report.delivered_channels = deliver_private(event);
    if (report.delivered_channels.empty()) {
        report.status = Status::failure(ErrorCode::DirectDelivery, "no channel accepted the report");
        logging::log_event(Level::Error, "dispatch.direct_failed", {{"event", event.id}});
    }
    return report;
}

SendReport Dispatcher::send_chunked(const std::string& recipient_key,
                                    std::string_view content,
                                    const ProgressCallback& progress) {
    const auto& config = context_->config();
    const auto& channels = config.channels;

    SendReport report;
    report.transport = protocol::TransportKind::Chunked;

    // Encode everything up front so an encoding failure publishes nothing.
    ChunkingResult chunking;
    std::vector<network::TransportEvent> events;
    try {
        chunking = chunk_payload(as_bytes(content), config.max_chunk_size);
        events.reserve(chunking.chunks.size());
        for (const auto& chunk : chunking.chunks) {
            const auto wire = protocol::encode_chunk_payload(to_wire(chunk));
            events.push_back(context_->envelope().build_public_event(protocol::kKindChunk, wire));
        }
    } catch (const std::exception& ex) {
        report.status = Status::failure(ErrorCode::Encoding, ex.what());
        logging::log_event(Level::Error, "dispatch.encoding_failed", {{"error", ex.what()}});
        return report;
    }

    report.chunk_count = events.size();
    logging::log_event(Level::Info,
                       "dispatch.chunked",
                       {{"bytes", std::to_string(content.size())},
                        {"chunks", std::to_string(events.size())},
                        {"channels", std::to_string(channels.size())},
                        {"root_hash", digest_to_hex(chunking.root_hash)}});

    ProgressReporter reporter(progress, events.size(), channels.size(), slowest_interval(config));
    reporter.preparing();

    Distributor distributor(config, context_->rate_limiter(), context_->channels());
    ManifestBuilder builder(chunking.root_hash, chunking.total_size, events.size());

    for (std::size_t index = 0; index < events.size(); ++index) {
        const auto& event = events[index];
        const auto outcome =
            distributor.publish_with_verify(event, channels, Distributor::start_index(index, channels.size()));

        builder.add_chunk(event.id, outcome.channel);
        if (outcome.delivered()) {
            ++report.chunks_delivered;
        } else {
            logging::log_event(Level::Error,
                               "distributor.chunk_lost",
                               {{"index", std::to_string(index)},
                                {"event", event.id},
                                {"attempts", std::to_string(outcome.attempts.size())}});
        }
        reporter.chunk_completed();
    }

    auto manifest = builder.build();

    network::TransportEvent sealed;
    try {
        const auto encoded = protocol::encode_manifest_payload(manifest);
        if (encoded.size() > config.direct_size_threshold) {
            logging::log_event(Level::Warning,
                               "dispatch.manifest_oversized",
                               {{"bytes", std::to_string(encoded.size())},
                                {"chunks", std::to_string(manifest.chunk_count)}});
        }
        reporter.finalizing();
        sealed = context_->envelope().seal_and_wrap(recipient_key, protocol::kKindManifest, encoded);
    } catch (const std::exception& ex) {
        report.manifest = std::move(manifest);
        report.status = Status::failure(ErrorCode::Encoding, ex.what());
        logging::log_event(Level::Error, "dispatch.encoding_failed", {{"error", ex.what()}});
        return report;
    }

    report.manifest = std::move(manifest);
    report.delivered_channels = deliver_private(sealed);
    if (report.delivered_channels.empty()) {
        report.status = Status::failure(ErrorCode::ManifestDelivery, "no channel accepted the manifest");
        logging::log_event(Level::Error, "dispatch.manifest_failed", {{"event", sealed.id}});
        return report;
    }

    reporter.completed();

    if (report.chunks_delivered < report.chunk_count) {
        report.status = Status::failure(ErrorCode::ChunkExhausted,
                                        std::to_string(report.chunk_count - report.chunks_delivered) + " of " +
                                            std::to_string(report.chunk_count) + " chunks lost");
    }
    logging::log_event(Level::Info,
                       "dispatch.manifest_sent",
                       {{"event", sealed.id},
                        {"chunks_delivered", std::to_string(report.chunks_delivered)},
                        {"chunks", std::to_string(report.chunk_count)}});
    return report;
}

std::vector<std::string> Dispatcher::deliver_private(const network::TransportEvent& event) {
    const auto& config = context_->config();
    std::vector<std::string> delivered;

    if (config.redundant_direct_delivery) {
        // The fan-out budget covers the publish itself; time spent waiting on
        // a channel's rate gate is granted on top of it.
        auto gate_wait = std::chrono::milliseconds(0);
        for (const auto& channel : config.channels) {
            gate_wait = std::max(gate_wait, context_->rate_limiter().time_until_ready(channel));
        }

        auto context = context_;
        auto results = fan_out(
            config.channels,
            [context, event](const std::string& channel) {
                Distributor distributor(context->config(), context->rate_limiter(), context->channels());
                return distributor.publish_once(event, channel);
            },
            config.fanout_timeout + gate_wait,
            config.fanout_max_parallel);

        for (const auto& result : results) {
            if (result.success) {
                delivered.push_back(result.target);
            } else {
                logging::log_event(Level::Warning,
                                   "dispatch.fanout_failed",
                                   {{"channel", result.target}, {"event", event.id}, {"reason", result.error}});
            }
        }
        return delivered;
    }

    Distributor distributor(config, context_->rate_limiter(), context_->channels());
    for (const auto& channel : config.channels) {
        const auto status = distributor.publish_once(event, channel);
        if (status.ok()) {
            delivered.push_back(channel);
            break;
        }
        logging::log_event(Level::Warning,
                           "distributor.publish_failed",
                           {{"channel", channel}, {"event", event.id}, {"reason", status.describe()}});
    }
    return delivered;
}

}  // namespace crashrelay
