#include "crashrelay/core/Reporter.hpp"

#include "crashrelay/logging/StructuredLogger.hpp"
#include "crashrelay/protocol/Compression.hpp"
#include "crashrelay/protocol/Wire.hpp"

#include <exception>
#include <stdexcept>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

SendReport dropped_report(const std::string& reason) {
    SendReport report;
    report.status = Status::failure(ErrorCode::Dropped, reason);
    return report;
}

}  // namespace

Reporter::Reporter(Config config,
                   std::string recipient_key,
                   std::shared_ptr<network::ChannelFactory> channels,
                   std::shared_ptr<network::SecureEnvelope> envelope,
                   ReporterHooks hooks)
    : context_(std::make_shared<DeliveryContext>(std::move(config), std::move(channels), std::move(envelope))),
      recipient_key_(std::move(recipient_key)),
      hooks_(std::move(hooks)),
      dispatcher_(context_),
      workers_(context_->config().worker_threads) {
    if (recipient_key_.empty()) {
        throw std::invalid_argument("recipient key must not be empty");
    }
}

Reporter::~Reporter() {
    workers_.shutdown();
}

bool Reporter::capture(Payload payload) noexcept {
    try {
        auto prepared = prepare(std::move(payload));
        if (!prepared) {
            return false;
        }
        return workers_.submit("crash_report", [this, report = std::move(*prepared)]() {
            remember(deliver(report));
        });
    } catch (const std::exception& ex) {
        logging::log_event(Level::Error, "reporter.capture_failed", {{"error", ex.what()}});
    }
    return false;
}

bool Reporter::capture_message(std::string message, std::optional<std::string> stack) noexcept {
    try {
        return capture(Payload::now(std::move(message), std::move(stack)));
    } catch (const std::exception& ex) {
        logging::log_event(Level::Error, "reporter.capture_failed", {{"error", ex.what()}});
    }
    return false;
}

SendReport Reporter::send_now(Payload payload) noexcept {
    auto prepared = prepare(std::move(payload));
    if (!prepared) {
        return dropped_report("report dropped by hook");
    }

    auto report = deliver(*prepared);
    try {
        remember(report);
    } catch (const std::exception& ex) {
        logging::log_event(Level::Error, "reporter.task_failed", {{"error", ex.what()}});
    }
    return report;
}

void Reporter::flush() {
    workers_.wait_idle();
}

std::size_t Reporter::close(std::chrono::milliseconds grace) {
    const auto discarded = workers_.shutdown_for(grace);
    if (discarded > 0) {
        logging::log_event(Level::Warning, "reporter.closed", {{"discarded", std::to_string(discarded)}});
    }
    return discarded;
}

std::optional<SendReport> Reporter::last_report() const {
    std::scoped_lock lock(stats_mutex_);
    return last_report_;
}

std::size_t Reporter::reports_sent() const {
    std::scoped_lock lock(stats_mutex_);
    return sent_;
}

std::size_t Reporter::reports_failed() const {
    std::scoped_lock lock(stats_mutex_);
    return failed_;
}

std::optional<Payload> Reporter::prepare(Payload payload) noexcept {
    try {
        const auto& config = context_->config();
        if (!payload.environment) {
            payload.environment = config.environment;
        }
        if (!payload.release) {
            payload.release = config.release;
        }

        if (hooks_.before_send) {
            auto filtered = hooks_.before_send(std::move(payload));
            if (!filtered) {
                logging::log_event(Level::Info, "reporter.dropped", {{"reason", "before_send"}});
                return std::nullopt;
            }
            payload = std::move(*filtered);
        }

        if (hooks_.confirm_send && !hooks_.confirm_send(payload.message, stack_preview(payload.stack))) {
            logging::log_event(Level::Info, "reporter.dropped", {{"reason", "confirm_send"}});
            return std::nullopt;
        }
        return payload;
    } catch (const std::exception& ex) {
        logging::log_event(Level::Warning, "reporter.hook_failed", {{"error", ex.what()}});
    } catch (...) {
        logging::log_event(Level::Warning, "reporter.hook_failed", {{"error", "unknown exception"}});
    }
    return std::nullopt;
}

SendReport Reporter::deliver(const Payload& payload) noexcept {
    try {
        std::string content;
        try {
            content = protocol::maybe_compress(protocol::encode_direct_payload(payload),
                                               context_->config().compression_threshold);
        } catch (const std::exception& ex) {
            logging::log_event(Level::Error, "dispatch.encoding_failed", {{"error", ex.what()}});
            SendReport report;
            report.status = Status::failure(ErrorCode::Encoding, ex.what());
            return report;
        }

        auto report = dispatcher_.send(recipient_key_, content, hooks_.on_progress);
        if (report.status.ok()) {
            logging::log_event(Level::Info,
                               "reporter.sent",
                               {{"transport",
                                 report.transport == protocol::TransportKind::Direct ? "direct" : "chunked"},
                                {"bytes", std::to_string(content.size())}});
        } else {
            logging::log_event(Level::Warning, "reporter.send_failed", {{"reason", report.status.describe()}});
        }
        return report;
    } catch (const std::exception& ex) {
        logging::log_event(Level::Error, "reporter.task_failed", {{"error", ex.what()}});
        SendReport report;
        report.status = Status::failure(ErrorCode::Transport, ex.what());
        return report;
    } catch (...) {
        logging::log_event(Level::Error, "reporter.task_failed", {{"error", "unknown exception"}});
        SendReport report;
        report.status = Status::failure(ErrorCode::Transport, "unknown exception");
        return report;
    }
}

void Reporter::remember(const SendReport& report) {
    std::scoped_lock lock(stats_mutex_);
    last_report_ = report;
    if (report.status.ok()) {
        ++sent_;
    } else {
        ++failed_;
    }
}

}  // namespace crashrelay
