#pragma once

#include "crashrelay/Config.hpp"
#include "crashrelay/Export.hpp"
#include "crashrelay/core/DeliveryContext.hpp"
#include "crashrelay/core/Dispatcher.hpp"
#include "crashrelay/core/Payload.hpp"
#include "crashrelay/core/ProgressReporter.hpp"
#include "crashrelay/core/WorkerPool.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace crashrelay {

struct ReporterHooks {
    // Return nullopt to drop the report.
    std::function<std::optional<Payload>(Payload)> before_send;
    // Receives the message and the first three stack lines; false drops.
    std::function<bool(const std::string& message, const std::string& stack_preview)> confirm_send;
    ProgressCallback on_progress;
};

// Top-level entry point for host applications. capture() runs the hooks on
// the calling thread and queues the send on a background worker; nothing
// it does can throw into the host.
//
// Destruction delivers every queued report before returning. A chunked
// upload is paced by the channels' rate gates, so with a backlog this can
// block for minutes; call close() first to put a bound on it.
class CRASHRELAY_API Reporter {
public:
    Reporter(Config config,
             std::string recipient_key,
             std::shared_ptr<network::ChannelFactory> channels,
             std::shared_ptr<network::SecureEnvelope> envelope,
             ReporterHooks hooks = {});
    ~Reporter();

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    // True when the report was queued.
    bool capture(Payload payload) noexcept;
    bool capture_message(std::string message, std::optional<std::string> stack = std::nullopt) noexcept;

    // Runs hooks and delivery on the calling thread.
    SendReport send_now(Payload payload) noexcept;

    // Waits for every queued send to finish.
    void flush();

    // Stops accepting reports and waits up to `grace` for the queue to
    // empty. Reports still queued then are discarded; a send already in
    // progress runs to completion. Returns the number discarded.
    std::size_t close(std::chrono::milliseconds grace);

    std::optional<SendReport> last_report() const;
    std::size_t reports_sent() const;
    std::size_t reports_failed() const;

    const Config& config() const noexcept { return context_->config(); }

private:
    std::optional<Payload> prepare(Payload payload) noexcept;
    SendReport deliver(const Payload& payload) noexcept;
    void remember(const SendReport& report);

    std::shared_ptr<DeliveryContext> context_;
    std::string recipient_key_;
    ReporterHooks hooks_;
    Dispatcher dispatcher_;

    mutable std::mutex stats_mutex_;
    std::optional<SendReport> last_report_;
    std::size_t sent_{0};
    std::size_t failed_{0};

    // Declared last so its destructor drains queued sends first.
    WorkerPool workers_;
};

}  // namespace crashrelay
