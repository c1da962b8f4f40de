#include "crashrelay/core/ProgressReporter.hpp"

#include "crashrelay/logging/StructuredLogger.hpp"

#include <algorithm>
#include <exception>

namespace crashrelay {

namespace {

using Level = logging::StructuredLogger::Level;

}  // namespace

std::string_view to_string(ProgressPhase phase) noexcept {
    switch (phase) {
        case ProgressPhase::Preparing:
            return "preparing";
        case ProgressPhase::Uploading:
            return "uploading";
        case ProgressPhase::Finalizing:
            return "finalizing";
    }
    return "unknown";
}

std::uint64_t estimate_upload_seconds(std::size_t chunks,
                                      std::size_t channels,
                                      std::chrono::milliseconds interval) noexcept {
    const auto divisor = static_cast<std::uint64_t>(std::max<std::size_t>(channels, 1)) * 1000u;
    const auto interval_ms = static_cast<std::uint64_t>(std::max<std::int64_t>(interval.count(), 0));
    const auto total_ms = static_cast<std::uint64_t>(chunks) * interval_ms;
    return (total_ms + divisor - 1) / divisor;
}

ProgressReporter::ProgressReporter(ProgressCallback callback,
                                   std::size_t total_chunks,
                                   std::size_t channel_count,
                                   std::chrono::milliseconds rate_interval)
    : callback_(std::move(callback)),
      total_chunks_(total_chunks),
      channel_count_(channel_count),
      rate_interval_(rate_interval) {}

void ProgressReporter::preparing() {
    ProgressEvent event;
    event.phase = ProgressPhase::Preparing;
    event.current_unit = 0;
    event.total_units = total_chunks_;
    event.fraction_completed = 0.0;
    event.estimated_seconds_remaining =
        std::max<std::uint64_t>(1, estimate_upload_seconds(total_chunks_, channel_count_, rate_interval_));
    event.description = "Preparing crash report...";
    emit(std::move(event));
}

void ProgressReporter::chunk_completed() {
    chunks_done_ = std::min(chunks_done_ + 1, total_chunks_);

    ProgressEvent event;
    event.phase = ProgressPhase::Uploading;
    event.current_unit = chunks_done_;
    event.total_units = total_chunks_;
    event.fraction_completed = total_chunks_ == 0
                                   ? kUploadFractionCeiling
                                   : static_cast<double>(chunks_done_) / static_cast<double>(total_chunks_) *
                                         kUploadFractionCeiling;
    event.estimated_seconds_remaining =
        estimate_upload_seconds(total_chunks_ - chunks_done_, channel_count_, rate_interval_);
    event.description = "Uploading chunk " + std::to_string(chunks_done_) + " of " + std::to_string(total_chunks_);
    emit(std::move(event));
}

void ProgressReporter::finalizing() {
    ProgressEvent event;
    event.phase = ProgressPhase::Finalizing;
    event.current_unit = total_chunks_;
    event.total_units = total_chunks_;
    event.fraction_completed = kUploadFractionCeiling;
    event.estimated_seconds_remaining = kFinalizingEstimateSeconds;
    event.description = "Finalizing...";
    emit(std::move(event));
}

void ProgressReporter::completed() {
    ProgressEvent event;
    event.phase = ProgressPhase::Finalizing;
    event.current_unit = total_chunks_;
    event.total_units = total_chunks_;
    event.fraction_completed = 1.0;
    event.estimated_seconds_remaining = 0;
    event.description = "Complete";
    emit(std::move(event));
}

void ProgressReporter::emit(ProgressEvent event) {
    event.fraction_completed = std::clamp(event.fraction_completed, last_fraction_, 1.0);
    last_fraction_ = event.fraction_completed;

    if (!callback_) {
        return;
    }
    try {
        callback_(event);
    } catch (const std::exception& ex) {
        logging::log_event(Level::Warning,
                           "progress.callback_failed",
                           {{"phase", std::string(to_string(event.phase))}, {"error", ex.what()}});
    } catch (...) {
        logging::log_event(Level::Warning,
                           "progress.callback_failed",
                           {{"phase", std::string(to_string(event.phase))}, {"error", "unknown exception"}});
    }
}

}  // namespace crashrelay
