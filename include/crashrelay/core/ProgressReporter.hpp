#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace crashrelay {

enum class ProgressPhase {
    Preparing,
    Uploading,
    Finalizing
};

std::string_view to_string(ProgressPhase phase) noexcept;

struct ProgressEvent {
    ProgressPhase phase{ProgressPhase::Preparing};
    std::size_t current_unit{0};
    std::size_t total_units{0};
    double fraction_completed{0.0};
    std::uint64_t estimated_seconds_remaining{0};
    std::string description;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Upload fraction ceiling; the remainder is reserved for the manifest step.
constexpr double kUploadFractionCeiling = 0.95;
constexpr std::uint64_t kFinalizingEstimateSeconds = 2;

// ceil(chunks * interval / channels) in whole seconds. Round-robin spreads
// chunks over channels, so throughput scales with the channel count.
std::uint64_t estimate_upload_seconds(std::size_t chunks,
                                      std::size_t channels,
                                      std::chrono::milliseconds interval) noexcept;

// Turns chunk completion counts into the preparing/uploading/finalizing
// event stream for one send. Fractions never decrease; a callback that
// throws is logged and otherwise ignored.
class ProgressReporter {
public:
    ProgressReporter(ProgressCallback callback,
                     std::size_t total_chunks,
                     std::size_t channel_count,
                     std::chrono::milliseconds rate_interval);

    void preparing();
    // Called after every chunk attempt, delivered or lost.
    void chunk_completed();
    // Manifest built, about to be delivered.
    void finalizing();
    void completed();

    std::size_t chunks_done() const noexcept { return chunks_done_; }
    double last_fraction() const noexcept { return last_fraction_; }

private:
    void emit(ProgressEvent event);

    ProgressCallback callback_;
    std::size_t total_chunks_;
    std::size_t channel_count_;
    std::chrono::milliseconds rate_interval_;
    std::size_t chunks_done_{0};
    double last_fraction_{0.0};
};

}  // namespace crashrelay
