#include "crashrelay/core/ProgressReporter.hpp"

#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

using namespace std::chrono_literals;
using namespace crashrelay;

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

void test_estimates() {
    assert(estimate_upload_seconds(0, 3, 7500ms) == 0);
    // 10 chunks * 7.5s / 3 channels = 25s
    assert(estimate_upload_seconds(10, 3, 7500ms) == 25);
    // 1 * 7.5 / 3 = 2.5 -> 3
    assert(estimate_upload_seconds(1, 3, 7500ms) == 3);
    assert(estimate_upload_seconds(4, 0, 1000ms) == 4);
    assert(estimate_upload_seconds(5, 2, 0ms) == 0);
}

void test_event_stream() {
    std::vector<ProgressEvent> events;
    ProgressReporter reporter([&](const ProgressEvent& event) { events.push_back(event); }, 4, 2, 7500ms);

    reporter.preparing();
    for (int i = 0; i < 4; ++i) {
        reporter.chunk_completed();
    }
    reporter.finalizing();
    reporter.completed();

    assert(events.size() == 7);

    assert(events[0].phase == ProgressPhase::Preparing);
    assert(events[0].description == "Preparing crash report...");
    assert(near(events[0].fraction_completed, 0.0));
    assert(events[0].estimated_seconds_remaining == 15);
    assert(events[0].total_units == 4);

    assert(events[1].phase == ProgressPhase::Uploading);
    assert(events[1].current_unit == 1);
    assert(events[1].description == "Uploading chunk 1 of 4");
    assert(near(events[1].fraction_completed, 0.25 * 0.95));
    assert(events[1].estimated_seconds_remaining == 12);

    assert(events[4].current_unit == 4);
    assert(near(events[4].fraction_completed, 0.95));
    assert(events[4].estimated_seconds_remaining == 0);

    assert(events[5].phase == ProgressPhase::Finalizing);
    assert(events[5].description == "Finalizing...");
    assert(near(events[5].fraction_completed, 0.95));
    assert(events[5].estimated_seconds_remaining == kFinalizingEstimateSeconds);

    assert(events[6].phase == ProgressPhase::Finalizing);
    assert(events[6].description == "Complete");
    assert(near(events[6].fraction_completed, 1.0));
    assert(events[6].estimated_seconds_remaining == 0);

    for (std::size_t i = 1; i < events.size(); ++i) {
        assert(events[i].fraction_completed >= events[i - 1].fraction_completed);
        assert(events[i].fraction_completed <= 1.0);
    }
    assert(reporter.chunks_done() == 4);
    assert(near(reporter.last_fraction(), 1.0));
}

void test_preparing_estimate_has_floor() {
    std::vector<ProgressEvent> events;
    ProgressReporter reporter([&](const ProgressEvent& event) { events.push_back(event); }, 2, 3, 0ms);
    reporter.preparing();
    assert(events.front().estimated_seconds_remaining == 1);
}

void test_extra_completions_are_clamped() {
    std::vector<ProgressEvent> events;
    ProgressReporter reporter([&](const ProgressEvent& event) { events.push_back(event); }, 1, 1, 1000ms);
    reporter.chunk_completed();
    reporter.chunk_completed();
    assert(reporter.chunks_done() == 1);
    assert(events.back().current_unit == 1);
    assert(events.back().fraction_completed <= kUploadFractionCeiling);
}

void test_throwing_callback() {
    test::LogCapture capture;
    int calls = 0;
    ProgressReporter reporter(
        [&](const ProgressEvent&) {
            ++calls;
            throw std::runtime_error("ui gone");
        },
        2,
        1,
        0ms);

    reporter.preparing();
    reporter.chunk_completed();
    reporter.chunk_completed();
    reporter.finalizing();
    reporter.completed();

    assert(calls == 5);
    assert(capture.contains("progress.callback_failed"));
    assert(capture.contains("ui gone"));
    assert(near(reporter.last_fraction(), 1.0));
}

void test_without_callback() {
    ProgressReporter reporter({}, 3, 1, 1000ms);
    reporter.preparing();
    reporter.chunk_completed();
    assert(near(reporter.last_fraction(), 0.95 / 3.0));
    assert(to_string(ProgressPhase::Uploading) == "uploading");
}

}  // namespace

int main() {
    test_estimates();
    test_event_stream();
    test_preparing_estimate_has_floor();
    test_extra_completions_are_clamped();
    test_throwing_callback();
    test_without_callback();
    return 0;
}
