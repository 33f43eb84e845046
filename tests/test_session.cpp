#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "platform/audio_capture.hpp"
#include "session.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

class MockAudioCapture : public AudioCapture {
public:
    std::expected<void, std::string> start(FrameCallback on_frames) override {
        if (fail_start) return std::unexpected("audio: no input device");
        on_frames_ = std::move(on_frames);
        capturing_ = true;
        ++starts;
        return {};
    }
    void stop() override {
        capturing_ = false;
        on_frames_ = nullptr;
        ++stops;
    }
    bool is_capturing() const override { return capturing_; }

    // Simulates the driver thread delivering a buffer.
    void push(std::vector<float> frames) {
        if (on_frames_) on_frames_(frames);
    }

    bool fail_start = false;
    int starts = 0;
    int stops = 0;

private:
    bool capturing_ = false;
    FrameCallback on_frames_;
};

// Delivers from another thread; stop() waits out an in-progress callback.
class ThreadedCapture : public AudioCapture {
public:
    std::expected<void, std::string> start(FrameCallback on_frames) override {
        std::lock_guard lock(mutex_);
        on_frames_ = std::move(on_frames);
        return {};
    }
    void stop() override {
        std::lock_guard lock(mutex_);
        on_frames_ = nullptr;
    }
    bool is_capturing() const override {
        std::lock_guard lock(mutex_);
        return static_cast<bool>(on_frames_);
    }

    // Returns false when no session is listening.
    bool push(float value) {
        std::lock_guard lock(mutex_);
        if (!on_frames_) return false;
        float frame[1] = {value};
        on_frames_(frame);
        delivered_.fetch_add(1, std::memory_order_release);
        return true;
    }

    size_t delivered() const { return delivered_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    FrameCallback on_frames_;
    std::atomic<size_t> delivered_{0};
};

} // namespace

TEST_CASE("RecordingSession", "[session]") {
    MockAudioCapture capture;
    RecordingSession session(capture, 16000, 1, 120);

    SECTION("InitialStateIdle") {
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.sample_rate() == 16000);
    }

    SECTION("StopWhenIdleReturnsEmpty") {
        auto audio = session.stop();
        REQUIRE(audio.empty());
        REQUIRE(capture.stops == 0);
    }

    SECTION("RecordingDurationZeroWhenIdle") {
        REQUIRE(session.recording_duration() == 0.0);
    }

    SECTION("StartArmsCapture") {
        REQUIRE(session.start().has_value());
        REQUIRE(session.state() == SessionState::Armed);
        REQUIRE(capture.is_capturing());
        REQUIRE(session.recording_duration() >= 0.0);
    }

    SECTION("StartTwiceFails") {
        REQUIRE(session.start().has_value());
        REQUIRE_FALSE(session.start().has_value());
        REQUIRE(capture.starts == 1);
    }

    SECTION("ChunksConcatenatedInArrivalOrder") {
        REQUIRE(session.start().has_value());
        capture.push({0.1f, 0.2f});
        capture.push({0.3f});
        capture.push({0.4f, 0.5f});

        auto audio = session.stop();
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(audio.sample_rate == 16000);
        REQUIRE(audio.samples == std::vector<float>{0.1f, 0.2f, 0.3f, 0.4f, 0.5f});
    }

    SECTION("StopWithoutFramesIsEmpty") {
        REQUIRE(session.start().has_value());
        auto audio = session.stop();
        REQUIRE(audio.empty());
        REQUIRE(audio.duration_s() == 0.0);
    }

    SECTION("FramesAfterStopIgnored") {
        REQUIRE(session.start().has_value());
        capture.push({0.1f});
        auto audio = session.stop();
        capture.push({0.9f});
        REQUIRE(audio.samples.size() == 1);
    }

    SECTION("RestartDiscardsPreviousAudio") {
        REQUIRE(session.start().has_value());
        capture.push({0.1f, 0.2f, 0.3f});
        session.stop();

        REQUIRE(session.start().has_value());
        capture.push({0.7f});
        auto audio = session.stop();
        REQUIRE(audio.samples == std::vector<float>{0.7f});
    }

    SECTION("CaptureFailureLeavesSessionIdle") {
        capture.fail_start = true;
        auto res = session.start();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "audio: no input device");
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.stop().empty());
    }
}

TEST_CASE("RecordingSession with a live driver thread", "[session]") {
    ThreadedCapture capture;
    RecordingSession session(capture, 16000, 1, 3600);

    // Each delivered frame carries the next integer, so a buffer must be a
    // run of consecutive values.
    std::atomic<bool> done{false};
    std::thread driver([&] {
        float next = 0.0f;
        while (!done.load(std::memory_order_relaxed)) {
            if (capture.push(next)) next += 1.0f;
        }
    });

    std::vector<AudioBuffer> takes;
    std::vector<size_t> delivered_at_stop;
    for (int cycle = 0; cycle < 20; cycle++) {
        REQUIRE(session.start().has_value());
        size_t before = capture.delivered();
        while (capture.delivered() < before + 8) std::this_thread::yield();
        takes.push_back(session.stop());
        delivered_at_stop.push_back(capture.delivered());
    }

    done.store(true, std::memory_order_relaxed);
    driver.join();

    float previous_last = -1.0f;
    for (size_t i = 0; i < takes.size(); i++) {
        const auto& samples = takes[i].samples;
        REQUIRE_FALSE(samples.empty());
        for (size_t j = 1; j < samples.size(); j++) {
            REQUIRE(samples[j] == samples[j - 1] + 1.0f);
        }
        REQUIRE(samples.front() > previous_last);
        // Values are delivery indices. A take holds only frames delivered
        // before its stop() returned, and none from the idle gap before it.
        REQUIRE(samples.back() < static_cast<float>(delivered_at_stop[i]));
        if (i > 0) {
            REQUIRE(samples.front() >= static_cast<float>(delivered_at_stop[i - 1]));
        }
        previous_last = samples.back();
    }
}

TEST_CASE("RecordingSession downmix and limits", "[session]") {
    MockAudioCapture capture;

    SECTION("StereoAveragedToMono") {
        RecordingSession session(capture, 16000, 2, 120);
        REQUIRE(session.start().has_value());
        capture.push({0.2f, 0.4f, 0.0f, 1.0f});

        auto audio = session.stop();
        REQUIRE(audio.samples.size() == 2);
        REQUIRE_THAT(audio.samples[0], WithinAbs(0.3, 1e-6));
        REQUIRE_THAT(audio.samples[1], WithinAbs(0.5, 1e-6));
    }

    SECTION("DurationFromSampleCount") {
        RecordingSession session(capture, 4, 1, 120);
        REQUIRE(session.start().has_value());
        capture.push(std::vector<float>(6, 0.0f));
        auto audio = session.stop();
        REQUIRE_THAT(audio.duration_s(), WithinAbs(1.5, 1e-9));
    }

    SECTION("BufferBoundedByMaxSeconds") {
        // 4 Hz, 1 channel, 2 s => 8 samples kept at most.
        RecordingSession session(capture, 4, 1, 2);
        REQUIRE(session.start().has_value());
        capture.push(std::vector<float>(5, 0.1f));
        capture.push(std::vector<float>(5, 0.2f));
        capture.push(std::vector<float>(5, 0.3f));

        auto audio = session.stop();
        REQUIRE(audio.samples.size() == 8);
        REQUIRE_THAT(audio.samples.front(), WithinAbs(0.1, 1e-6));
        REQUIRE_THAT(audio.samples.back(), WithinAbs(0.2, 1e-6));
    }
}

TEST_CASE("audio::to_mono", "[session]") {

    SECTION("MonoPassesThrough") {
        std::vector<float> in = {0.1f, -0.2f};
        REQUIRE(audio::to_mono(in, 1) == in);
    }

    SECTION("TrailingPartialFrameDropped") {
        std::vector<float> in = {1.0f, 0.0f, 0.5f};
        auto mono = audio::to_mono(in, 2);
        REQUIRE(mono.size() == 1);
        REQUIRE_THAT(mono[0], WithinAbs(0.5, 1e-6));
    }
}
