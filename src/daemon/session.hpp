#pragma once

#include "audio_buffer.hpp"
#include "platform/audio_capture.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <span>
#include <string>
#include <vector>

enum class SessionState { Idle, Armed };

// Collects microphone frames between start() and stop().
// The capture driver thread appends chunks; the hotkey thread starts and
// drains. mutex_ is the only lock and is held just for append and drain.
class RecordingSession {
public:
    RecordingSession(AudioCapture& capture, uint32_t sample_rate, uint32_t channels,
                     uint32_t max_seconds);

    std::expected<void, std::string> start();
    // Returns mono audio if recording was active, empty if not.
    AudioBuffer stop();

    SessionState state() const { return state_; }
    double recording_duration() const;
    uint32_t sample_rate() const { return sample_rate_; }

private:
    void append(std::span<const float> interleaved);

    AudioCapture& capture_;
    uint32_t sample_rate_;
    uint32_t channels_;
    size_t max_samples_;

    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;

    std::mutex mutex_;
    std::vector<std::vector<float>> chunks_;
    size_t buffered_ = 0;
    bool accepting_ = false;
    bool overflowed_ = false;
};
