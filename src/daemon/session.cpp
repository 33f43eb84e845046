#include "session.hpp"

#include <algorithm>
#include <print>

RecordingSession::RecordingSession(AudioCapture& capture, uint32_t sample_rate,
                                   uint32_t channels, uint32_t max_seconds)
    : capture_(capture), sample_rate_(sample_rate), channels_(channels),
      max_samples_(static_cast<size_t>(max_seconds) * sample_rate * channels) {}

std::expected<void, std::string> RecordingSession::start() {
    if (state_ != SessionState::Idle) {
        return std::unexpected("session: cannot start, already armed");
    }

    {
        std::lock_guard lock(mutex_);
        chunks_.clear();
        buffered_ = 0;
        overflowed_ = false;
        accepting_ = true;
    }

    auto res = capture_.start([this](std::span<const float> frames) { append(frames); });
    if (!res) {
        std::lock_guard lock(mutex_);
        accepting_ = false;
        return std::unexpected(res.error());
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Armed;
    return {};
}

AudioBuffer RecordingSession::stop() {
    if (state_ != SessionState::Armed) {
        return AudioBuffer{.samples = {}, .sample_rate = sample_rate_};
    }

    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
    }

    // Not under mutex_: stopping joins the driver thread, which may be
    // blocked in append().
    capture_.stop();

    std::vector<std::vector<float>> chunks;
    bool overflowed = false;
    {
        std::lock_guard lock(mutex_);
        chunks.swap(chunks_);
        overflowed = overflowed_;
        buffered_ = 0;
    }
    state_ = SessionState::Idle;

    if (overflowed) {
        std::println(stderr, "session: recording hit the {}s limit, tail dropped",
                     max_samples_ / (static_cast<size_t>(sample_rate_) * channels_));
    }

    size_t total = 0;
    for (const auto& c : chunks) total += c.size();

    std::vector<float> interleaved;
    interleaved.reserve(total);
    for (const auto& c : chunks) {
        interleaved.insert(interleaved.end(), c.begin(), c.end());
    }

    return AudioBuffer{
        .samples = audio::to_mono(interleaved, channels_),
        .sample_rate = sample_rate_,
    };
}

double RecordingSession::recording_duration() const {
    if (state_ != SessionState::Armed) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

void RecordingSession::append(std::span<const float> interleaved) {
    std::lock_guard lock(mutex_);
    if (!accepting_) return;

    size_t room = max_samples_ - buffered_;
    size_t n = std::min(room, interleaved.size());
    if (n < interleaved.size()) overflowed_ = true;
    if (n == 0) return;

    chunks_.emplace_back(interleaved.begin(), interleaved.begin() + static_cast<std::ptrdiff_t>(n));
    buffered_ += n;
}
