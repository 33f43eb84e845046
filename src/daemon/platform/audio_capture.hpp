#pragma once

#include <expected>
#include <functional>
#include <span>
#include <string>

class AudioCapture {
public:
    // Receives interleaved float32 frames on the capture driver's thread.
    using FrameCallback = std::function<void(std::span<const float>)>;

    virtual ~AudioCapture() = default;
    virtual std::expected<void, std::string> start(FrameCallback on_frames) = 0;
    // Returns once the driver will no longer invoke the callback.
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
