#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;

    // Loads whatever the backend needs up front. Safe to call from any thread
    // and more than once; a failure here is reported again by transcribe().
    virtual std::expected<void, std::string> warm_up() = 0;

    virtual std::expected<TranscriptResult, std::string>
        transcribe(std::span<const float> audio, uint32_t sample_rate) = 0;
};
