#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Mono float32 audio handed from the recording session to the pipeline.
// An empty buffer means nothing was captured.
struct AudioBuffer {
    std::vector<float> samples;
    uint32_t sample_rate = 16000;

    bool empty() const { return samples.empty(); }

    double duration_s() const {
        if (sample_rate == 0) return 0.0;
        return static_cast<double>(samples.size()) / sample_rate;
    }
};

namespace audio {

// Averages interleaved frames down to one channel. A trailing partial frame
// is dropped.
inline std::vector<float> to_mono(std::span<const float> interleaved, uint32_t channels) {
    if (channels <= 1) {
        return {interleaved.begin(), interleaved.end()};
    }

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono[f] = sum / static_cast<float>(channels);
    }
    return mono;
}

} // namespace audio
