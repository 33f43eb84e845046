#pragma once

#include "backend.hpp"

#include <mutex>
#include <string>

struct whisper_context;

// whisper.cpp in-process. The model is loaded on first use (or by warm_up())
// and kept for the life of the backend. A whisper_context is not reentrant,
// so transcriptions from overlapping runs take turns.
class LocalBackend : public WhisperBackend {
public:
    LocalBackend(std::string model_path, std::string language, int threads, bool use_gpu);
    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    std::expected<void, std::string> warm_up() override;

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const float> audio, uint32_t sample_rate) override;

    // "small.en" -> <data_dir>/models/ggml-small.en.bin; anything with a
    // slash or a .bin suffix is taken as a path.
    static std::string resolve_model_path(const std::string& model);

private:
    std::expected<void, std::string> load_locked();

    std::string model_path_;
    std::string language_;
    int threads_;
    bool use_gpu_;

    std::mutex mutex_;
    whisper_context* ctx_ = nullptr;
};
