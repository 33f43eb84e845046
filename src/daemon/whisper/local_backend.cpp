#include "local_backend.hpp"
#include "../platform/platform_paths.hpp"
#include "../text_util.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <whisper.h>

namespace fs = std::filesystem;

LocalBackend::LocalBackend(std::string model_path, std::string language, int threads,
                           bool use_gpu)
    : model_path_(std::move(model_path)), language_(std::move(language)),
      threads_(threads), use_gpu_(use_gpu) {}

LocalBackend::~LocalBackend() {
    if (ctx_) whisper_free(ctx_);
}

std::string LocalBackend::resolve_model_path(const std::string& model) {
    if (model.find('/') != std::string::npos || model.ends_with(".bin")) {
        return model;
    }
    auto data = platform::data_dir();
    auto dir = data.empty() ? fs::path("models") : fs::path(data) / "models";
    return (dir / ("ggml-" + model + ".bin")).string();
}

std::expected<void, std::string> LocalBackend::warm_up() {
    std::lock_guard lock(mutex_);
    return load_locked();
}

std::expected<void, std::string> LocalBackend::load_locked() {
    if (ctx_) return {};

    if (!fs::exists(model_path_)) {
        return std::unexpected("whisper model not found: " + model_path_);
    }

    auto cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;

    std::println(stderr, "whisper: loading model {}", model_path_);
    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected("failed to load whisper model: " + model_path_);
    }
    return {};
}

std::expected<TranscriptResult, std::string>
LocalBackend::transcribe(std::span<const float> audio, uint32_t sample_rate) {
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        return std::unexpected(std::format("whisper needs {} Hz audio, got {} Hz",
                                           WHISPER_SAMPLE_RATE, sample_rate));
    }

    std::lock_guard lock(mutex_);
    if (auto loaded = load_locked(); !loaded) {
        return std::unexpected(loaded.error());
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;
    if (audio.empty()) {
        return TranscriptResult{.text = {}, .duration_s = 0.0, .processing_s = 0.0};
    }

    auto start = std::chrono::steady_clock::now();

    auto params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    params.beam_search.beam_size = 5;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.translate = false;
    params.no_context = true;
    params.no_timestamps = true;
    params.suppress_blank = true;
    params.language = language_.c_str();
    params.n_threads = threads_;

    if (whisper_full(ctx_, params, audio.data(), static_cast<int>(audio.size())) != 0) {
        return std::unexpected("whisper_full() failed");
    }

    std::string text;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* seg = whisper_full_get_segment_text(ctx_, i);
        if (!seg) continue;
        auto piece = text::trim(seg);
        if (piece.empty()) continue;
        if (!text.empty()) text += ' ';
        text += piece;
    }

    auto end = std::chrono::steady_clock::now();
    return TranscriptResult{
        .text = std::move(text),
        .duration_s = duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };
}
