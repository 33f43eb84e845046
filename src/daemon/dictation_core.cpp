#include "dictation_core.hpp"

#include "text_util.hpp"

#include <exception>
#include <format>
#include <print>
#include <utility>

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - start).count();
}

} // namespace

DictationCore::DictationCore(Config config, bool verbose, AudioCapture& audio,
                             std::unique_ptr<WhisperBackend> backend,
                             std::unique_ptr<TextCleaner> cleaner,
                             std::unique_ptr<OutputMethod> output,
                             StatusCallback status)
    : config_(std::move(config)), verbose_(verbose),
      session_(audio, config_.audio.sample_rate, config_.audio.channels,
               config_.audio.max_seconds),
      backend_(std::move(backend)),
      cleaner_(std::move(cleaner)),
      output_(std::move(output)),
      status_(std::move(status)) {}

DictationCore::~DictationCore() {
    wait_for_runs();
}

template <typename Fn>
void DictationCore::spawn(Fn&& fn) {
    std::lock_guard lock(workers_mutex_);
    // std::list keeps `w` at a stable address for the worker's lifetime.
    auto& w = workers_.emplace_back();
    w.thread = std::jthread([&w, fn = std::forward<Fn>(fn)]() mutable {
        fn();
        w.finished.store(true, std::memory_order_release);
    });
}

void DictationCore::reap_finished_workers() {
    std::lock_guard lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished.load(std::memory_order_acquire)) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void DictationCore::warm_up() {
    spawn([this] {
        try {
            auto start = std::chrono::steady_clock::now();
            if (auto res = backend_->warm_up(); !res) {
                std::println(stderr, "[pushscribe] warm-up: {}", res.error());
            } else {
                log(std::format("Transcription backend ready ({:.1f}s)", seconds_since(start)));
            }

            if (cleaner_ && config_.cleanup.enabled && cleaner_->available()) {
                if (auto res = cleaner_->warm_up(); !res) {
                    std::println(stderr, "[pushscribe] warm-up: {}", res.error());
                }
            }
        } catch (const std::exception& e) {
            std::println(stderr, "[pushscribe] warm-up failed: {}", e.what());
        }
    });
}

void DictationCore::on_hotkey_pressed() {
    if (state_ != CoreState::Idle) return;

    auto res = session_.start();
    if (!res) {
        emit(StatusKind::CaptureFailed, res.error());
        return;
    }

    state_ = CoreState::Recording;
    emit(StatusKind::RecordingStarted);
}

void DictationCore::on_hotkey_released() {
    if (state_ != CoreState::Recording) return;

    auto audio = session_.stop();
    state_ = CoreState::Idle;

    if (audio.empty()) {
        emit(StatusKind::NoAudio);
        return;
    }

    emit(StatusKind::Captured, {}, audio.duration_s());
    dispatch_run(std::move(audio));
}

size_t DictationCore::active_runs() const {
    std::lock_guard lock(workers_mutex_);
    size_t n = 0;
    for (const auto& w : workers_) {
        if (!w.finished.load(std::memory_order_acquire)) ++n;
    }
    return n;
}

void DictationCore::wait_for_runs() {
    std::list<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

size_t DictationCore::shutdown() {
    if (state_ == CoreState::Recording) {
        session_.stop();
        state_ = CoreState::Idle;
    }

    reap_finished_workers();
    size_t pending = active_runs();
    if (pending > 0) {
        std::println(stderr, "[pushscribe] Abandoning {} in-flight run(s)", pending);
    }
    return pending;
}

void DictationCore::dispatch_run(AudioBuffer audio) {
    reap_finished_workers();

    PipelineRun run{
        .audio = std::move(audio),
        .raw_text = {},
        .final_text = {},
        .started = std::chrono::steady_clock::now(),
    };

    spawn([this, run = std::move(run)]() mutable {
        try {
            execute_run(run);
        } catch (const std::exception& e) {
            emit(StatusKind::RunFailed, e.what());
        }
    });
}

void DictationCore::execute_run(PipelineRun& run) {
    if (!transcription_stage(run)) return;
    cleanup_stage(run);
    insertion_stage(run);
    emit(StatusKind::RunComplete, {}, seconds_since(run.started));
}

bool DictationCore::transcription_stage(PipelineRun& run) {
    auto start = std::chrono::steady_clock::now();
    auto result = backend_->transcribe(run.audio.samples, run.audio.sample_rate);
    double elapsed = seconds_since(start);

    if (!result) {
        emit(StatusKind::TranscriptionFailed, result.error());
        return false;
    }

    run.raw_text = text::trim(result->text);
    if (run.raw_text.empty()) {
        emit(StatusKind::NoSpeech);
        return false;
    }

    emit(StatusKind::Transcribed, run.raw_text, elapsed);
    return true;
}

void DictationCore::cleanup_stage(PipelineRun& run) {
    run.final_text = run.raw_text;

    if (!cleaner_ || !config_.cleanup.enabled) return;

    if (!cleaner_->available()) {
        emit(StatusKind::CleanupUnavailable);
        return;
    }

    auto start = std::chrono::steady_clock::now();
    auto cleaned = cleaner_->cleanup(run.raw_text);
    double elapsed = seconds_since(start);

    if (!cleaned) {
        emit(StatusKind::CleanupFailed, cleaned.error());
        return;
    }

    auto cleaned_text = text::trim(*cleaned);
    if (cleaned_text.empty()) {
        emit(StatusKind::CleanupFailed, "service returned no text");
        return;
    }

    run.final_text = std::move(cleaned_text);
    if (run.final_text != run.raw_text) {
        emit(StatusKind::Cleaned, run.final_text, elapsed);
    }
}

void DictationCore::insertion_stage(PipelineRun& run) {
    // Clipboard and focus are shared by every run.
    std::lock_guard lock(insert_mutex_);

    auto start = std::chrono::steady_clock::now();
    auto res = output_->deliver(run.final_text);
    double elapsed = seconds_since(start);

    if (!res) {
        emit(StatusKind::InsertionFailed, res.error());
        return;
    }

    if (*res == Delivery::ClipboardOnly) {
        emit(StatusKind::ClipboardOnly, {}, elapsed);
    } else {
        emit(StatusKind::Inserted, {}, elapsed);
    }
}

void DictationCore::emit(StatusKind kind, std::string detail, double seconds) {
    std::lock_guard lock(status_mutex_);
    if (status_) {
        status_(StatusEvent{.kind = kind, .detail = std::move(detail), .seconds = seconds});
    }
}

void DictationCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[pushscribe] {}", msg);
    }
}
