#pragma once

#include "audio_buffer.hpp"
#include "cleanup/cleaner.hpp"
#include "config.hpp"
#include "output/output.hpp"
#include "platform/audio_capture.hpp"
#include "session.hpp"
#include "status.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum class CoreState { Idle, Recording };

// Push-to-talk state machine plus the transcribe -> cleanup -> insert pipeline.
//
// on_hotkey_pressed()/on_hotkey_released() are called from the input thread
// and never block on stage work: each finished recording runs on its own
// worker thread. Runs may overlap; only the insertion stage is serialized.
class DictationCore {
public:
    // `cleaner` may be null, which disables the cleanup stage.
    DictationCore(Config config, bool verbose, AudioCapture& audio,
                  std::unique_ptr<WhisperBackend> backend,
                  std::unique_ptr<TextCleaner> cleaner,
                  std::unique_ptr<OutputMethod> output,
                  StatusCallback status);
    ~DictationCore();

    DictationCore(const DictationCore&) = delete;
    DictationCore& operator=(const DictationCore&) = delete;

    // Loads the model and cleanup client in the background.
    void warm_up();

    void on_hotkey_pressed();
    void on_hotkey_released();

    CoreState state() const { return state_; }
    size_t active_runs() const;

    // Blocks until every dispatched run (and warm-up) has finished.
    void wait_for_runs();

    // Stops any active recording without waiting on in-flight runs. Returns
    // how many runs were still going; the caller decides whether to exit
    // under them.
    size_t shutdown();

private:
    struct PipelineRun {
        AudioBuffer audio;
        std::string raw_text;
        std::string final_text;
        std::chrono::steady_clock::time_point started;
    };

    struct Worker {
        std::jthread thread;
        std::atomic<bool> finished{false};
    };

    template <typename Fn>
    void spawn(Fn&& fn);
    void reap_finished_workers();

    void dispatch_run(AudioBuffer audio);
    void execute_run(PipelineRun& run);
    bool transcription_stage(PipelineRun& run);
    void cleanup_stage(PipelineRun& run);
    void insertion_stage(PipelineRun& run);

    void emit(StatusKind kind, std::string detail = {}, double seconds = 0.0);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    RecordingSession session_;
    std::unique_ptr<WhisperBackend> backend_;
    std::unique_ptr<TextCleaner> cleaner_;
    std::unique_ptr<OutputMethod> output_;
    StatusCallback status_;

    // Touched only by the input thread.
    CoreState state_ = CoreState::Idle;

    std::mutex status_mutex_;
    std::mutex insert_mutex_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};
