#pragma once

#include "config.hpp"
#include "dictation_core.hpp"
#include "hotkey.hpp"
#include "platform/linux/evdev_keyboard.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "status.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <signal.h>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

    // Runs still in flight when run() returned. They hold the core, so the
    // process must exit without destroying the loop while any remain.
    size_t abandoned_runs() const { return abandoned_runs_; }

private:
    void on_key(const PhysicalKey& key, bool pressed);
    void print_status(const StatusEvent& ev);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PipeWireCapture audio_capture_;
    EvdevKeyboard keyboard_;

    std::unique_ptr<DictationCore> core_;
    std::optional<HotkeyTracker> tracker_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    sigset_t signal_mask_{};

    std::atomic<bool> running_{false};
    size_t abandoned_runs_ = 0;
};
