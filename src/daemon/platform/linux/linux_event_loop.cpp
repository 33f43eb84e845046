#include "platform/linux/linux_event_loop.hpp"

#include "cleanup/anthropic_cleaner.hpp"
#include "platform/linux/paste_output.hpp"
#include "whisper/local_backend.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <print>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      audio_capture_(config_.audio.sample_rate, config_.audio.channels) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    auto hotkey = resolve_hotkey(config_.hotkey);
    if (!hotkey) {
        std::println(stderr, "config: {}", hotkey.error());
        return false;
    }

    auto output = make_paste_output(config_.output.method);
    if (!output) {
        std::println(stderr, "{}", output.error());
        return false;
    }

    std::unique_ptr<TextCleaner> cleaner;
    if (config_.cleanup.enabled) {
        cleaner = std::make_unique<AnthropicCleaner>(
            config_.cleanup.api_key, config_.cleanup.model, config_.cleanup.url);
        if (!cleaner->available()) {
            std::println(stderr, "[pushscribe] No API key set, cleanup will be skipped");
        }
    }

    core_ = std::make_unique<DictationCore>(
        config_, verbose_, audio_capture_,
        std::make_unique<LocalBackend>(LocalBackend::resolve_model_path(config_.backend.model),
                                       config_.backend.language, config_.backend.threads,
                                       config_.backend.use_gpu),
        std::move(cleaner), std::move(*output),
        [this](const StatusEvent& ev) { print_status(ev); });

    tracker_.emplace(*hotkey,
                     [this] { core_->on_hotkey_pressed(); },
                     [this] { core_->on_hotkey_released(); });

    auto opened = keyboard_.open_devices(*hotkey);
    if (!opened) {
        std::println(stderr, "{}", opened.error());
        return false;
    }
    log(std::format("Watching {} keyboard device(s)", *opened));

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigemptyset(&signal_mask_);
    sigaddset(&signal_mask_, SIGINT);
    sigaddset(&signal_mask_, SIGTERM);
    sigprocmask(SIG_BLOCK, &signal_mask_, nullptr);

    signal_fd_ = signalfd(-1, &signal_mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    for (int fd : keyboard_.fds()) {
        if (!add_fd(fd, EPOLLIN)) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
    }

    // Model load and client setup happen off this thread.
    core_->warm_up();

    print_status({.kind = StatusKind::Ready, .detail = describe(*hotkey), .seconds = 0.0});

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    auto key_handler = [this](const PhysicalKey& key, bool pressed) { on_key(key, pressed); };

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) < 0) {
                    std::println(stderr, "signalfd read failed: {}", std::strerror(errno));
                }
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (keyboard_.owns(fd) && !keyboard_.read_events(fd, key_handler)) {
                log("Keyboard device removed");
                if (keyboard_.fds().empty()) {
                    std::println(stderr, "keyboard: no devices left, shutting down");
                    running_.store(false, std::memory_order_release);
                    break;
                }
            }
        }
    }

    abandoned_runs_ = core_->shutdown();
    std::println("[pushscribe] Bye.");
}

void LinuxEventLoop::on_key(const PhysicalKey& key, bool pressed) {
    if (pressed) {
        tracker_->on_press(key);
    } else {
        tracker_->on_release(key);
    }
}

void LinuxEventLoop::print_status(const StatusEvent& ev) {
    if (is_error(ev.kind)) {
        std::println(stderr, "[pushscribe] {}", format_status(ev));
        return;
    }
    std::println("[pushscribe] {}", format_status(ev));
    std::fflush(stdout);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[pushscribe] {}", msg);
    }
}
