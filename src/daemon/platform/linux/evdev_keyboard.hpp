#pragma once

#include "hotkey.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Maps a linux/input-event-codes.h KEY_* code to the key model. Codes with no
// counterpart (media keys, keypad, ...) yield nullopt.
std::optional<PhysicalKey> key_from_evdev(uint16_t code);

// Passive reader for /dev/input/event* keyboards. Devices are not grabbed,
// so keys still reach the focused application.
class EvdevKeyboard {
public:
    using KeyHandler = std::function<void(const PhysicalKey& key, bool pressed)>;

    EvdevKeyboard() = default;
    ~EvdevKeyboard();

    EvdevKeyboard(const EvdevKeyboard&) = delete;
    EvdevKeyboard& operator=(const EvdevKeyboard&) = delete;

    // Opens every device under `dir` that can emit a key matching `spec`.
    // Returns how many were opened; zero opened is an error.
    std::expected<size_t, std::string> open_devices(const HotkeySpec& spec,
                                                    const std::string& dir = "/dev/input");

    const std::vector<int>& fds() const { return fds_; }
    bool owns(int fd) const;

    // Drains pending events from fd. Returns false when the device is gone;
    // the fd is then closed and forgotten.
    bool read_events(int fd, const KeyHandler& handler);

private:
    void close_fd(int fd);

    std::vector<int> fds_;
};
