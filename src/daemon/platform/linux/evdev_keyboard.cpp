#include "platform/linux/evdev_keyboard.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <linux/input.h>
#include <print>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::pair<uint16_t, char>, 48> kCharKeys = {{
    {KEY_A, 'a'}, {KEY_B, 'b'}, {KEY_C, 'c'}, {KEY_D, 'd'}, {KEY_E, 'e'},
    {KEY_F, 'f'}, {KEY_G, 'g'}, {KEY_H, 'h'}, {KEY_I, 'i'}, {KEY_J, 'j'},
    {KEY_K, 'k'}, {KEY_L, 'l'}, {KEY_M, 'm'}, {KEY_N, 'n'}, {KEY_O, 'o'},
    {KEY_P, 'p'}, {KEY_Q, 'q'}, {KEY_R, 'r'}, {KEY_S, 's'}, {KEY_T, 't'},
    {KEY_U, 'u'}, {KEY_V, 'v'}, {KEY_W, 'w'}, {KEY_X, 'x'}, {KEY_Y, 'y'},
    {KEY_Z, 'z'},
    {KEY_1, '1'}, {KEY_2, '2'}, {KEY_3, '3'}, {KEY_4, '4'}, {KEY_5, '5'},
    {KEY_6, '6'}, {KEY_7, '7'}, {KEY_8, '8'}, {KEY_9, '9'}, {KEY_0, '0'},
    {KEY_MINUS, '-'}, {KEY_EQUAL, '='}, {KEY_LEFTBRACE, '['}, {KEY_RIGHTBRACE, ']'},
    {KEY_SEMICOLON, ';'}, {KEY_APOSTROPHE, '\''}, {KEY_GRAVE, '`'},
    {KEY_BACKSLASH, '\\'}, {KEY_COMMA, ','}, {KEY_DOT, '.'}, {KEY_SLASH, '/'},
    {KEY_SPACE, ' '},
}};

bool has_bit(const uint8_t* bits, unsigned bit) {
    return bits[bit / 8] & (1u << (bit % 8));
}

} // namespace

std::optional<PhysicalKey> key_from_evdev(uint16_t code) {
    switch (code) {
        case KEY_LEFTCTRL: return PhysicalKey{NamedKey::Ctrl, KeySide::Left};
        case KEY_RIGHTCTRL: return PhysicalKey{NamedKey::Ctrl, KeySide::Right};
        case KEY_LEFTALT: return PhysicalKey{NamedKey::Alt, KeySide::Left};
        case KEY_RIGHTALT: return PhysicalKey{NamedKey::Alt, KeySide::Right};
        case KEY_LEFTSHIFT: return PhysicalKey{NamedKey::Shift, KeySide::Left};
        case KEY_RIGHTSHIFT: return PhysicalKey{NamedKey::Shift, KeySide::Right};
        case KEY_LEFTMETA: return PhysicalKey{NamedKey::Super, KeySide::Left};
        case KEY_RIGHTMETA: return PhysicalKey{NamedKey::Super, KeySide::Right};
        case KEY_F1: return PhysicalKey{NamedKey::F1};
        case KEY_F2: return PhysicalKey{NamedKey::F2};
        case KEY_F3: return PhysicalKey{NamedKey::F3};
        case KEY_F4: return PhysicalKey{NamedKey::F4};
        case KEY_F5: return PhysicalKey{NamedKey::F5};
        case KEY_F6: return PhysicalKey{NamedKey::F6};
        case KEY_F7: return PhysicalKey{NamedKey::F7};
        case KEY_F8: return PhysicalKey{NamedKey::F8};
        case KEY_F9: return PhysicalKey{NamedKey::F9};
        case KEY_F10: return PhysicalKey{NamedKey::F10};
        case KEY_F11: return PhysicalKey{NamedKey::F11};
        case KEY_F12: return PhysicalKey{NamedKey::F12};
        default: break;
    }

    for (const auto& [key_code, c] : kCharKeys) {
        if (key_code == code) return PhysicalKey{c};
    }
    return std::nullopt;
}

EvdevKeyboard::~EvdevKeyboard() {
    for (int fd : fds_) ::close(fd);
}

std::expected<size_t, std::string> EvdevKeyboard::open_devices(const HotkeySpec& spec,
                                                               const std::string& dir) {
    std::error_code ec;
    std::vector<fs::path> nodes;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().filename().string().starts_with("event")) {
            nodes.push_back(entry.path());
        }
    }
    if (ec) {
        return std::unexpected("keyboard: cannot list " + dir + ": " + ec.message());
    }
    std::sort(nodes.begin(), nodes.end());

    bool denied = false;
    for (const auto& node : nodes) {
        int fd = ::open(node.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) denied = true;
            continue;
        }

        uint8_t key_bits[KEY_MAX / 8 + 1] = {};
        if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) {
            ::close(fd);
            continue;
        }

        bool can_send = false;
        for (unsigned code = 0; code <= KEY_MAX && !can_send; ++code) {
            if (!has_bit(key_bits, code)) continue;
            auto key = key_from_evdev(static_cast<uint16_t>(code));
            can_send = key && key_matches(*key, spec);
        }
        if (!can_send) {
            ::close(fd);
            continue;
        }

        char name[256] = "unknown";
        ::ioctl(fd, EVIOCGNAME(sizeof(name)), name);
        std::println(stderr, "keyboard: watching {} ({})", node.string(), name);
        fds_.push_back(fd);
    }

    if (fds_.empty()) {
        if (denied) {
            return std::unexpected("keyboard: no readable devices in " + dir +
                                   " (is your user in the 'input' group?)");
        }
        return std::unexpected("keyboard: no input device can send [" + describe(spec) + "]");
    }
    return fds_.size();
}

bool EvdevKeyboard::owns(int fd) const {
    return std::find(fds_.begin(), fds_.end(), fd) != fds_.end();
}

bool EvdevKeyboard::read_events(int fd, const KeyHandler& handler) {
    input_event events[64];

    for (;;) {
        ssize_t n = ::read(fd, events, sizeof(events));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) return true;
            std::println(stderr, "keyboard: device read failed: {}", std::strerror(errno));
            close_fd(fd);
            return false;
        }
        if (n == 0) {
            close_fd(fd);
            return false;
        }

        size_t count = static_cast<size_t>(n) / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            const auto& ev = events[i];
            // value 2 is autorepeat
            if (ev.type != EV_KEY || ev.value > 1) continue;
            auto key = key_from_evdev(ev.code);
            if (key) handler(*key, ev.value == 1);
        }
    }
}

void EvdevKeyboard::close_fd(int fd) {
    ::close(fd);
    std::erase(fds_, fd);
}
