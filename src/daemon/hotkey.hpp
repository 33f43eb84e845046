#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

enum class NamedKey {
    Ctrl, Alt, Shift, Super,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
};

// Which physical copy of a key was hit. Only modifiers have two.
enum class KeySide { None, Left, Right };

// A key as reported by the input device. Characters are stored lowercase.
struct PhysicalKey {
    std::variant<NamedKey, char> id;
    KeySide side = KeySide::None;
};

// The configured trigger: a named key (either side) or one character.
struct HotkeySpec {
    std::variant<NamedKey, char> key;
};

// Accepts ctrl, alt, option, shift, cmd, super, meta, f1..f12 (any case)
// or exactly one character.
std::expected<HotkeySpec, std::string> resolve_hotkey(std::string_view spec);

// Named keys compare without regard to KeySide, so "ctrl" is hit by either
// physical ctrl key.
bool key_matches(const PhysicalKey& key, const HotkeySpec& spec);

std::string describe(const HotkeySpec& spec);

// Turns raw key traffic into press/release edges for the trigger key.
// Runs on the input thread; callbacks must return quickly.
class HotkeyTracker {
public:
    using EdgeCallback = std::function<void()>;

    HotkeyTracker(HotkeySpec spec, EdgeCallback on_press, EdgeCallback on_release);

    void on_press(const PhysicalKey& key) const;
    void on_release(const PhysicalKey& key) const;

    const HotkeySpec& spec() const { return spec_; }

private:
    HotkeySpec spec_;
    EdgeCallback on_press_;
    EdgeCallback on_release_;
};
