#include "hotkey.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, NamedKey>, 19> kNamedKeys = {{
    {"ctrl", NamedKey::Ctrl},
    {"alt", NamedKey::Alt},
    {"option", NamedKey::Alt},
    {"shift", NamedKey::Shift},
    {"super", NamedKey::Super},
    {"cmd", NamedKey::Super},
    {"meta", NamedKey::Super},
    {"f1", NamedKey::F1},
    {"f2", NamedKey::F2},
    {"f3", NamedKey::F3},
    {"f4", NamedKey::F4},
    {"f5", NamedKey::F5},
    {"f6", NamedKey::F6},
    {"f7", NamedKey::F7},
    {"f8", NamedKey::F8},
    {"f9", NamedKey::F9},
    {"f10", NamedKey::F10},
    {"f11", NamedKey::F11},
    {"f12", NamedKey::F12},
}};

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::expected<HotkeySpec, std::string> resolve_hotkey(std::string_view spec) {
    std::string name(spec);
    std::transform(name.begin(), name.end(), name.begin(), lower);

    for (const auto& [key_name, key] : kNamedKeys) {
        if (name == key_name) {
            return HotkeySpec{.key = key};
        }
    }

    if (spec.size() == 1) {
        return HotkeySpec{.key = lower(spec[0])};
    }

    return std::unexpected("unknown hotkey '" + std::string(spec) +
                           "': use ctrl/alt/shift/cmd, f1-f12 or a single character");
}

bool key_matches(const PhysicalKey& key, const HotkeySpec& spec) {
    if (const auto* c = std::get_if<char>(&key.id)) {
        const auto* want = std::get_if<char>(&spec.key);
        return want && lower(*c) == *want;
    }
    return key.id == spec.key;
}

std::string describe(const HotkeySpec& spec) {
    if (const auto* c = std::get_if<char>(&spec.key)) {
        return std::string(1, *c);
    }
    auto named = std::get<NamedKey>(spec.key);
    for (const auto& [key_name, key] : kNamedKeys) {
        if (key == named) return std::string(key_name);
    }
    return "?";
}

HotkeyTracker::HotkeyTracker(HotkeySpec spec, EdgeCallback on_press, EdgeCallback on_release)
    : spec_(std::move(spec)), on_press_(std::move(on_press)),
      on_release_(std::move(on_release)) {}

void HotkeyTracker::on_press(const PhysicalKey& key) const {
    if (key_matches(key, spec_) && on_press_) on_press_();
}

void HotkeyTracker::on_release(const PhysicalKey& key) const {
    if (key_matches(key, spec_) && on_release_) on_release_();
}
