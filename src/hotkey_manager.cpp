#include "hotkey_manager.hpp"

#include <linux/input-event-codes.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <vector>

namespace sobotta {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

const std::map<std::string, uint32_t>& modifier_names() {
    static const std::map<std::string, uint32_t> names = {
        {"ctrl", MOD_CTRL}, {"control", MOD_CTRL},
        {"alt", MOD_ALT}, {"option", MOD_ALT},
        {"shift", MOD_SHIFT},
        {"super", MOD_SUPER}, {"meta", MOD_SUPER}, {"cmd", MOD_SUPER},
        {"command", MOD_SUPER}, {"win", MOD_SUPER},
    };
    return names;
}

const std::map<std::string, uint32_t>& key_names() {
    static const std::map<std::string, uint32_t> names = [] {
        std::map<std::string, uint32_t> m = {
            {"space", KEY_SPACE}, {"enter", KEY_ENTER}, {"return", KEY_ENTER},
            {"tab", KEY_TAB}, {"escape", KEY_ESC}, {"esc", KEY_ESC},
            {"backspace", KEY_BACKSPACE}, {"capslock", KEY_CAPSLOCK},
            {"insert", KEY_INSERT}, {"delete", KEY_DELETE}, {"home", KEY_HOME},
            {"end", KEY_END}, {"pageup", KEY_PAGEUP}, {"pagedown", KEY_PAGEDOWN},
            {"up", KEY_UP}, {"down", KEY_DOWN}, {"left", KEY_LEFT}, {"right", KEY_RIGHT},
            {"pause", KEY_PAUSE}, {"scrolllock", KEY_SCROLLLOCK}, {"menu", KEY_COMPOSE},
            {"grave", KEY_GRAVE}, {"`", KEY_GRAVE}, {"minus", KEY_MINUS}, {"-", KEY_MINUS},
            {"equal", KEY_EQUAL}, {"=", KEY_EQUAL}, {"comma", KEY_COMMA}, {",", KEY_COMMA},
            {"period", KEY_DOT}, {".", KEY_DOT}, {"slash", KEY_SLASH}, {"/", KEY_SLASH},
            {"semicolon", KEY_SEMICOLON}, {";", KEY_SEMICOLON},
            // Single modifier keys used on their own
            {"rightalt", KEY_RIGHTALT}, {"ralt", KEY_RIGHTALT}, {"altgr", KEY_RIGHTALT},
            {"leftalt", KEY_LEFTALT}, {"rightctrl", KEY_RIGHTCTRL}, {"leftctrl", KEY_LEFTCTRL},
            {"rightshift", KEY_RIGHTSHIFT}, {"leftshift", KEY_LEFTSHIFT},
            {"rightsuper", KEY_RIGHTMETA}, {"leftsuper", KEY_LEFTMETA},
        };

        const uint32_t letters[] = {
            KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M,
            KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
        };
        for (int i = 0; i < 26; ++i) {
            m[std::string(1, static_cast<char>('a' + i))] = letters[i];
        }

        const uint32_t digits[] = {
            KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9,
        };
        for (int i = 0; i < 10; ++i) {
            m[std::string(1, static_cast<char>('0' + i))] = digits[i];
        }

        const uint32_t fkeys[] = {
            KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
            KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12,
        };
        for (int i = 0; i < 12; ++i) {
            m["f" + std::to_string(i + 1)] = fkeys[i];
        }
        return m;
    }();
    return names;
}

} // namespace

Error parse_hotkey_spec(const std::string& spec, HotkeyBinding& out) {
    if (trim(spec).empty()) {
        return Error::make(ErrorCode::InvalidHotkeySpec, "Hotkey is empty");
    }

    std::vector<std::string> tokens;
    std::stringstream ss(spec);
    std::string token;
    while (std::getline(ss, token, '+')) {
        tokens.push_back(trim(token));
    }
    // "Ctrl++" style specs leave an empty token at the end
    if (!spec.empty() && spec.back() == '+') {
        tokens.push_back("");
    }

    HotkeyBinding binding;
    bool have_key = false;

    for (const auto& raw : tokens) {
        if (raw.empty()) {
            return Error::make(ErrorCode::InvalidHotkeySpec, "Empty key in hotkey: " + spec);
        }
        std::string name = lower(raw);

        auto mod = modifier_names().find(name);
        if (mod != modifier_names().end()) {
            if (binding.modifiers & mod->second) {
                return Error::make(ErrorCode::InvalidHotkeySpec, "Duplicate modifier: " + raw);
            }
            binding.modifiers |= mod->second;
            continue;
        }

        auto key = key_names().find(name);
        if (key == key_names().end()) {
            return Error::make(ErrorCode::InvalidHotkeySpec, "Unknown key: " + raw);
        }
        if (have_key) {
            return Error::make(ErrorCode::InvalidHotkeySpec,
                               "Hotkey must have exactly one non-modifier key: " + spec);
        }
        binding.keycode = key->second;
        have_key = true;
    }

    if (!have_key) {
        return Error::make(ErrorCode::InvalidHotkeySpec, "Hotkey has no key: " + spec);
    }

    out = binding;
    return {};
}

std::string describe_binding(const HotkeyBinding& binding) {
    std::string out;
    if (binding.modifiers & MOD_CTRL) out += "Ctrl+";
    if (binding.modifiers & MOD_ALT) out += "Alt+";
    if (binding.modifiers & MOD_SHIFT) out += "Shift+";
    if (binding.modifiers & MOD_SUPER) out += "Super+";

    for (const auto& entry : key_names()) {
        if (entry.second == binding.keycode) {
            std::string name = entry.first;
            if (!name.empty()) name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
            return out + name;
        }
    }
    return out + "key" + std::to_string(binding.keycode);
}

HotkeyManager::HotkeyManager() = default;

HotkeyManager::~HotkeyManager() {
    shutdown();
}

void HotkeyManager::set_hotkey(const HotkeyBinding& binding) {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    binding_ = binding;
}

HotkeyBinding HotkeyManager::hotkey() const {
    std::lock_guard<std::mutex> lock(binding_mutex_);
    return binding_;
}

void HotkeyManager::handle_key(uint32_t code, int value) {
    // value: 1 = press, 0 = release, 2 = autorepeat (ignored)
    uint32_t modifier = 0;
    switch (code) {
        case KEY_LEFTCTRL: case KEY_RIGHTCTRL: modifier = MOD_CTRL; break;
        case KEY_LEFTALT: case KEY_RIGHTALT: modifier = MOD_ALT; break;
        case KEY_LEFTSHIFT: case KEY_RIGHTSHIFT: modifier = MOD_SHIFT; break;
        case KEY_LEFTMETA: case KEY_RIGHTMETA: modifier = MOD_SUPER; break;
        default: break;
    }
    if (modifier) {
        if (value == 1) held_modifiers_ |= modifier;
        else if (value == 0) held_modifiers_ &= ~modifier;
    }

    // The release is matched against the key that was pressed, so a rebind
    // while held still ends the press
    if (value == 0 && pressed_keycode_ != 0 && code == pressed_keycode_) {
        // Released even if the modifiers went up first
        pressed_keycode_ = 0;
        if (callback_) callback_(false);
        return;
    }

    HotkeyBinding binding = hotkey();
    if (code != binding.keycode) return;

    if (value == 1 && pressed_keycode_ == 0) {
        if ((held_modifiers_ & binding.modifiers) != binding.modifiers) return;
        pressed_keycode_ = code;
        if (callback_) callback_(true);
    }
}

// Platform-specific implementations in platform/*/hotkey_*.cpp

} // namespace sobotta
