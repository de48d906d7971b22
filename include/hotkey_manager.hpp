#pragma once

#include "error.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sobotta {

// Modifier bits for HotkeyBinding::modifiers
enum HotkeyModifier : uint32_t {
    MOD_NONE  = 0,
    MOD_CTRL  = 1u << 0,
    MOD_ALT   = 1u << 1,
    MOD_SHIFT = 1u << 2,
    MOD_SUPER = 1u << 3
};

struct HotkeyBinding {
    uint32_t keycode = 0;    // Linux input event code (KEY_*)
    uint32_t modifiers = 0;  // HotkeyModifier bits that must be held

    bool operator==(const HotkeyBinding& other) const {
        return keycode == other.keycode && modifiers == other.modifiers;
    }
};

// "Alt+Space", "Ctrl+Shift+R", "RightAlt", "F9". Case-insensitive.
// Exactly one non-modifier key is required.
Error parse_hotkey_spec(const std::string& spec, HotkeyBinding& out);

std::string describe_binding(const HotkeyBinding& binding);

// Something that can swap the physical binding
class HotkeyBinder {
public:
    virtual ~HotkeyBinder() = default;

    // Must validate the binding before replacing the current one
    virtual Error rebind(const HotkeyBinding& binding) = 0;
};

// Global key listener on evdev. Reports press/release of the bound key.
class HotkeyManager : public HotkeyBinder {
public:
    using HotkeyCallback = std::function<void(bool pressed)>;

    HotkeyManager();
    ~HotkeyManager() override;

    // Initialize the hotkey system
    bool initialize();
    void shutdown();

    // Set the binding without validation (before start)
    void set_hotkey(const HotkeyBinding& binding);
    HotkeyBinding hotkey() const;

    // Validate against the open keyboard, then swap. The old binding keeps
    // working if validation fails.
    Error rebind(const HotkeyBinding& binding) override;

    // Set callback for key press/release
    void set_callback(HotkeyCallback callback) { callback_ = std::move(callback); }

    // Start/stop listening
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // One EV_KEY event (value 1 press, 0 release, 2 autorepeat). Called on
    // the listener thread.
    void handle_key(uint32_t code, int value);

private:
    void run_loop();

    mutable std::mutex binding_mutex_;
    HotkeyBinding binding_;
    HotkeyCallback callback_;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    // Listener-thread state
    uint32_t held_modifiers_ = 0;
    uint32_t pressed_keycode_ = 0;  // Key that fired the press, 0 when up

    // Platform-specific handle
    void* platform_handle_ = nullptr;
};

} // namespace sobotta
