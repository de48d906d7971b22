#include "hotkey_manager.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/select.h>

#ifdef SOBOTTA_HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace sobotta {

struct LinuxHotkeyState {
    int keyboard_fd = -1;
#ifdef SOBOTTA_HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
#endif
};

namespace {

std::vector<std::string> candidate_devices() {
    std::vector<std::string> paths;

    DIR* dir = opendir("/dev/input");
    if (dir) {
        while (struct dirent* entry = readdir(dir)) {
            std::string name = entry->d_name;
            if (name.rfind("event", 0) == 0) {
                paths.push_back("/dev/input/" + name);
            }
        }
        closedir(dir);
    }

    // event2 before event10
    std::sort(paths.begin(), paths.end(), [](const std::string& a, const std::string& b) {
        return a.size() != b.size() ? a.size() < b.size() : a < b;
    });

    paths.push_back("/dev/input/by-path/platform-i8042-serio-0-event-kbd");
    return paths;
}

void release_device(LinuxHotkeyState* state) {
#ifdef SOBOTTA_HAS_LIBEVDEV
    if (state->dev) {
        libevdev_free(state->dev);
        state->dev = nullptr;
    }
#endif
    if (state->keyboard_fd >= 0) {
        close(state->keyboard_fd);
        state->keyboard_fd = -1;
    }
}

} // namespace

bool HotkeyManager::initialize() {
    if (platform_handle_) return true;

    platform_handle_ = new LinuxHotkeyState();
    return true;
}

void HotkeyManager::shutdown() {
    stop();

    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    if (state) {
        release_device(state);
        delete state;
    }
    platform_handle_ = nullptr;
}

bool HotkeyManager::start() {
    if (running_.load()) return true;
    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    if (!state) return false;

    held_modifiers_ = 0;
    pressed_keycode_ = 0;

    // Find the first device that looks like a keyboard
    for (const auto& path : candidate_devices()) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) continue;
#ifdef SOBOTTA_HAS_LIBEVDEV
        int rc = libevdev_new_from_fd(fd, &state->dev);
        if (rc >= 0) {
            if (libevdev_has_event_type(state->dev, EV_KEY) &&
                libevdev_has_event_code(state->dev, EV_KEY, KEY_A)) {
                state->keyboard_fd = fd;
                std::cout << "[hotkey] Using keyboard: " << path
                          << " (" << libevdev_get_name(state->dev) << ")" << std::endl;
                break;
            }
            libevdev_free(state->dev);
            state->dev = nullptr;
        }
#else
        state->keyboard_fd = fd;
        std::cout << "[hotkey] Using keyboard: " << path << std::endl;
        break;
#endif
        close(fd);
    }

    if (state->keyboard_fd < 0) {
        std::cerr << "[hotkey] Failed to open keyboard device. Try running with sudo or add user to input group." << std::endl;
        return false;
    }

    running_.store(true);

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    std::cout << "[hotkey] Listening for " << describe_binding(hotkey()) << std::endl;
    return true;
}

void HotkeyManager::stop() {
    if (!running_.load()) return;

    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }

    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    if (state) release_device(state);
}

Error HotkeyManager::rebind(const HotkeyBinding& binding) {
    if (binding.keycode == 0 || binding.keycode > KEY_MAX) {
        return Error::make(ErrorCode::InvalidHotkeySpec,
                           "Key code out of range: " + std::to_string(binding.keycode));
    }

#ifdef SOBOTTA_HAS_LIBEVDEV
    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    if (state && state->dev &&
        !libevdev_has_event_code(state->dev, EV_KEY, binding.keycode)) {
        return Error::make(ErrorCode::InvalidHotkeySpec,
                           "Keyboard has no key for " + describe_binding(binding));
    }
#endif

    {
        std::lock_guard<std::mutex> lock(binding_mutex_);
        binding_ = binding;
    }
    std::cout << "[hotkey] Rebound to " << describe_binding(binding) << std::endl;
    return {};
}

void HotkeyManager::run_loop() {
    auto* state = static_cast<LinuxHotkeyState*>(platform_handle_);
    struct input_event ev;

    while (running_.load()) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(state->keyboard_fd, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(state->keyboard_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

#ifdef SOBOTTA_HAS_LIBEVDEV
        int rc;
        do {
            rc = libevdev_next_event(state->dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events; modifier state is unknown now
                held_modifiers_ = 0;
            } else if (rc == LIBEVDEV_READ_STATUS_SUCCESS && ev.type == EV_KEY) {
                handle_key(ev.code, ev.value);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);
#else
        ssize_t n = read(state->keyboard_fd, &ev, sizeof(ev));
        if (n == sizeof(ev) && ev.type == EV_KEY) {
            handle_key(ev.code, ev.value);
        }
#endif
    }
}

} // namespace sobotta
