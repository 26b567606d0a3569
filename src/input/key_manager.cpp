#include "key_manager.hpp"

#include <utility>

#include <raylib.h>

namespace flock {

void KeyManager::bind(int key, Mode mode, std::string label,
                      std::function<void()> handler, unsigned modifiers) {
    m_handlers.push_back(
        Handler{Binding{key, modifiers, mode, std::move(label)},
                std::move(handler)});
}

unsigned KeyManager::current_modifiers() {
    unsigned mods = None;
    if (IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL) ||
        IsKeyDown(KEY_LEFT_SUPER) || IsKeyDown(KEY_RIGHT_SUPER)) {
        mods |= Ctrl;
    }
    if (IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT)) {
        mods |= Shift;
    }
    if (IsKeyDown(KEY_LEFT_ALT) || IsKeyDown(KEY_RIGHT_ALT)) {
        mods |= Alt;
    }
    return mods;
}

int KeyManager::process(bool imgui_captured) {
    if (imgui_captured) {
        return 0;
    }

    const unsigned mods = current_modifiers();
    int fired = 0;

    // Handlers may register new bindings; only visit the ones present now
    const size_t count = m_handlers.size();
    for (size_t i = 0; i < count && i < m_handlers.size(); ++i) {
        const Binding &b = m_handlers[i].binding;
        if (b.modifiers != mods) {
            continue;
        }

        bool should_trigger = false;
        switch (b.mode) {
        case Mode::Pressed:
            should_trigger = IsKeyPressed(b.key);
            break;
        case Mode::Down:
            should_trigger = IsKeyDown(b.key);
            break;
        case Mode::Repeat:
            should_trigger = IsKeyPressedRepeat(b.key);
            break;
        }

        if (should_trigger) {
            m_handlers[i].callback();
            ++fired;
        }
    }
    return fired;
}

std::vector<KeyManager::Binding> KeyManager::bindings() const {
    std::vector<Binding> out;
    out.reserve(m_handlers.size());
    for (const auto &h : m_handlers) {
        // repeat bindings duplicate a pressed binding of the same key
        if (h.binding.mode != Mode::Repeat) {
            out.push_back(h.binding);
        }
    }
    return out;
}

std::string KeyManager::chord_name(int key, unsigned modifiers) {
    std::string name;
    if (modifiers & Ctrl) {
        name += "Ctrl+";
    }
    if (modifiers & Shift) {
        name += "Shift+";
    }
    if (modifiers & Alt) {
        name += "Alt+";
    }

    if (key >= KEY_A && key <= KEY_Z) {
        name += static_cast<char>('A' + (key - KEY_A));
    } else if (key >= KEY_F1 && key <= KEY_F12) {
        name += "F" + std::to_string(key - KEY_F1 + 1);
    } else {
        switch (key) {
        case KEY_SPACE:
            name += "Space";
            break;
        case KEY_TAB:
            name += "Tab";
            break;
        case KEY_ESCAPE:
            name += "Esc";
            break;
        case KEY_LEFT:
            name += "Left";
            break;
        case KEY_RIGHT:
            name += "Right";
            break;
        case KEY_UP:
            name += "Up";
            break;
        case KEY_DOWN:
            name += "Down";
            break;
        default:
            name += "Key " + std::to_string(key);
            break;
        }
    }
    return name;
}

} // namespace flock
