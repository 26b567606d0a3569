#pragma once

#include <functional>
#include <string>
#include <vector>

#include <raylib.h>

namespace flock {

/**
 * @brief Keyboard shortcut table.
 *
 * Each binding pairs a raylib key and an exact modifier set with a callback
 * and a human-readable label, so the same table drives both input handling
 * and the shortcut list shown in the UI. Nothing fires while ImGui owns the
 * keyboard.
 */
class KeyManager {
  public:
    enum class Mode {
        Pressed, ///< once per key press
        Down,    ///< every frame while held
        Repeat   ///< on the OS key-repeat cadence
    };

    /** @brief Modifier bits; a binding fires only on an exact match */
    enum Modifier : unsigned {
        None = 0,
        Ctrl = 1u << 0, ///< Ctrl or Cmd/Super
        Shift = 1u << 1,
        Alt = 1u << 2,
    };

    /**
     * @brief One registered shortcut as shown to the user
     */
    struct Binding {
        int key;
        unsigned modifiers;
        Mode mode;
        std::string label;
    };

    void bind(int key, Mode mode, std::string label,
              std::function<void()> handler, unsigned modifiers = None);

    inline void on_key_pressed(int key, std::string label,
                               std::function<void()> handler,
                               unsigned modifiers = None) {
        bind(key, Mode::Pressed, std::move(label), std::move(handler),
             modifiers);
    }

    inline void on_key_down(int key, std::string label,
                            std::function<void()> handler,
                            unsigned modifiers = None) {
        bind(key, Mode::Down, std::move(label), std::move(handler), modifiers);
    }

    inline void on_key_repeat(int key, std::string label,
                              std::function<void()> handler,
                              unsigned modifiers = None) {
        bind(key, Mode::Repeat, std::move(label), std::move(handler),
             modifiers);
    }

    /**
     * @brief Fires every binding whose key state and modifiers match this
     * frame.
     * @param imgui_captured Whether ImGui has captured keyboard input
     * @return Number of handlers fired
     */
    int process(bool imgui_captured);

    /**
     * @brief Registered shortcuts, in registration order
     */
    std::vector<Binding> bindings() const;

    /**
     * @brief Display text for a key chord, e.g. "Ctrl+S"
     */
    static std::string chord_name(int key, unsigned modifiers);

  private:
    struct Handler {
        Binding binding;
        std::function<void()> callback;
    };

    /** @brief Modifier bits held this frame */
    static unsigned current_modifiers();

    std::vector<Handler> m_handlers;
};

} // namespace flock
