#pragma once

#include <array>
#include <string>
#include <vector>

#include <imgui.h>
#include <raylib.h>

#include "../../input/key_manager.hpp"
#include "../../save_manager.hpp"
#include "../irenderer.hpp"
#include "../types/config.hpp"
#include "../types/window.hpp"

namespace flock {

/**
 * @brief Main menu bar UI component: project files, windows and playback
 */
class MenuBarUI : public IRenderer {
  public:
    MenuBarUI() = default;
    ~MenuBarUI() override = default;
    MenuBarUI(const MenuBarUI &) = delete;
    MenuBarUI &operator=(const MenuBarUI &) = delete;
    MenuBarUI(MenuBarUI &&) = delete;
    MenuBarUI &operator=(MenuBarUI &&) = delete;

    /**
     * @brief Render the menu bar UI
     * @param ctx The rendering context containing simulation and UI state
     */
    void render(Context &ctx) override;

    /**
     * @brief Shortcut list shown in the Help menu
     */
    void set_shortcuts(std::vector<KeyManager::Binding> shortcuts);

    void trigger_new_project(Context &ctx);
    void trigger_open_project(Context &ctx);
    void trigger_save_project(Context &ctx);

    /**
     * @brief Loads @p filepath into the simulation and render config
     * @return false if the file could not be loaded; the error is shown in
     * the menu bar and the running simulation is left untouched
     */
    bool open_file(Context &ctx, const std::string &filepath);

  private:
    void render_ui(Context &ctx);
    void render_project_indicator();
    void render_file_menu(Context &ctx);
    void render_windows_menu(Context &ctx);
    void render_controls_menu(Context &ctx);
    void render_help_menu();

    /**
     * @brief Render the path prompt if open
     */
    void render_path_prompt(Context &ctx);

    void open_path_prompt(bool saving);
    void save_to(Context &ctx, const std::string &filepath);

    /** @brief Enumeration of pending file operations */
    enum class PendingAction { None, Open, SaveAs };

    /** @brief Currently pending file operation */
    PendingAction m_pending_action = PendingAction::None;

    /** @brief Current project file path */
    std::string m_current_filepath;

    /** @brief Path typed into the prompt */
    std::array<char, 512> m_path_buf{};

    /** @brief Registered keyboard shortcuts */
    std::vector<KeyManager::Binding> m_shortcuts;

    /** @brief Last file error, shown next to the project name */
    std::string m_status;
};

} // namespace flock
