#include "menu_bar_ui.hpp"

#include <cstring>
#include <utility>

#include "../../utility/default_config.hpp"
#include "../../utility/exceptions.hpp"
#include "../../utility/logger.hpp"

namespace flock {

namespace {

constexpr const char *kPathPopup = "Project path";

} // namespace

void MenuBarUI::render(Context &ctx) {
    if (!ctx.rcfg.show_ui)
        return;
    render_ui(ctx);
}

void MenuBarUI::set_shortcuts(std::vector<KeyManager::Binding> shortcuts) {
    m_shortcuts = std::move(shortcuts);
}

void MenuBarUI::trigger_new_project(Context &ctx) {
    SaveManager::ProjectData data;
    ctx.save.new_project(data);
    if (ctx.rcfg.fit_bounds_to_window) {
        utility::fit_bounds_to_aspect(data.sim_config, ctx.wcfg.screen_width,
                                      ctx.wcfg.screen_height);
    }

    try {
        ctx.sim.initialize(data.sim_config);
        ctx.rcfg = data.render_config;
        m_current_filepath.clear();
        m_status.clear();
        LOG_INFO("New project created successfully");
    } catch (const ConfigError &e) {
        LOG_ERROR("Failed to create new project: " + std::string(e.what()));
        m_status = e.what();
    }
}

void MenuBarUI::trigger_open_project(Context &) { open_path_prompt(false); }

void MenuBarUI::trigger_save_project(Context &ctx) {
    if (m_current_filepath.empty()) {
        open_path_prompt(true);
        return;
    }
    save_to(ctx, m_current_filepath);
}

void MenuBarUI::open_path_prompt(bool saving) {
    const std::string initial =
        m_current_filepath.empty() ? std::string("flock.json")
                                   : m_current_filepath;
    std::strncpy(m_path_buf.data(), initial.c_str(), m_path_buf.size() - 1);
    m_path_buf.back() = '\0';
    m_pending_action = saving ? PendingAction::SaveAs : PendingAction::Open;
}

void MenuBarUI::save_to(Context &ctx, const std::string &filepath) {
    SaveManager::ProjectData data;
    data.sim_config = ctx.sim.get_config();
    data.render_config = ctx.rcfg;
    data.window_config = ctx.wcfg;

    try {
        ctx.save.save_project(filepath, data);
        m_current_filepath = filepath;
        m_status.clear();
        LOG_INFO("Project saved successfully to: " + filepath);
    } catch (const IOError &e) {
        LOG_ERROR("Failed to save project: " + std::string(e.what()));
        m_status = e.what();
    }
}

bool MenuBarUI::open_file(Context &ctx, const std::string &filepath) {
    SaveManager::ProjectData data;
    ctx.save.new_project(data);

    try {
        ctx.save.load_project(filepath, data);
        if (data.render_config.fit_bounds_to_window) {
            utility::fit_bounds_to_aspect(data.sim_config,
                                          ctx.wcfg.screen_width,
                                          ctx.wcfg.screen_height);
        }
        ctx.sim.initialize(data.sim_config);
    } catch (const FlockException &e) {
        LOG_ERROR("Failed to load project: " + std::string(e.what()));
        m_status = e.what();
        return false;
    }

    ctx.rcfg = data.render_config;
    m_current_filepath = filepath;
    m_status.clear();
    LOG_INFO("Project loaded successfully from: " + filepath);
    return true;
}

void MenuBarUI::render_ui(Context &ctx) {
    if (ImGui::BeginMainMenuBar()) {
        render_project_indicator();
        render_file_menu(ctx);
        render_windows_menu(ctx);
        render_controls_menu(ctx);
        render_help_menu();
        ImGui::EndMainMenuBar();
    }

    render_path_prompt(ctx);
}

void MenuBarUI::render_project_indicator() {
    std::string name;
    if (m_current_filepath.empty()) {
        name = "<unsaved>";
    } else {
        size_t pos = m_current_filepath.find_last_of('/');
        if (pos == std::string::npos || pos + 1 >= m_current_filepath.size())
            name = m_current_filepath;
        else
            name = m_current_filepath.substr(pos + 1);
    }

    ImGui::TextDisabled("Project: %s", name.c_str());
    if (!m_current_filepath.empty() && ImGui::IsItemHovered()) {
        ImGui::SetTooltip("%s", m_current_filepath.c_str());
    }
    if (!m_status.empty()) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4{1.f, 0.4f, 0.4f, 1.f}, "(!)");
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s", m_status.c_str());
        }
    }
    ImGui::SameLine();
}

void MenuBarUI::render_file_menu(Context &ctx) {
    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("New")) {
            trigger_new_project(ctx);
        }
        if (ImGui::MenuItem("Open...", "Ctrl+O")) {
            open_path_prompt(false);
        }
        if (ImGui::MenuItem("Save", "Ctrl+S")) {
            trigger_save_project(ctx);
        }
        if (ImGui::MenuItem("Save As...")) {
            open_path_prompt(true);
        }
        ImGui::Separator();

        auto recent_files = ctx.save.get_recent_files();
        if (!recent_files.empty()) {
            for (const auto &file : recent_files) {
                if (ImGui::MenuItem(file.c_str())) {
                    open_file(ctx, file);
                }
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Clear Recent Files")) {
                ctx.save.clear_recent_files();
            }
        }

        if (ImGui::MenuItem("Exit", "ESC")) {
            ctx.should_exit = true;
        }

        ImGui::EndMenu();
    }
}

void MenuBarUI::render_windows_menu(Context &ctx) {
    if (ImGui::BeginMenu("Windows")) {
        if (ImGui::MenuItem("Toggle UI", "Tab")) {
            ctx.rcfg.show_ui = !ctx.rcfg.show_ui;
        }
        ImGui::Separator();
        ImGui::MenuItem("Simulation Config", "F1", &ctx.rcfg.show_sim_config);
        ImGui::MenuItem("Metrics", "F2", &ctx.rcfg.show_metrics_ui);
        ImGui::Separator();
        ImGui::MenuItem("Grid lines", "G", &ctx.rcfg.show_grid_lines);
        ImGui::MenuItem("Steering box", "B", &ctx.rcfg.show_bounds);
        ImGui::MenuItem("Velocity lines", nullptr, &ctx.rcfg.show_velocity);
        ImGui::EndMenu();
    }
}

void MenuBarUI::render_controls_menu(Context &ctx) {
    if (ImGui::BeginMenu("Controls")) {
        if (ImGui::MenuItem("Reset flock", "R")) {
            ctx.sim.reset();
        }
        if (ImGui::MenuItem("Pause/Resume", "SPACE")) {
            ctx.playback.paused = !ctx.playback.paused;
        }
        if (ImGui::MenuItem("One Step", "N", false, ctx.playback.paused)) {
            ctx.playback.step_once = true;
        }
        ImGui::EndMenu();
    }
}

void MenuBarUI::render_help_menu() {
    if (ImGui::BeginMenu("Help")) {
        ImGui::SeparatorText("Shortcuts");
        if (ImGui::BeginTable("##shortcuts", 2)) {
            for (const auto &b : m_shortcuts) {
                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(
                    KeyManager::chord_name(b.key, b.modifiers).c_str());
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(b.label.c_str());
            }
            ImGui::EndTable();
        }
        ImGui::TextDisabled("Drag: pan  Wheel: zoom");
        ImGui::EndMenu();
    }
}

void MenuBarUI::render_path_prompt(Context &ctx) {
    if (m_pending_action == PendingAction::None) {
        return;
    }

    if (!ImGui::IsPopupOpen(kPathPopup)) {
        ImGui::OpenPopup(kPathPopup);
    }

    if (ImGui::BeginPopupModal(kPathPopup, nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        const bool saving = m_pending_action == PendingAction::SaveAs;
        ImGui::TextUnformatted(saving ? "Save project to:"
                                      : "Open project from:");
        ImGui::SetNextItemWidth(420.f);
        const bool entered =
            ImGui::InputText("##path", m_path_buf.data(), m_path_buf.size(),
                             ImGuiInputTextFlags_EnterReturnsTrue);

        bool close = false;
        if (ImGui::Button(saving ? "Save" : "Open") || entered) {
            const std::string path(m_path_buf.data());
            if (!path.empty()) {
                if (saving) {
                    save_to(ctx, path);
                } else {
                    open_file(ctx, path);
                }
            }
            close = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel")) {
            close = true;
        }

        if (close) {
            m_pending_action = PendingAction::None;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace flock
