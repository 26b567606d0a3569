#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <raylib.h>

#include "render/types/config.hpp"
#include "render/types/window.hpp"
#include "simulation/config.hpp"
#include "utility/exceptions.hpp"

namespace flock {

using json = nlohmann::json;

/**
 * @brief Flock project files plus the per-user application config
 * (recent files, last project, window placement).
 *
 * A project file holds three sections, "simulation", "render" and "window".
 * Keys missing from a section keep the caller's current values, so older or
 * hand-trimmed files still load.
 */
class SaveManager {
  public:
    struct ProjectData {
        SimulationConfig sim_config;
        Config render_config;
        WindowConfig window_config{1280, 720};
    };

    /** @brief Window placement restored at startup */
    struct WindowState {
        int width = 1280;
        int height = 720;
        int x = 0;
        int y = 0;
    };

    /**
     * @param config_dir Directory of the application config file; empty
     * selects ~/.flock
     */
    explicit SaveManager(std::string config_dir = "");
    ~SaveManager() = default;

    SaveManager(const SaveManager &) = delete;
    SaveManager &operator=(const SaveManager &) = delete;
    SaveManager(SaveManager &&) = delete;
    SaveManager &operator=(SaveManager &&) = delete;

    /**
     * @brief Writes @p data to @p filepath and records it as the last file.
     * @throws IOError if the file cannot be written
     */
    void save_project(const std::string &filepath, const ProjectData &data);

    /**
     * @brief Reads @p filepath over a copy of @p data and commits it only
     * once the simulation section validates.
     * @throws IOError if the file cannot be read or parsed
     * @throws ConfigError if the simulation section is invalid
     */
    void load_project(const std::string &filepath, ProjectData &data);

    /** @brief Resets @p data to the default flock and render settings. */
    void new_project(ProjectData &data);

    json color_to_json(const Color &color);
    /** @throws json::exception if a channel is missing */
    Color json_to_color(const json &j);

    /** @brief Moves @p filepath to the front, keeping MAX_RECENT_FILES. */
    void add_to_recent(const std::string &filepath);
    std::vector<std::string> get_recent_files() const;
    void clear_recent_files();

    std::string get_last_opened_file() const;
    void set_last_opened_file(const std::string &filepath);

    void save_window_state(const WindowState &state);
    WindowState load_window_state() const;

    std::string get_config_path() const;

    static constexpr int MAX_RECENT_FILES = 10;

  private:
    json sim_config_to_json(const SimulationConfig &config);
    SimulationConfig json_to_sim_config(const json &j,
                                        const SimulationConfig &base);

    json render_config_to_json(const Config &config);
    Config json_to_render_config(const json &j, const Config &base);

    json window_config_to_json(const WindowConfig &config);
    WindowConfig json_to_window_config(const json &j,
                                       const WindowConfig &base);

    /**
     * @brief Current application config file, or an empty object if it is
     * missing or unreadable.
     */
    json read_app_config() const;

    /** @brief Replaces the application config file; failures are logged. */
    void write_app_config(const json &j) const;

    /** @brief Stores the recent files and last file, keeping other keys. */
    void save_config();
    void load_config();

    std::string m_config_dir;
    std::vector<std::string> m_recent_files;
    std::string m_last_file;

    static constexpr const char *RECENT_FILES_KEY = "recent_files";
    static constexpr const char *LAST_FILE_KEY = "last_file";
    static constexpr const char *WINDOW_STATE_KEY = "window_state";
    static constexpr const char *CONFIG_FILE = "flock_config.json";
};

} // namespace flock
