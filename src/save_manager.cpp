#include "save_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

#include <fmt/format.h>
#include <pwd.h>
#include <unistd.h>

#include "utility/default_config.hpp"
#include "utility/logger.hpp"

namespace flock {

namespace fs = std::filesystem;

namespace {

std::string home_directory() {
    const char *home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    const passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return ".";
}

// Overwrites field only when the key is present
template <typename T>
void read_key(const json &j, const char *key, T &field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

} // namespace

SaveManager::SaveManager(std::string config_dir)
    : m_config_dir(config_dir.empty() ? home_directory() + "/.flock"
                                      : std::move(config_dir)) {
    load_config();
}

void SaveManager::save_project(const std::string &filepath,
                               const ProjectData &data) {
    LOG_INFO("Saving project to: " + filepath);

    std::string text;
    try {
        const json j = {{"simulation", sim_config_to_json(data.sim_config)},
                        {"render", render_config_to_json(data.render_config)},
                        {"window", window_config_to_json(data.window_config)}};
        text = j.dump(2);
    } catch (const json::exception &e) {
        LOG_ERROR(std::string("Project serialization failed: ") + e.what());
        throw IOError(std::string("Project serialization failed: ") +
                      e.what());
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for writing: " + filepath);
    }
    file << text;
    if (!file) {
        throw IOError("Failed to write project file: " + filepath);
    }
    file.close();

    add_to_recent(filepath);
    set_last_opened_file(filepath);
}

void SaveManager::load_project(const std::string &filepath, ProjectData &data) {
    LOG_INFO("Loading project from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for reading: " + filepath);
    }

    ProjectData loaded = data;
    try {
        const json j = json::parse(file);
        if (!j.is_object()) {
            throw IOError("Project file is not a JSON object: " + filepath);
        }

        if (j.contains("simulation")) {
            loaded.sim_config =
                json_to_sim_config(j.at("simulation"), loaded.sim_config);
        }
        if (j.contains("render")) {
            loaded.render_config =
                json_to_render_config(j.at("render"), loaded.render_config);
        }
        if (j.contains("window")) {
            loaded.window_config =
                json_to_window_config(j.at("window"), loaded.window_config);
        }
    } catch (const json::exception &e) {
        LOG_ERROR(fmt::format("Bad project file {}: {}", filepath, e.what()));
        throw IOError(fmt::format("Bad project file {}: {}", filepath,
                                  e.what()));
    }

    validate_config(loaded.sim_config);
    data = loaded;

    add_to_recent(filepath);
    set_last_opened_file(filepath);
}

void SaveManager::new_project(ProjectData &data) {
    LOG_INFO("Creating new project");
    data.sim_config = utility::create_default_config();
    data.render_config = {};
    data.window_config = {1280, 720};
}

void SaveManager::add_to_recent(const std::string &filepath) {
    m_recent_files.erase(
        std::remove(m_recent_files.begin(), m_recent_files.end(), filepath),
        m_recent_files.end());
    m_recent_files.insert(m_recent_files.begin(), filepath);
    if ((int)m_recent_files.size() > MAX_RECENT_FILES) {
        m_recent_files.resize(MAX_RECENT_FILES);
    }
    save_config();
}

std::vector<std::string> SaveManager::get_recent_files() const {
    return m_recent_files;
}

void SaveManager::clear_recent_files() {
    m_recent_files.clear();
    save_config();
}

std::string SaveManager::get_last_opened_file() const { return m_last_file; }

void SaveManager::set_last_opened_file(const std::string &filepath) {
    m_last_file = filepath;
    save_config();
}

json SaveManager::color_to_json(const Color &color) {
    return json{{"r", color.r}, {"g", color.g}, {"b", color.b}, {"a", color.a}};
}

Color SaveManager::json_to_color(const json &j) {
    auto channel = [&j](const char *key) {
        return static_cast<unsigned char>(j.at(key).get<int>());
    };
    return Color{channel("r"), channel("g"), channel("b"), channel("a")};
}

json SaveManager::sim_config_to_json(const SimulationConfig &config) {
    return json{{"population", config.population},
                {"max_speed", config.max_speed},
                {"min_speed_ratio", config.min_speed_ratio},
                {"turn_speed_ratio", config.turn_speed_ratio},
                {"edge_margin", config.edge_margin},
                {"visual_range", config.visual_range},
                {"min_distance", config.min_distance},
                {"cohesion_factor", config.cohesion_factor},
                {"separation_factor", config.separation_factor},
                {"alignment_factor", config.alignment_factor},
                {"bounds_x", config.bounds_x},
                {"bounds_y", config.bounds_y},
                {"grid_padding", config.grid_padding},
                {"time_scale", config.time_scale},
                {"sim_threads", config.sim_threads},
                {"seed", config.seed}};
}

SimulationConfig SaveManager::json_to_sim_config(const json &j,
                                                 const SimulationConfig &base) {
    SimulationConfig config = base;
    read_key(j, "population", config.population);
    read_key(j, "max_speed", config.max_speed);
    read_key(j, "min_speed_ratio", config.min_speed_ratio);
    read_key(j, "turn_speed_ratio", config.turn_speed_ratio);
    read_key(j, "edge_margin", config.edge_margin);
    read_key(j, "visual_range", config.visual_range);
    read_key(j, "min_distance", config.min_distance);
    read_key(j, "cohesion_factor", config.cohesion_factor);
    read_key(j, "separation_factor", config.separation_factor);
    read_key(j, "alignment_factor", config.alignment_factor);
    read_key(j, "bounds_x", config.bounds_x);
    read_key(j, "bounds_y", config.bounds_y);
    read_key(j, "grid_padding", config.grid_padding);
    read_key(j, "time_scale", config.time_scale);
    read_key(j, "sim_threads", config.sim_threads);
    read_key(j, "seed", config.seed);
    return config;
}

json SaveManager::render_config_to_json(const Config &config) {
    return json{{"show_ui", config.show_ui},
                {"show_metrics_ui", config.show_metrics_ui},
                {"show_sim_config", config.show_sim_config},
                {"background_color", color_to_json(config.background_color)},
                {"boid_color", color_to_json(config.boid_color)},
                {"boid_scale", config.boid_scale},
                {"show_bounds", config.show_bounds},
                {"bounds_color", color_to_json(config.bounds_color)},
                {"show_grid_lines", config.show_grid_lines},
                {"show_velocity", config.show_velocity},
                {"vel_scale", config.vel_scale},
                {"fit_bounds_to_window", config.fit_bounds_to_window},
                {"max_frame_dt", config.max_frame_dt},
                {"camera",
                 {{"x", config.camera.x},
                  {"y", config.camera.y},
                  {"zoom_log", config.camera.zoom_log}}}};
}

Config SaveManager::json_to_render_config(const json &j, const Config &base) {
    Config config = base;
    read_key(j, "show_ui", config.show_ui);
    read_key(j, "show_metrics_ui", config.show_metrics_ui);
    read_key(j, "show_sim_config", config.show_sim_config);
    read_key(j, "boid_scale", config.boid_scale);
    read_key(j, "show_bounds", config.show_bounds);
    read_key(j, "show_grid_lines", config.show_grid_lines);
    read_key(j, "show_velocity", config.show_velocity);
    read_key(j, "vel_scale", config.vel_scale);
    read_key(j, "fit_bounds_to_window", config.fit_bounds_to_window);
    read_key(j, "max_frame_dt", config.max_frame_dt);

    for (auto [key, color] :
         {std::pair{"background_color", &config.background_color},
          std::pair{"boid_color", &config.boid_color},
          std::pair{"bounds_color", &config.bounds_color}}) {
        if (j.contains(key)) {
            *color = json_to_color(j.at(key));
        }
    }

    if (j.contains("camera")) {
        const json &camera = j.at("camera");
        read_key(camera, "x", config.camera.x);
        read_key(camera, "y", config.camera.y);
        read_key(camera, "zoom_log", config.camera.zoom_log);
    }
    return config;
}

json SaveManager::window_config_to_json(const WindowConfig &config) {
    return json{{"screen_width", config.screen_width},
                {"screen_height", config.screen_height}};
}

WindowConfig SaveManager::json_to_window_config(const json &j,
                                                const WindowConfig &base) {
    WindowConfig config = base;
    read_key(j, "screen_width", config.screen_width);
    read_key(j, "screen_height", config.screen_height);
    return config;
}

std::string SaveManager::get_config_path() const {
    return m_config_dir + "/" + CONFIG_FILE;
}

json SaveManager::read_app_config() const {
    std::ifstream file(get_config_path());
    if (!file.is_open()) {
        return json::object();
    }

    // allow_exceptions = false: a corrupt file reads as discarded
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("Ignoring unreadable app config " + get_config_path());
        return json::object();
    }
    return j;
}

void SaveManager::write_app_config(const json &j) const {
    const std::string path = get_config_path();

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        LOG_WARN(fmt::format("Cannot create {}: {}", m_config_dir,
                             ec.message()));
        return;
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        LOG_WARN("Cannot write app config " + path);
        return;
    }
    out << j.dump(2);
}

void SaveManager::save_config() {
    json j = read_app_config();
    j[RECENT_FILES_KEY] = m_recent_files;
    j[LAST_FILE_KEY] = m_last_file;
    write_app_config(j);
}

void SaveManager::load_config() {
    LOG_INFO("Loading app config from " + get_config_path());
    const json j = read_app_config();
    try {
        read_key(j, RECENT_FILES_KEY, m_recent_files);
        read_key(j, LAST_FILE_KEY, m_last_file);
    } catch (const json::exception &e) {
        LOG_WARN(std::string("Ignoring malformed recent files: ") + e.what());
        m_recent_files.clear();
        m_last_file.clear();
    }
}

void SaveManager::save_window_state(const WindowState &state) {
    json j = read_app_config();
    j[WINDOW_STATE_KEY] = {{"width", state.width},
                           {"height", state.height},
                           {"x", state.x},
                           {"y", state.y}};
    write_app_config(j);
}

SaveManager::WindowState SaveManager::load_window_state() const {
    WindowState state;
    const json j = read_app_config();
    if (!j.contains(WINDOW_STATE_KEY)) {
        return state;
    }

    const WindowState defaults;
    try {
        const json &ws = j.at(WINDOW_STATE_KEY);
        read_key(ws, "width", state.width);
        read_key(ws, "height", state.height);
        read_key(ws, "x", state.x);
        read_key(ws, "y", state.y);
    } catch (const json::exception &e) {
        LOG_WARN(std::string("Ignoring malformed window state: ") + e.what());
        state = defaults;
    }
    return state;
}

} // namespace flock
