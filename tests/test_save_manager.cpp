#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include "save_manager.hpp"
#include "utility/default_config.hpp"
#include "utility/exceptions.hpp"

using namespace flock;
using Catch::Approx;

namespace fs = std::filesystem;

namespace {

/**
 * @brief Scratch directory removed at scope exit.
 */
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string &name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string &name) const {
        return (path / name).string();
    }
};

void write_file(const std::string &filepath, const std::string &text) {
    std::ofstream out(filepath);
    out << text;
}

} // namespace

TEST_CASE("SaveManager - Basic functionality", "[save_manager]") {
    TempDir dir("flock_test_save_basic");
    SaveManager manager(dir.file("config"));

    REQUIRE(manager.get_recent_files().empty());
    REQUIRE(manager.get_last_opened_file().empty());
    REQUIRE(manager.get_config_path() ==
            dir.file("config") + "/flock_config.json");

    SECTION("New project creation") {
        SaveManager::ProjectData data;
        data.sim_config.population = 5;
        REQUIRE_NOTHROW(manager.new_project(data));

        const SimulationConfig defaults = utility::create_default_config();
        REQUIRE(data.sim_config.population == defaults.population);
        REQUIRE(data.sim_config.visual_range == defaults.visual_range);
        REQUIRE(data.sim_config.sim_threads == -1);

        REQUIRE(data.render_config.show_ui == true);
        REQUIRE(data.render_config.boid_scale == 0.1f);
        REQUIRE(data.window_config.screen_width == 1280);
        REQUIRE(data.window_config.screen_height == 720);
    }

    SECTION("Save and load project") {
        const std::string test_file = dir.file("project.json");

        SaveManager::ProjectData original_data;
        manager.new_project(original_data);

        original_data.sim_config.population = 750;
        original_data.sim_config.cohesion_factor = 3.5f;
        original_data.sim_config.seed = 77;
        original_data.render_config.boid_scale = 0.2f;
        original_data.render_config.background_color = {255, 0, 0, 255};
        original_data.render_config.camera.zoom_log = 1.5f;
        original_data.window_config = {1600, 900};

        REQUIRE_NOTHROW(manager.save_project(test_file, original_data));
        REQUIRE(fs::exists(test_file));

        SaveManager::ProjectData loaded_data;
        REQUIRE_NOTHROW(manager.load_project(test_file, loaded_data));

        REQUIRE(loaded_data.sim_config.population == 750);
        REQUIRE(loaded_data.sim_config.cohesion_factor == Approx(3.5f));
        REQUIRE(loaded_data.sim_config.seed == 77u);
        REQUIRE(loaded_data.sim_config.bounds_x ==
                Approx(original_data.sim_config.bounds_x));
        REQUIRE(loaded_data.render_config.boid_scale == Approx(0.2f));
        REQUIRE(loaded_data.render_config.background_color.r == 255);
        REQUIRE(loaded_data.render_config.background_color.g == 0);
        REQUIRE(loaded_data.render_config.camera.zoom_log == Approx(1.5f));
        REQUIRE(loaded_data.window_config.screen_width == 1600);
        REQUIRE(loaded_data.window_config.screen_height == 900);

        REQUIRE(manager.get_last_opened_file() == test_file);
        REQUIRE(manager.get_recent_files().front() == test_file);
    }
}

TEST_CASE("SaveManager - Missing keys keep current values", "[save_manager]") {
    TempDir dir("flock_test_save_partial");
    SaveManager manager(dir.file("config"));

    const std::string path = dir.file("partial.json");
    write_file(path, R"({"simulation": {"population": 42},
                        "render": {"camera": {"x": 2.5}}})");

    SaveManager::ProjectData data;
    manager.new_project(data);
    data.render_config.camera.y = -1.f;

    REQUIRE_NOTHROW(manager.load_project(path, data));

    REQUIRE(data.sim_config.population == 42);
    REQUIRE(data.sim_config.max_speed ==
            utility::create_default_config().max_speed);
    REQUIRE(data.render_config.camera.x == Approx(2.5f));
    REQUIRE(data.render_config.camera.y == Approx(-1.f));
    REQUIRE(data.window_config.screen_width == 1280);
}

TEST_CASE("SaveManager - Error handling", "[save_manager]") {
    TempDir dir("flock_test_save_errors");
    SaveManager manager(dir.file("config"));

    SaveManager::ProjectData data;
    manager.new_project(data);
    const SaveManager::ProjectData untouched = data;

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(manager.load_project(dir.file("nope.json"), data),
                          IOError);
    }

    SECTION("Malformed JSON") {
        const std::string path = dir.file("broken.json");
        write_file(path, "{ \"simulation\": { \"population\": ");
        REQUIRE_THROWS_AS(manager.load_project(path, data), IOError);
    }

    SECTION("Wrong value type") {
        const std::string path = dir.file("types.json");
        write_file(path, R"({"simulation": {"population": "many"}})");
        REQUIRE_THROWS_AS(manager.load_project(path, data), IOError);
    }

    SECTION("Not an object") {
        const std::string path = dir.file("array.json");
        write_file(path, "[1, 2, 3]");
        REQUIRE_THROWS_AS(manager.load_project(path, data), IOError);
    }

    SECTION("Invalid simulation section") {
        const std::string path = dir.file("invalid.json");
        write_file(path, R"({"simulation": {"visual_range": -2.0},
                            "render": {"boid_scale": 9.0}})");
        REQUIRE_THROWS_AS(manager.load_project(path, data), ConfigError);
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_AS(
            manager.save_project(dir.file("missing/dir/out.json"), data),
            IOError);
    }

    // Nothing is applied on failure
    REQUIRE(data.sim_config.population == untouched.sim_config.population);
    REQUIRE(data.sim_config.visual_range ==
            untouched.sim_config.visual_range);
    REQUIRE(data.render_config.boid_scale ==
            untouched.render_config.boid_scale);
    REQUIRE(manager.get_last_opened_file().empty());
}

TEST_CASE("SaveManager - Recent files", "[save_manager]") {
    TempDir dir("flock_test_save_recent");
    const std::string config_dir = dir.file("config");

    {
        SaveManager manager(config_dir);
        for (int i = 0; i < SaveManager::MAX_RECENT_FILES + 3; ++i) {
            manager.add_to_recent("project_" + std::to_string(i) + ".json");
        }

        auto recent = manager.get_recent_files();
        REQUIRE((int)recent.size() == SaveManager::MAX_RECENT_FILES);
        REQUIRE(recent.front() == "project_12.json");

        // Re-adding moves an entry to the front without duplicating it
        manager.add_to_recent("project_5.json");
        recent = manager.get_recent_files();
        REQUIRE((int)recent.size() == SaveManager::MAX_RECENT_FILES);
        REQUIRE(recent.front() == "project_5.json");
        REQUIRE(std::count(recent.begin(), recent.end(), "project_5.json") ==
                1);

        manager.set_last_opened_file("project_5.json");
    }

    {
        // Persisted across instances
        SaveManager manager(config_dir);
        REQUIRE(manager.get_recent_files().front() == "project_5.json");
        REQUIRE(manager.get_last_opened_file() == "project_5.json");

        manager.clear_recent_files();
        REQUIRE(manager.get_recent_files().empty());
    }

    {
        SaveManager manager(config_dir);
        REQUIRE(manager.get_recent_files().empty());
    }
}

TEST_CASE("SaveManager - Window state", "[save_manager]") {
    TempDir dir("flock_test_save_window");
    const std::string config_dir = dir.file("config");

    {
        SaveManager manager(config_dir);
        const SaveManager::WindowState defaults = manager.load_window_state();
        REQUIRE(defaults.width == 1280);
        REQUIRE(defaults.height == 720);

        manager.add_to_recent("a.json");
        manager.save_window_state({1920, 1080, 40, 60});
    }

    SaveManager manager(config_dir);
    const SaveManager::WindowState state = manager.load_window_state();
    REQUIRE(state.width == 1920);
    REQUIRE(state.height == 1080);
    REQUIRE(state.x == 40);
    REQUIRE(state.y == 60);

    // Window state and recent files share the config file
    REQUIRE(manager.get_recent_files().front() == "a.json");
}

TEST_CASE("SaveManager - Color conversion", "[save_manager]") {
    TempDir dir("flock_test_save_color");
    SaveManager manager(dir.file("config"));

    const Color c{12, 34, 56, 78};
    const json j = manager.color_to_json(c);
    REQUIRE(j["r"] == 12);
    REQUIRE(j["a"] == 78);

    const Color back = manager.json_to_color(j);
    REQUIRE(back.r == 12);
    REQUIRE(back.g == 34);
    REQUIRE(back.b == 56);
    REQUIRE(back.a == 78);

    REQUIRE_THROWS(manager.json_to_color(json{{"r", 1}}));
}

TEST_CASE("SaveManager - Corrupt app config is ignored", "[save_manager]") {
    TempDir dir("flock_test_save_corrupt");
    const std::string config_dir = dir.file("config");
    fs::create_directories(config_dir);
    write_file(config_dir + "/flock_config.json", "{ not json");

    SaveManager manager(config_dir);
    REQUIRE(manager.get_recent_files().empty());
    REQUIRE(manager.get_last_opened_file().empty());
    REQUIRE(manager.load_window_state().width == 1280);

    // The next write replaces it with a readable file
    manager.add_to_recent("b.json");
    SaveManager reopened(config_dir);
    REQUIRE(reopened.get_recent_files().front() == "b.json");
}
