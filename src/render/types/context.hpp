#pragma once

#include <string>

#include "../../save_manager.hpp"
#include "../../simulation/simulation.hpp"
#include "config.hpp"
#include "window.hpp"

namespace flock {

// per-frame context passed to renderers
struct Context {
    Simulation &sim;
    Config &rcfg;
    const WindowConfig &wcfg;
    PlaybackState &playback;

    // Managers for UI operations
    SaveManager &save;

    bool should_exit = false;

    Context(Simulation &sim, Config &rcfg, const WindowConfig &wcfg,
            PlaybackState &playback, SaveManager &save)
        : sim(sim), rcfg(rcfg), wcfg(wcfg), playback(playback), save(save) {}
};

} // namespace flock
