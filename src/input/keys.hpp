#pragma once

#include "key_manager.hpp"

#include "render/manager.hpp"
#include "render/types/config.hpp"
#include "save_manager.hpp"
#include "simulation/simulation.hpp"

namespace flock {

/**
 * @brief Sets up all keyboard shortcuts for the application.
 *
 * Registers handlers for playback controls, UI toggles, camera movement and
 * file operations.
 *
 * @param key_manager The KeyManager instance to register handlers with
 * @param sim The simulation instance for simulation controls
 * @param rcfg The render configuration for UI toggles and camera controls
 * @param playback Pause / single-step state read by the frame loop
 * @param save_manager The save manager for file operations
 * @param rman The render manager owning the menu bar
 * @param should_exit Reference to boolean flag to set when exit is requested
 */
void setup_keys(KeyManager &key_manager, Simulation &sim, Config &rcfg,
                PlaybackState &playback, SaveManager &save_manager,
                RenderManager &rman, bool &should_exit);

} // namespace flock
