#pragma once

namespace flock {

/**
 * @brief Window configuration structure containing basic window dimensions
 */
struct WindowConfig {
    int screen_width;  ///< Screen width in pixels
    int screen_height; ///< Screen height in pixels
};

} // namespace flock
