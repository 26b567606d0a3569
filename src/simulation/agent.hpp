#pragma once

#include "../utility/math.hpp"

namespace flock {

/**
 * @brief A point agent. It has no identity beyond its slot index, and slots
 * are reordered every tick by the grid rebuild.
 */
struct Agent {
    Vec2 position;
    Vec2 velocity;

    bool operator==(const Agent &) const = default;
};

} // namespace flock
