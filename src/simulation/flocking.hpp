#pragma once

#include <span>

#include "agent.hpp"
#include "config.hpp"
#include "neighborquery.hpp"

namespace flock {

/**
 * @brief Velocity changes produced by one force evaluation.
 */
struct FlockingDeltas {
    Vec2 cohesion;
    Vec2 alignment;
    Vec2 separation;
    /** @brief Neighbors within visual range (self excluded) */
    int neighbors = 0;

    inline Vec2 total() const noexcept {
        return cohesion + alignment + separation;
    }
};

/**
 * @brief Cohesion / alignment / separation rules evaluated against a frozen
 * neighbor snapshot.
 *
 * For every neighbor with 0 < d2 <= visual_range^2:
 *  - center += other.position, avg_vel += other.velocity, count += 1
 *  - if d2 < min_distance^2: close += (self.position - other.position) / d2
 *
 * cohesion  = (center/count - self.position) * cohesion_factor * dt
 * alignment = (avg_vel/count - self.velocity) * alignment_factor * dt
 * separation = close * separation_factor * dt
 *
 * Cohesion and alignment are zero when no neighbor is in range.
 */
class FlockingForceModel {
  public:
    FlockingForceModel() = default;
    explicit FlockingForceModel(const FlockParams &params) : m_params(params) {}

    inline void set_params(const FlockParams &params) noexcept {
        m_params = params;
    }
    inline const FlockParams &params() const noexcept { return m_params; }

    /**
     * @brief Evaluates the rules for @p self over a grid window.
     */
    FlockingDeltas compute(const Agent &self, const NeighborWindow &neighbors,
                           float dt) const;

    /**
     * @brief Evaluates the rules for @p self over an explicit list of
     * candidates. @p self may be part of the list; it is skipped by the
     * zero-distance test.
     */
    FlockingDeltas compute(const Agent &self,
                           std::span<const Agent> neighbors, float dt) const;

  private:
    FlockParams m_params;
};

} // namespace flock
