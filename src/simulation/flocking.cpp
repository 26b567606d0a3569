#include "flocking.hpp"

namespace flock {

namespace {

struct Accumulator {
    const Agent &self;
    const FlockParams &params;

    Vec2 center;
    Vec2 avg_vel;
    Vec2 close;
    int count = 0;

    inline void add(const Agent &other) {
        const Vec2 diff = self.position - other.position;
        const float d2 = dot(diff, diff);
        // d2 == 0 is self or an exact coincidence
        if (d2 <= 0.f || d2 > params.visual_range_sq) {
            return;
        }

        center += other.position;
        avg_vel += other.velocity;
        ++count;

        if (d2 < params.min_distance_sq) {
            close += diff / d2;
        }
    }

    FlockingDeltas finish(float dt) const {
        FlockingDeltas out;
        out.neighbors = count;
        if (count > 0) {
            const float inv = 1.f / (float)count;
            out.cohesion = (center * inv - self.position) *
                           (params.cohesion_factor * dt);
            out.alignment = (avg_vel * inv - self.velocity) *
                            (params.alignment_factor * dt);
        }
        out.separation = close * (params.separation_factor * dt);
        return out;
    }
};

} // namespace

FlockingDeltas FlockingForceModel::compute(const Agent &self,
                                           const NeighborWindow &neighbors,
                                           float dt) const {
    Accumulator acc{self, m_params};
    neighbors.for_each([&acc](const Agent &other) {
        acc.add(other);
    });
    return acc.finish(dt);
}

FlockingDeltas FlockingForceModel::compute(const Agent &self,
                                           std::span<const Agent> neighbors,
                                           float dt) const {
    Accumulator acc{self, m_params};
    for (const Agent &other : neighbors) {
        acc.add(other);
    }
    return acc.finish(dt);
}

} // namespace flock
