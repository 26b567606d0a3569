#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <vector>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "agent.hpp"
#include "config.hpp"
#include "uniformgrid.hpp"

namespace flock {

/**
 * @brief Half-open index range [begin, end) into the sorted agent buffer.
 */
struct IndexRange {
    int begin = 0;
    int end = 0;

    inline int size() const noexcept { return end - begin; }

    bool operator==(const IndexRange &) const = default;
};

/**
 * @brief The 3x3 neighborhood of one cell as three contiguous row bands of
 * the sorted buffer (row above, same row, row below).
 */
struct NeighborWindow {
    std::array<std::span<const Agent>, 3> bands;

    /**
     * @brief Calls @p fn(const Agent &) for every agent of the window.
     */
    template <typename F>
    inline void for_each(F &&fn) const {
        for (const auto &band : bands) {
            for (const Agent &other : band) {
                fn(other);
            }
        }
    }

    inline std::size_t size() const noexcept {
        return bands[0].size() + bands[1].size() + bands[2].size();
    }
};

/**
 * @brief Spatial acceleration structure for agent neighbor lookups
 * @details Owns the UniformGrid and caches its layout so the buffers are
 * only reallocated when the layout or population changes. The grid itself
 * is rebuilt every tick.
 *
 * For a row band centred on cell y, cells y-1, y, y+1 are consecutive ids,
 * so the band is the single range [offsets[y-2], offsets[y+1]). Three bands
 * (y = c - dim_x, c, c + dim_x) cover the 3x3 block in three reads.
 */
class NeighborQuery {
  public:
    NeighborQuery() = default;
    ~NeighborQuery() = default;
    NeighborQuery(const NeighborQuery &) = delete;
    NeighborQuery(NeighborQuery &&) = delete;
    NeighborQuery &operator=(const NeighborQuery &) = delete;
    NeighborQuery &operator=(NeighborQuery &&) = delete;

    /**
     * @brief Resizes the grid if @p layout or @p count changed since the
     * last call.
     */
    inline void ensure(const GridLayout &layout, int count) {
        if (layout != m_last_layout || count != m_last_count ||
            m_grid.empty()) {
            m_grid.resize(layout, count);
            m_last_layout = layout;
            m_last_count = count;
        }
    }

    /**
     * @brief Rebuilds the grid from @p live into @p sorted.
     */
    inline void rebuild(const std::vector<Agent> &live,
                        std::vector<Agent> &sorted) {
        m_grid.rebuild(live, sorted);
    }

    /**
     * @brief Cell id of @p agent.
     * @throws ConfigError if the agent is outside the interior cells
     */
    inline int cell_of(const Agent &agent) const {
        const int ci = m_grid.cell_id_of(agent.position);
        if (ci < 0) {
            throw ConfigError(fmt::format(
                "position ({}, {}) is outside the padded grid",
                agent.position.x, agent.position.y));
        }
        return ci;
    }

    /**
     * @brief Sorted-buffer index ranges of the three row bands around
     * @p cell_id.
     * @throws SimulationError if @p cell_id is not an interior cell
     */
    inline std::array<IndexRange, 3> ranges(int cell_id) const {
        if (!m_grid.is_interior(cell_id)) {
            throw SimulationError(
                fmt::format("cell {} has no complete 3x3 window", cell_id));
        }

        const int row = m_grid.cols();
        std::array<IndexRange, 3> out;
        for (int k = 0; k < 3; ++k) {
            const int y = cell_id + (k - 1) * row;
            out[k] = {m_grid.cell_begin(y - 1), m_grid.cell_end(y + 1)};
        }
        return out;
    }

    /**
     * @brief The agents of the 3x3 block around @p cell_id, as spans into
     * @p sorted.
     */
    inline NeighborWindow window(int cell_id,
                                 const std::vector<Agent> &sorted) const {
        const auto r = ranges(cell_id);
        const std::span<const Agent> all(sorted);
        NeighborWindow w;
        for (int k = 0; k < 3; ++k) {
            w.bands[k] = all.subspan(r[k].begin, r[k].size());
        }
        return w;
    }

    inline const UniformGrid &grid() const noexcept { return m_grid; }

  private:
    /** @brief The underlying counting-sort grid */
    UniformGrid m_grid;

    /** @brief Layout from the last resize */
    GridLayout m_last_layout;

    /** @brief Agent count from the last resize */
    int m_last_count = -1;
};

} // namespace flock
