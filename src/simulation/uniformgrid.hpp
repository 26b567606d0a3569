#ifndef __UNIFORM_GRID_HPP
#define __UNIFORM_GRID_HPP

#include <cmath>
#include <vector>

#include "agent.hpp"
#include "config.hpp"

namespace flock {

/**
 * @brief Flattened uniform grid rebuilt every tick by counting sort.
 *
 * @details
 * The grid is centred on the origin. A position (x,y) falls into cell
 *
 *     cx = floor(x / cell + dim_x / 2)      (dim_x / 2 is integer division)
 *     cy = floor(y / cell + dim_y / 2)
 *     id = dim_x * cy + cx
 *
 * Ids are row-major, so the cells (cx-1, cx, cx+1) of one row are three
 * consecutive ids. NeighborQuery depends on that layout.
 *
 * After @ref rebuild the offset table holds, for every cell c, the exclusive
 * upper bound in the sorted buffer of all agents whose id is <= c:
 *
 * - @c offsets()[c] is non-decreasing and @c offsets().back() == N
 * - the agents of cell c are @c sorted[cell_begin(c) .. cell_end(c))
 *
 * Only interior cells (1 <= cx <= dim_x-2, 1 <= cy <= dim_y-2) accept agents.
 * That keeps every read of the 3x3 window, including the `-2..+1` offset
 * reads, inside the table without any clamping.
 *
 * Typical usage pattern:
 * @code
 * grid.resize(layout, N);
 * grid.rebuild(live, sorted);      // once per tick
 *
 * int c = grid.cell_id_of(sorted[i].position);
 * for (int k = grid.cell_begin(c); k < grid.cell_end(c); ++k) {
 *     // ... sorted[k] shares a cell with sorted[i] ...
 * }
 * @endcode
 *
 * Complexity:
 * - rebuild: O(N + cells) time, O(cells + N) memory, no allocation once
 *   resized
 *
 * The structure is not thread-safe by itself; it can be read concurrently
 * after @ref rebuild returns.
 */
class UniformGrid {
  public:
    UniformGrid() = default;
    ~UniformGrid() = default;
    UniformGrid(const UniformGrid &) = delete;
    UniformGrid(UniformGrid &&) = delete;
    UniformGrid &operator=(const UniformGrid &) = delete;
    UniformGrid &operator=(UniformGrid &&) = delete;

    /**
     * @brief Drop all buffers and return to an unsized grid.
     */
    void reset();

    inline float cell_size() const { return m_cell; }
    inline float inv_cell() const { return m_inv_cell; }
    inline int cols() const { return m_cols; }
    inline int rows() const { return m_rows; }
    inline int total_cells() const { return (int)m_offsets.size(); }
    inline bool empty() const { return m_offsets.empty(); }

    /**
     * @brief Map a position to cell coordinates.
     * @return false if the position is non-finite or outside the interior
     * cells; @p cx / @p cy are left untouched in that case.
     */
    inline bool locate(Vec2 pos, int &cx, int &cy) const {
        const float fx = std::floor(pos.x * m_inv_cell + (float)(m_cols / 2));
        const float fy = std::floor(pos.y * m_inv_cell + (float)(m_rows / 2));
        // NaN fails both comparisons
        if (!(fx >= 1.f && fx <= (float)(m_cols - 2)) ||
            !(fy >= 1.f && fy <= (float)(m_rows - 2))) {
            return false;
        }
        cx = (int)fx;
        cy = (int)fy;
        return true;
    }

    /**
     * @brief True if @p pos would land in an interior cell of a grid shaped
     * like @p layout. Same arithmetic as @ref locate, usable before the grid
     * is sized.
     */
    static bool fits(const GridLayout &layout, Vec2 pos);

    /**
     * @brief Flat cell id of an interior position, or -1.
     */
    inline int cell_id_of(Vec2 pos) const {
        int cx, cy;
        if (!locate(pos, cx, cy)) {
            return -1;
        }
        return m_cols * cy + cx;
    }

    /**
     * @brief Convert (cx,cy) cell coordinates to a flat cell index, or -1 if
     * out of range.
     */
    inline int cell_index(int cx, int cy) const {
        if (cx < 0 || cy < 0 || cx >= m_cols || cy >= m_rows) {
            return -1;
        }
        return cy * m_cols + cx;
    }

    /**
     * @brief True if the 3x3 window around cell @p ci can be read safely.
     */
    inline bool is_interior(int ci) const {
        if (ci < 0 || ci >= total_cells()) {
            return false;
        }
        const int cx = ci % m_cols;
        const int cy = ci / m_cols;
        return cx >= 1 && cx <= m_cols - 2 && cy >= 1 && cy <= m_rows - 2;
    }

    /**
     * @brief Read-only view of the cumulative offset table (size cells).
     */
    inline const std::vector<int> &offsets() const { return m_offsets; }
    inline int offset_at(int ci) const { return m_offsets[ci]; }

    /** @brief First sorted index of cell @p ci (offsets[ci-1], or 0). */
    inline int cell_begin(int ci) const {
        return ci <= 0 ? 0 : m_offsets[ci - 1];
    }
    /** @brief One past the last sorted index of cell @p ci. */
    inline int cell_end(int ci) const { return m_offsets[ci]; }
    inline int cell_count_at(int ci) const {
        return cell_end(ci) - cell_begin(ci);
    }

    /**
     * @brief Per-agent cell id and in-cell rank recorded by the last
     * rebuild, indexed by the agent's slot in the input buffer.
     */
    inline const std::vector<int> &item_cells() const { return m_item_cell; }
    inline const std::vector<int> &item_ranks() const { return m_item_rank; }

    /**
     * @brief Size the grid for @p layout and @p count agents.
     * @details Allocates the offset table (dim_x*dim_y) and the per-agent
     * scratch. Must be called before @ref rebuild whenever the layout or the
     * agent count changes.
     * @throws ConfigError if the layout is degenerate
     */
    void resize(const GridLayout &layout, int count);

    /**
     * @brief Counting-sort @p agents by cell into @p sorted.
     *
     * @details
     *  1) clear the offset table
     *  2) for each agent i: record its cell c_i and rank r_i (the number of
     *     agents already seen in c_i), then bump the count of c_i
     *  3) prefix-sum the counts in place: offsets[c] += offsets[c-1]
     *  4) scatter: sorted[offsets[c_i] - 1 - r_i] = agents[i]
     *
     * Inside a cell the scatter reverses the input order. Only the ranges
     * matter to readers, but the order is deterministic.
     *
     * @throws ConfigError if an agent lies outside the interior cells; the
     * check runs before anything is written to @p sorted
     * @throws SimulationError if the grid was not sized for @p agents
     */
    void rebuild(const std::vector<Agent> &agents, std::vector<Agent> &sorted);

  private:
    // Grid configuration
    float m_cell = 1.f;     ///< Cell size (world units)
    float m_inv_cell = 1.f; ///< 1 / cell size
    int m_cols = 0;         ///< dim_x
    int m_rows = 0;         ///< dim_y

    /**
     * @brief Cumulative offsets (size rows*cols).
     */
    std::vector<int> m_offsets;

    // transient buffers reused across rebuilds
    std::vector<int> m_item_cell; // size N
    std::vector<int> m_item_rank; // size N
};

} // namespace flock

#endif
