#include "uniformgrid.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace flock {

void UniformGrid::reset() {
    m_cell = 1.f;
    m_inv_cell = 1.f;
    m_cols = 0;
    m_rows = 0;
    m_offsets.clear();
    m_item_cell.clear();
    m_item_rank.clear();
}

bool UniformGrid::fits(const GridLayout &layout, Vec2 pos) {
    if (!(layout.cell_size > 0.f)) {
        return false;
    }
    const float inv_cell = 1.f / layout.cell_size;
    const float fx = std::floor(pos.x * inv_cell + (float)(layout.dim_x / 2));
    const float fy = std::floor(pos.y * inv_cell + (float)(layout.dim_y / 2));
    return fx >= 1.f && fx <= (float)(layout.dim_x - 2) && fy >= 1.f &&
           fy <= (float)(layout.dim_y - 2);
}

void UniformGrid::resize(const GridLayout &layout, int count) {
    if (!(layout.cell_size > 0.f) || layout.dim_x < 3 || layout.dim_y < 3) {
        throw ConfigError(fmt::format("Invalid grid layout: {} x {} cells of {}",
                                      layout.dim_x, layout.dim_y,
                                      layout.cell_size));
    }
    if (count < 0) {
        throw ConfigError(fmt::format("Invalid agent count: {}", count));
    }

    LOG_DEBUG(fmt::format("Resizing grid to {} x {} cells of {} for {} agents",
                          layout.dim_x, layout.dim_y, layout.cell_size,
                          count));

    m_cell = layout.cell_size;
    m_inv_cell = 1.f / layout.cell_size;
    m_cols = layout.dim_x;
    m_rows = layout.dim_y;

    m_offsets.assign(layout.total_cells(), 0);
    m_item_cell.assign(count, 0);
    m_item_rank.assign(count, 0);
}

void UniformGrid::rebuild(const std::vector<Agent> &agents,
                          std::vector<Agent> &sorted) {
    const int count = (int)agents.size();
    if (m_offsets.empty() || (int)m_item_cell.size() != count) {
        throw SimulationError(fmt::format(
            "grid sized for {} agents, rebuild called with {}",
            m_item_cell.size(), count));
    }

    std::fill(m_offsets.begin(), m_offsets.end(), 0);

    // Histogram: per-cell counters double as in-cell ranks
    for (int i = 0; i < count; ++i) {
        int cx, cy;
        if (!locate(agents[i].position, cx, cy)) {
            throw ConfigError(fmt::format(
                "agent {} at ({}, {}) left the padded {} x {} grid; increase "
                "grid_padding",
                i, agents[i].position.x, agents[i].position.y, m_cols,
                m_rows));
        }
        const int ci = cy * m_cols + cx;
        m_item_cell[i] = ci;
        m_item_rank[i] = m_offsets[ci]++;
    }

    // Counts -> cumulative upper bounds
    const int cells = (int)m_offsets.size();
    for (int ci = 1; ci < cells; ++ci) {
        m_offsets[ci] += m_offsets[ci - 1];
    }

    if ((int)sorted.size() != count) {
        sorted.resize(count);
    }

    for (int i = 0; i < count; ++i) {
        const int index = m_offsets[m_item_cell[i]] - 1 - m_item_rank[i];
        sorted[index] = agents[i];
    }
}

} // namespace flock
