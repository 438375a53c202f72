/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <chrono> // for timing
#include <spdlog/spdlog.h>

#include "seamresize/errors.hpp"
#include "seamresize/seam_operator.hpp"

namespace seamresize {

void removeSeam(PixelGrid &grid, const Seam &seam) {

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    if (seam.orientation == Orientation::Vertical) {
        grid.removeColumn(seam.indices);
    }
    else {
        grid.removeRow(seam.indices);
    }

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("removeSeam: now {}x{}, took {} μs", grid.width(), grid.height(),
                  duration.count());
#endif
}

void insertSeam(PixelGrid &grid, const Seam &seam) {
    if (seam.orientation == Orientation::Vertical) {
        grid.insertColumn(seam.indices);
    }
    else {
        grid.insertRow(seam.indices);
    }
}

void insertSeams(PixelGrid &grid, const std::vector<Seam> &seams) {
    if (seams.empty()) {
        return;
    }

    const Orientation orientation = seams.front().orientation;
    std::vector<std::vector<int>> positions;
    positions.reserve(seams.size());
    for (const Seam &seam : seams) {
        if (seam.orientation != orientation) {
            spdlog::error("insertSeams: vertical and horizontal seams mixed in one batch");
            throw SeamLengthMismatch("insertSeams: vertical and horizontal seams mixed in one batch");
        }
        positions.push_back(seam.indices);
    }

    if (orientation == Orientation::Vertical) {
        grid.insertColumns(positions);
    }
    else {
        grid.insertRows(positions);
    }

    spdlog::trace("insertSeams: {} seams inserted, now {}x{}", seams.size(), grid.width(),
                  grid.height());
}

} // namespace seamresize
