/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <chrono> // for timing
#include <cstdint>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "seamresize/errors.hpp"
#include "seamresize/matrix.hpp"
#include "seamresize/seam_finder.hpp"

namespace seamresize {

namespace {

// DP over a `length` x `breadth` table: step i of the path picks one of `breadth` positions.
// energy_at(i, j) is the energy of position j at step i. For a vertical seam a step is a row and
// a position is a column; the horizontal seam swaps the two.
template <typename EnergyAt>
std::vector<int> carvePath(int length, int breadth, EnergyAt energy_at, std::uint64_t &total) {

    // Cumulative energy table and, per cell, the offset (-1, 0, +1) of the predecessor taken
    Matrix<std::uint64_t> cost(breadth, length);
    Matrix<std::int8_t> from(breadth, length);

    for (int j = 0; j < breadth; j++) {
        cost.at(0, j) = energy_at(0, j);
    }

    for (int i = 1; i < length; i++) { // every earlier step is already final
        for (int j = 0; j < breadth; j++) {

            // Start with the cell straight above; the left one wins ties, the right one only
            // replaces a strictly larger value. Cells outside the table are never candidates.
            int best_j = j;
            std::uint64_t best_cost = cost.at(i - 1, j);

            if (j > 0 && cost.at(i - 1, j - 1) <= best_cost) {
                best_j = j - 1;
                best_cost = cost.at(i - 1, j - 1);
            }
            if (j < breadth - 1 && cost.at(i - 1, j + 1) < best_cost) {
                best_j = j + 1;
                best_cost = cost.at(i - 1, j + 1);
            }

            cost.at(i, j) = best_cost + energy_at(i, j);
            from.at(i, j) = static_cast<std::int8_t>(best_j - j);
        }
    }

    // Cheapest end point in the last step, smallest position on ties
    const int last = length - 1;
    int end_j = 0;
    for (int j = 1; j < breadth; j++) {
        if (cost.at(last, j) < cost.at(last, end_j)) {
            end_j = j;
        }
    }
    total = cost.at(last, end_j);

    std::vector<int> path(length);
    path[last] = end_j;
    for (int i = last; i > 0; i--) {
        path[i - 1] = path[i] + from.at(i, path[i]);
    }
    return path;
}

void checkNotDegenerate(const EnergyMap &energy, const char *operation) {
    if (energy.empty()) {
        spdlog::error("{}: energy map is {}x{}", operation, energy.width(), energy.height());
        throw DegenerateGrid(fmt::format("{}: energy map is {}x{}", operation, energy.width(),
                                         energy.height()));
    }
}

} // namespace

Seam findVerticalSeam(const EnergyMap &energy) {
    checkNotDegenerate(energy, "findVerticalSeam");

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    Seam seam;
    seam.orientation = Orientation::Vertical;
    seam.indices = carvePath(
        energy.height(), energy.width(),
        [&energy](int y, int x) -> std::uint64_t { return energy.at(y, x); }, seam.cost);

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("findVerticalSeam: {}x{} map took {} μs", energy.width(), energy.height(),
                  duration.count());
#endif

    return seam;
}

Seam findHorizontalSeam(const EnergyMap &energy) {
    checkNotDegenerate(energy, "findHorizontalSeam");

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    Seam seam;
    seam.orientation = Orientation::Horizontal;
    seam.indices = carvePath(
        energy.width(), energy.height(),
        [&energy](int x, int y) -> std::uint64_t { return energy.at(y, x); }, seam.cost);

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("findHorizontalSeam: {}x{} map took {} μs", energy.width(), energy.height(),
                  duration.count());
#endif

    return seam;
}

Seam findSeam(const EnergyMap &energy, Orientation orientation) {
    return orientation == Orientation::Vertical ? findVerticalSeam(energy)
                                                : findHorizontalSeam(energy);
}

std::vector<Seam> findSeamsForInsertion(const PixelGrid &grid, Orientation orientation,
                                        int count, EnergyKernel kernel) {

    // Horizontal seams of the grid are vertical seams of its transpose, and the energy formula is
    // symmetric, so one code path serves both orientations.
    PixelGrid work = orientation == Orientation::Vertical ? grid : grid.transposed();

    if (count < 1 || count > work.width()) {
        spdlog::error("findSeamsForInsertion: cannot take {} disjoint seams across {} pixels",
                      count, work.width());
        throw OutOfRangeIndex(fmt::format("cannot take {} disjoint seams across {} pixels", count,
                                          work.width()));
    }

    // origin.at(y, x) = column in the original grid of the working copy's pixel (y, x)
    Matrix<int> origin(work.width(), work.height());
    for (int y = 0; y < work.height(); y++) {
        for (int x = 0; x < work.width(); x++) {
            origin.at(y, x) = x;
        }
    }

    std::vector<Seam> seams;
    seams.reserve(static_cast<size_t>(count));

    for (int k = 0; k < count; k++) {
        const Seam seam = findVerticalSeam(computeEnergy(work, kernel));

        Seam mapped;
        mapped.orientation = orientation;
        mapped.cost = seam.cost;
        mapped.indices.resize(seam.indices.size());
        for (size_t y = 0; y < seam.indices.size(); y++) {
            mapped.indices[y] = origin.at(static_cast<int>(y), seam.indices[y]);
        }
        seams.push_back(std::move(mapped));

        // The last seam does not need to be carved out (and with count == width it could not be)
        if (k + 1 < count) {
            work.removeColumn(seam.indices);
            if (!origin.removeColumn(seam.indices)) {
                spdlog::error("findSeamsForInsertion: index map rejected seam {}", k);
                throw OutOfRangeIndex(fmt::format("index map rejected seam {}", k));
            }
        }
    }

    spdlog::trace("findSeamsForInsertion: {} {} seams found", count,
                  orientation == Orientation::Vertical ? "vertical" : "horizontal");
    return seams;
}

} // namespace seamresize
