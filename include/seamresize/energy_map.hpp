/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <cstdint>

#include "seamresize/matrix.hpp"
#include "seamresize/options.hpp"
#include "seamresize/pixel_grid.hpp"
#include "seamresize/seam.hpp"

namespace seamresize {

// One non-negative importance value per pixel, same shape as the grid it was computed from
using EnergyMap = Matrix<std::uint32_t>;

/**
 * @brief Calculates the energy of a single pixel (dual-gradient energy)
 *
 * The energy is the sum, over all channels, of the squared difference between the right and left
 * neighbours plus the squared difference between the lower and upper neighbours. A neighbour
 * outside the grid is replaced by the pixel itself, so a border pixel is compared against its one
 * available neighbour.
 *
 * Cheap enough to be called for a handful of pixels per row, which is what the incremental
 * update relies on.
 *
 * @param grid Current pixel grid
 * @param row  Row of the pixel (0 <= row < height)
 * @param col  Column of the pixel (0 <= col < width)
 * @return Energy value for the specified pixel
 */
std::uint32_t calculateSinglePixelEnergy(const PixelGrid &grid, int row, int col);

/**
 * @brief Computes the energy map pixel by pixel
 *
 * Reference implementation. Rows are independent and are evaluated in parallel with
 * cv::parallel_for_; the result does not depend on the number of threads.
 */
EnergyMap computeEnergyMap(const PixelGrid &grid);

/**
 * @brief Computes the energy map with OpenCV matrix arithmetic
 *
 * Pads the image with replicated borders, takes the horizontal and vertical central differences
 * in 32-bit integers, squares them and sums the channels. Produces exactly the same values as
 * computeEnergyMap().
 */
EnergyMap computeEnergyMapCv(const PixelGrid &grid);

// Full energy map computed by the selected kernel
EnergyMap computeEnergy(const PixelGrid &grid, EnergyKernel kernel);

/**
 * @brief Incrementally updates the energy map after a seam was removed from the grid
 *
 * Instead of recalculating the whole map, the seam cells are dropped from the map (so it has the
 * grid's new shape and stride) and only the cells next to the seam, whose neighbours changed, are
 * recomputed. The result is identical to computeEnergyMap(grid).
 *
 * @param energy Map of the grid before the removal; updated in-place
 * @param grid   Grid after the removal
 * @param seam   The seam that was removed, in the coordinates of the old grid
 * @throws ShapeError if the map does not match the grid, SeamLengthMismatch/OutOfRangeIndex for
 *         a seam that does not fit the map
 */
void updateEnergyMapAfterRemoval(EnergyMap &energy, const PixelGrid &grid, const Seam &seam);

/**
 * @brief Incrementally updates the energy map after a seam was inserted into the grid
 *
 * @param energy Map of the grid before the insertion; updated in-place
 * @param grid   Grid after the insertion
 * @param seam   The seam that was inserted, in the coordinates of the old grid
 */
void updateEnergyMapAfterInsertion(EnergyMap &energy, const PixelGrid &grid, const Seam &seam);

} // namespace seamresize
