/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <vector>

#include "seamresize/pixel_grid.hpp"
#include "seamresize/seam.hpp"

namespace seamresize {

/**
 * @brief Removes a seam from the grid in-place
 *
 * A vertical seam removes one pixel per row (width - 1), a horizontal seam one pixel per column
 * (height - 1). The remaining pixels keep their relative order.
 *
 * @throws SeamLengthMismatch if the seam does not have one entry per row (vertical) or column
 *         (horizontal), OutOfRangeIndex if an entry is outside the grid, DegenerateGrid if the
 *         grid is already one pixel wide (vertical) or high (horizontal)
 */
void removeSeam(PixelGrid &grid, const Seam &seam);

/**
 * @brief Duplicates a seam into the grid (width or height + 1)
 *
 * For a vertical seam, row y gets a new pixel at column indices[y]; it is the average of its two
 * horizontal neighbours, or a copy of the right one in column 0. The horizontal seam is the row
 * analogue. Same errors as removeSeam(), except that a one-pixel grid can always grow.
 */
void insertSeam(PixelGrid &grid, const Seam &seam);

/**
 * @brief Inserts several seams of one orientation in a single pass
 *
 * All seams are in the coordinates of the grid as passed in (as returned by
 * findSeamsForInsertion()); the dimension grows by seams.size().
 *
 * @throws SeamLengthMismatch if the seams do not all share one orientation, plus the errors of
 *         insertSeam()
 */
void insertSeams(PixelGrid &grid, const std::vector<Seam> &seams);

} // namespace seamresize
