/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <vector>

#include "seamresize/energy_map.hpp"
#include "seamresize/options.hpp"
#include "seamresize/pixel_grid.hpp"
#include "seamresize/seam.hpp"

namespace seamresize {

/**
 * @brief Finds the lowest energy vertical seam using Dynamic Programming for global optimality.
 *
 * The algorithm works by:
 * 1. Copying the first energy row into a cumulative cost table
 * 2. For every following row, adding to each pixel the cheapest of the three cells above it
 *    (left, centre, right), treating cells outside the map as infinitely expensive, and storing
 *    which of them was taken
 * 3. Backtracking from the cheapest cell of the last row through the stored back-pointers
 *
 * Ties are broken towards the smaller column, both between predecessors and for the end point,
 * so the same map always gives the same seam. O(width * height) time and memory; the table is
 * released before returning.
 *
 * @param energy Energy map of the current grid
 * @return Seam with indices[y] = column of the seam pixel in row y and the path's total energy
 * @throws DegenerateGrid if the map has no rows or no columns
 */
Seam findVerticalSeam(const EnergyMap &energy);

/**
 * @brief Finds the lowest energy horizontal seam
 *
 * Exact transpose of findVerticalSeam(): the table is filled column by column and ties go to the
 * smaller row. indices[x] is the row of the seam pixel in column x.
 */
Seam findHorizontalSeam(const EnergyMap &energy);

Seam findSeam(const EnergyMap &energy, Orientation orientation);

/**
 * @brief Finds `count` disjoint low-energy seams of a grid for simultaneous insertion
 *
 * Inserting the single cheapest seam k times would stretch one stripe of the image. Instead the
 * seams are taken one after another from a working copy that has the previous ones removed; an
 * index map remembers where every remaining cell sits in the original grid, so the returned seams
 * are expressed in `grid` coordinates and never share a pixel. They are not necessarily connected
 * once mapped back.
 *
 * @param grid        Grid to be enlarged
 * @param orientation Vertical seams to widen, horizontal seams to heighten
 * @param count       Number of seams, 1 <= count <= width (vertical) or height (horizontal)
 * @param kernel      Energy implementation used on the working copy
 * @throws OutOfRangeIndex if count is outside that range
 */
std::vector<Seam> findSeamsForInsertion(const PixelGrid &grid, Orientation orientation,
                                        int count, EnergyKernel kernel);

} // namespace seamresize
