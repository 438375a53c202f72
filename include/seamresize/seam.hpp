/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <cstdint>
#include <vector>

namespace seamresize {

enum class Orientation {
    Vertical,  // top to bottom, one column index per row; changes the width
    Horizontal // left to right, one row index per column; changes the height
};

/**
 * @brief A one-pixel-wide path across the grid
 *
 * indices[i] is the column of the seam pixel in row i (vertical seam) or the row of the seam
 * pixel in column i (horizontal seam). Seams coming out of the DP search are 8-connected:
 * adjacent entries differ by at most 1.
 */
struct Seam {
    Orientation orientation = Orientation::Vertical;
    std::vector<int> indices;
    std::uint64_t cost = 0; // total energy along the path
};

} // namespace seamresize
