/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <cstdint>
#include <vector>

#include "seamresize/energy_map.hpp"
#include "seamresize/options.hpp"
#include "seamresize/pixel_grid.hpp"
#include "seamresize/seam.hpp"

namespace seamresize {

// Progress of one axis towards its target size
enum class AxisState { Shrinking, Growing, Done };

struct ResizeStats {
    int vertical_removals = 0;
    int horizontal_removals = 0;
    int vertical_insertions = 0;
    int horizontal_insertions = 0;
    int iterations = 0;
};

/**
 * @brief Carves a grid towards a target size, one seam cycle per step
 *
 * Every step runs one EnergyMap -> SeamFinder -> SeamOperator cycle on one axis (or, with
 * Enlargement::Batched, one batched insertion). Width and height are tracked independently; when
 * both still need work the axis is picked by ResizeOptions::order. The default, strict
 * alternation starting with width, keeps the energy map from going stale for one axis while the
 * other is carved; a "width first" order gives visibly different output for non-square resizes.
 *
 * The grid is complete and valid after every step, so a caller may stop between steps.
 */
class Resizer {
  public:
    /**
     * @param grid          Grid to carve; the Resizer owns it until release()
     * @param target_width  Desired width (>= 1)
     * @param target_height Desired height (>= 1)
     * @throws InvalidTarget if a target dimension is zero or negative
     */
    Resizer(PixelGrid grid, int target_width, int target_height, ResizeOptions options = {});

    // Performs one iteration; returns true while the target has not been reached
    bool step();

    // Steps until both axes are Done
    void run();

    bool done() const;
    AxisState widthState() const;
    AxisState heightState() const;

    const PixelGrid &grid() const { return grid_; }
    const ResizeStats &stats() const { return stats_; }

    // Hands the grid back to the caller; the Resizer must not be used afterwards
    PixelGrid release();

  private:
    // Energy of the current grid, re-derived from the previous one when allowed
    const EnergyMap &currentEnergy();

    Orientation nextAxis();
    void apply(const Seam &seam);
    void growBatched(Orientation orientation);

    PixelGrid grid_;
    int target_width_;
    int target_height_;
    ResizeOptions options_;
    ResizeStats stats_;

    Orientation alternate_next_ = Orientation::Vertical;
    EnergyMap energy_;
    bool energy_valid_ = false;
};

struct ResizeResult {
    std::vector<std::uint8_t> pixels;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint8_t channels = 0;
    ResizeStats stats;
};

/**
 * @brief Resizes a raw pixel buffer to the target size with seam carving
 *
 * Narrows/widens with vertical seams and lowers/heightens with horizontal seams until the image
 * is exactly target_width x target_height. Resizing to the current size returns the pixels
 * unchanged without any iteration.
 *
 * @param pixels   Row-major, channel-interleaved 8-bit pixel data
 * @param width    Image width
 * @param height   Image height
 * @param channels Components per pixel
 * @throws ShapeError if pixels.size() != width * height * channels or a dimension is zero
 * @throws InvalidTarget if target_width or target_height is zero
 */
ResizeResult resize(const std::vector<std::uint8_t> &pixels, std::uint32_t width,
                    std::uint32_t height, std::uint8_t channels, std::uint32_t target_width,
                    std::uint32_t target_height, const ResizeOptions &options = {});

} // namespace seamresize
