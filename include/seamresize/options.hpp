/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

namespace seamresize {

// Which axis the Resizer works on when both width and height still differ from the target
enum class AxisOrder {
    Alternate,   // one width step, one height step, repeating (starts with width)
    WidthFirst,  // every width step, then every height step
    CheapestSeam // whichever axis currently has the lower-energy seam (ties go to width)
};

// How a growing axis gains its new columns/rows
enum class Enlargement {
    SingleSeam, // find and duplicate one seam per step
    Batched     // find the k lowest disjoint seams in one pass and insert them together
};

// How the energy map is refreshed between iterations
enum class EnergyUpdate {
    Full,       // recompute the whole map every iteration
    Incremental // re-derive the previous map around the applied seam only
};

// Which implementation computes a full energy map (both give identical values)
enum class EnergyKernel {
    Direct, // per-pixel loop, rows evaluated in parallel
    OpenCV  // vectorised cv::Mat arithmetic
};

/**
 * @brief Settings of a single resize run
 *
 * Defaults give the reference behaviour: strict axis alternation, single-seam duplication and a
 * full energy recompute every iteration.
 */
struct ResizeOptions {
    AxisOrder order = AxisOrder::Alternate;
    Enlargement enlargement = Enlargement::SingleSeam;
    EnergyUpdate energy_update = EnergyUpdate::Full;
    EnergyKernel energy_kernel = EnergyKernel::OpenCV;
};

} // namespace seamresize
