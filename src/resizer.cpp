/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <algorithm> // for std::min
#include <chrono>    // for timing
#include <climits>   // for INT_MAX
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <utility>

#include "seamresize/errors.hpp"
#include "seamresize/resizer.hpp"
#include "seamresize/seam_finder.hpp"
#include "seamresize/seam_operator.hpp"

namespace seamresize {

namespace {

AxisState axisState(int current, int target) {
    if (current > target) {
        return AxisState::Shrinking;
    }
    if (current < target) {
        return AxisState::Growing;
    }
    return AxisState::Done;
}

const char *axisName(Orientation orientation) {
    return orientation == Orientation::Vertical ? "width" : "height";
}

} // namespace

Resizer::Resizer(PixelGrid grid, int target_width, int target_height, ResizeOptions options)
    : grid_(std::move(grid)), target_width_(target_width), target_height_(target_height),
      options_(options) {

    if (target_width <= 0 || target_height <= 0) {
        spdlog::error("Resizer: invalid target size {}x{}", target_width, target_height);
        throw InvalidTarget(
            fmt::format("invalid target size {}x{}", target_width, target_height));
    }
}

AxisState Resizer::widthState() const { return axisState(grid_.width(), target_width_); }

AxisState Resizer::heightState() const { return axisState(grid_.height(), target_height_); }

bool Resizer::done() const {
    return widthState() == AxisState::Done && heightState() == AxisState::Done;
}

const EnergyMap &Resizer::currentEnergy() {
    if (!energy_valid_) {
        energy_ = computeEnergy(grid_, options_.energy_kernel);
        energy_valid_ = true;
    }
    return energy_;
}

// Only called while both axes still need work
Orientation Resizer::nextAxis() {
    switch (options_.order) {
    case AxisOrder::WidthFirst:
        return Orientation::Vertical;
    case AxisOrder::Alternate:
    case AxisOrder::CheapestSeam:
        break;
    }

    const Orientation axis = alternate_next_;
    alternate_next_ = axis == Orientation::Vertical ? Orientation::Horizontal
                                                    : Orientation::Vertical;
    return axis;
}

bool Resizer::step() {
    const AxisState width_state = widthState();
    const AxisState height_state = heightState();

    if (width_state == AxisState::Done && height_state == AxisState::Done) {
        return false;
    }

    const bool both_active = width_state != AxisState::Done && height_state != AxisState::Done;
    const bool batched = options_.enlargement == Enlargement::Batched;

    if (both_active && options_.order == AxisOrder::CheapestSeam) {
        // Both candidate seams come from the same map; the cheaper one wins, width on ties
        const EnergyMap &energy = currentEnergy();
        const Seam vertical = findVerticalSeam(energy);
        const Seam horizontal = findHorizontalSeam(energy);
        const Seam &cheaper = horizontal.cost < vertical.cost ? horizontal : vertical;

        const AxisState state =
            cheaper.orientation == Orientation::Vertical ? width_state : height_state;
        if (state == AxisState::Growing && batched) {
            growBatched(cheaper.orientation);
        }
        else {
            apply(cheaper);
        }
    }
    else {
        Orientation axis;
        if (width_state == AxisState::Done) {
            axis = Orientation::Horizontal;
        }
        else if (height_state == AxisState::Done) {
            axis = Orientation::Vertical;
        }
        else {
            axis = nextAxis();
        }

        const AxisState state = axis == Orientation::Vertical ? width_state : height_state;
        if (state == AxisState::Growing && batched) {
            growBatched(axis);
        }
        else {
            apply(findSeam(currentEnergy(), axis));
        }
    }

    stats_.iterations++;
    spdlog::trace("step {}: grid is now {}x{}", stats_.iterations, grid_.width(), grid_.height());

    return !done();
}

void Resizer::apply(const Seam &seam) {
    const bool vertical = seam.orientation == Orientation::Vertical;
    const AxisState state = vertical ? widthState() : heightState();

    // energy_ still describes the grid before this seam; keep it only if it can be re-derived
    const bool incremental = options_.energy_update == EnergyUpdate::Incremental && energy_valid_;

    if (state == AxisState::Shrinking) {
        removeSeam(grid_, seam);
        if (incremental) {
            updateEnergyMapAfterRemoval(energy_, grid_, seam);
        }
        if (vertical) {
            stats_.vertical_removals++;
        }
        else {
            stats_.horizontal_removals++;
        }
    }
    else {
        insertSeam(grid_, seam);
        if (incremental) {
            updateEnergyMapAfterInsertion(energy_, grid_, seam);
        }
        if (vertical) {
            stats_.vertical_insertions++;
        }
        else {
            stats_.horizontal_insertions++;
        }
    }

    energy_valid_ = incremental;
}

// One batched step: as many disjoint seams as the target needs, but never more than the current
// size of the axis (there are not more disjoint seams than that).
void Resizer::growBatched(Orientation orientation) {
    const bool vertical = orientation == Orientation::Vertical;
    const int current = vertical ? grid_.width() : grid_.height();
    const int target = vertical ? target_width_ : target_height_;
    const int count = std::min(target - current, current);

    const std::vector<Seam> seams =
        findSeamsForInsertion(grid_, orientation, count, options_.energy_kernel);
    insertSeams(grid_, seams);

    if (vertical) {
        stats_.vertical_insertions += count;
    }
    else {
        stats_.horizontal_insertions += count;
    }

    // Batched insertion changes too much of the grid for an incremental update
    energy_valid_ = false;

    spdlog::trace("growBatched: {} seams added to the {}", count, axisName(orientation));
}

void Resizer::run() {

    spdlog::debug("Seam carving: {}x{} -> {}x{}", grid_.width(), grid_.height(), target_width_,
                  target_height_);

#ifdef DEBUG
    auto seam_carving_start = std::chrono::high_resolution_clock::now();
#endif

    while (step()) {
    }

#ifdef DEBUG
    auto seam_carving_end = std::chrono::high_resolution_clock::now();
    auto seam_carving_duration = std::chrono::duration_cast<std::chrono::microseconds>(
        seam_carving_end - seam_carving_start);
    spdlog::debug("Seam carving took {} μs ({:.2f} ms)", seam_carving_duration.count(),
                  seam_carving_duration.count() / 1000.0);
    if (stats_.iterations > 0) {
        double avg_step_time =
            static_cast<double>(seam_carving_duration.count()) / stats_.iterations;
        spdlog::debug("Average time per step: {:.2f} μs ({:.2f} ms)", avg_step_time,
                      avg_step_time / 1000.0);
    }
#endif

    spdlog::debug("Seam carving: {} iterations ({} + {} removed, {} + {} inserted), now {}x{}",
                  stats_.iterations, stats_.vertical_removals, stats_.horizontal_removals,
                  stats_.vertical_insertions, stats_.horizontal_insertions, grid_.width(),
                  grid_.height());
}

PixelGrid Resizer::release() {
    energy_valid_ = false;
    return std::move(grid_);
}

ResizeResult resize(const std::vector<std::uint8_t> &pixels, std::uint32_t width,
                    std::uint32_t height, std::uint8_t channels, std::uint32_t target_width,
                    std::uint32_t target_height, const ResizeOptions &options) {

    // Both caller errors are detected before any copy or seam work
    const size_t expected =
        static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
    const std::uint32_t max_side = static_cast<std::uint32_t>(INT_MAX);
    if (width == 0 || height == 0 || channels == 0 || width > max_side || height > max_side ||
        pixels.size() != expected) {
        spdlog::error("resize: buffer of {} bytes does not describe a {}x{}x{} image",
                      pixels.size(), width, height, static_cast<int>(channels));
        throw ShapeError(fmt::format("buffer of {} bytes does not describe a {}x{}x{} image",
                                     pixels.size(), width, height, static_cast<int>(channels)));
    }
    if (target_width == 0 || target_height == 0 || target_width > max_side ||
        target_height > max_side) {
        spdlog::error("resize: invalid target size {}x{}", target_width, target_height);
        throw InvalidTarget(fmt::format("invalid target size {}x{}", target_width, target_height));
    }

    Resizer resizer(PixelGrid(pixels, static_cast<int>(width), static_cast<int>(height), channels),
                    static_cast<int>(target_width), static_cast<int>(target_height), options);
    resizer.run();

    ResizeResult result;
    result.stats = resizer.stats();

    PixelGrid grid = resizer.release();
    result.width = static_cast<std::uint32_t>(grid.width());
    result.height = static_cast<std::uint32_t>(grid.height());
    result.channels = channels;
    result.pixels = grid.takePixels();
    return result;
}

} // namespace seamresize
