/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <algorithm> // for std::min, std::max
#include <chrono>    // for timing
#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "seamresize/energy_map.hpp"
#include "seamresize/errors.hpp"

namespace seamresize {

namespace {

int squaredDifference(std::uint8_t a, std::uint8_t b) {
    const int diff = static_cast<int>(a) - static_cast<int>(b);
    return diff * diff;
}

// The map must have the grid's shape once `width_delta` / `height_delta` are applied to it
void checkReshape(const EnergyMap &energy, const PixelGrid &grid, int width_delta,
                  int height_delta, const char *operation) {
    if (energy.width() + width_delta != grid.width() ||
        energy.height() + height_delta != grid.height()) {
        spdlog::error("{}: energy map {}x{} does not belong to grid {}x{}", operation,
                      energy.width(), energy.height(), grid.width(), grid.height());
        throw ShapeError(fmt::format("{}: energy map {}x{} does not belong to grid {}x{}",
                                     operation, energy.width(), energy.height(), grid.width(),
                                     grid.height()));
    }
}

// Matrix seam methods only report success, so work out which contract the seam broke
[[noreturn]] void seamRejected(const EnergyMap &energy, const Seam &seam, const char *operation) {
    const int expected =
        seam.orientation == Orientation::Vertical ? energy.height() : energy.width();
    if (seam.indices.size() != static_cast<size_t>(expected)) {
        spdlog::error("{}: seam has {} entries, expected {}", operation, seam.indices.size(),
                      expected);
        throw SeamLengthMismatch(fmt::format("{}: seam has {} entries, expected {}", operation,
                                             seam.indices.size(), expected));
    }
    spdlog::error("{}: seam does not fit the {}x{} energy map", operation, energy.width(),
                  energy.height());
    throw OutOfRangeIndex(fmt::format("{}: seam does not fit the {}x{} energy map", operation,
                                      energy.width(), energy.height()));
}

// Recomputes the cells whose neighbourhood changed: for every row (vertical seam) or column
// (horizontal seam) that is [seam - 1, seam + 1], clamped to the grid.
void refreshAroundSeam(EnergyMap &energy, const PixelGrid &grid, const Seam &seam) {
    if (seam.orientation == Orientation::Vertical) {
        for (int y = 0; y < grid.height(); y++) {
            const int seam_x = seam.indices[y];
            for (int x = std::max(0, seam_x - 1); x <= std::min(grid.width() - 1, seam_x + 1);
                 x++) {
                energy.at(y, x) = calculateSinglePixelEnergy(grid, y, x);
            }
        }
    }
    else {
        for (int x = 0; x < grid.width(); x++) {
            const int seam_y = seam.indices[x];
            for (int y = std::max(0, seam_y - 1); y <= std::min(grid.height() - 1, seam_y + 1);
                 y++) {
                energy.at(y, x) = calculateSinglePixelEnergy(grid, y, x);
            }
        }
    }
}

} // namespace

std::uint32_t calculateSinglePixelEnergy(const PixelGrid &grid, int row, int col) {
    const int width = grid.width();
    const int height = grid.height();
    const int channels = grid.channels();

    // Clamping at the borders: a missing neighbour is the centre pixel itself
    const std::uint8_t *left = grid.pixel(row, std::max(col - 1, 0));
    const std::uint8_t *right = grid.pixel(row, std::min(col + 1, width - 1));
    const std::uint8_t *up = grid.pixel(std::max(row - 1, 0), col);
    const std::uint8_t *down = grid.pixel(std::min(row + 1, height - 1), col);

    std::uint32_t energy = 0;
    for (int ch = 0; ch < channels; ch++) {
        energy += static_cast<std::uint32_t>(squaredDifference(right[ch], left[ch]) +
                                             squaredDifference(down[ch], up[ch]));
    }
    return energy;
}

EnergyMap computeEnergyMap(const PixelGrid &grid) {

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    EnergyMap energy(grid.width(), grid.height());

    // Each row only reads the grid and writes its own slice of the map
    cv::parallel_for_(cv::Range(0, grid.height()), [&](const cv::Range &rows) {
        for (int y = rows.start; y < rows.end; y++) {
            for (int x = 0; x < grid.width(); x++) {
                energy.at(y, x) = calculateSinglePixelEnergy(grid, y, x);
            }
        }
    });

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("computeEnergyMap: {}x{} grid took {} μs", grid.width(), grid.height(),
                  duration.count());
#endif

    return energy;
}

EnergyMap computeEnergyMapCv(const PixelGrid &grid) {

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    const int width = grid.width();
    const int height = grid.height();

    // Wrap the grid buffer in a cv::Mat header (no copy), one 8-bit component per channel
    cv::Mat src(height, width, CV_8UC(grid.channels()),
                const_cast<std::uint8_t *>(grid.data().data()));

    // One replicated pixel on every side: the "neighbour" of a border pixel is the pixel itself
    cv::Mat padded;
    cv::copyMakeBorder(src, padded, 1, 1, 1, 1, cv::BORDER_REPLICATE);

    // Differences of 8-bit values need a signed type, squares of them fit easily in 32 bits
    cv::Mat wide;
    padded.convertTo(wide, CV_32S);

    cv::Mat dx, dy;
    cv::subtract(wide(cv::Rect(2, 1, width, height)), wide(cv::Rect(0, 1, width, height)), dx);
    cv::subtract(wide(cv::Rect(1, 2, width, height)), wide(cv::Rect(1, 0, width, height)), dy);

    cv::Mat dx2, dy2, squared;
    cv::multiply(dx, dx, dx2);
    cv::multiply(dy, dy, dy2);
    cv::add(dx2, dy2, squared);

    // Sum the channels into a single-channel map
    std::vector<cv::Mat> planes;
    cv::split(squared, planes);
    cv::Mat total = planes[0];
    for (size_t ch = 1; ch < planes.size(); ch++) {
        cv::add(total, planes[ch], total);
    }

    EnergyMap energy(width, height);
    for (int y = 0; y < height; y++) {
        const int *row = total.ptr<int>(y);
        for (int x = 0; x < width; x++) {
            energy.at(y, x) = static_cast<std::uint32_t>(row[x]);
        }
    }

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("computeEnergyMapCv: {}x{} grid took {} μs", width, height, duration.count());
#endif

    return energy;
}

EnergyMap computeEnergy(const PixelGrid &grid, EnergyKernel kernel) {
    switch (kernel) {
    case EnergyKernel::Direct:
        return computeEnergyMap(grid);
    case EnergyKernel::OpenCV:
        return computeEnergyMapCv(grid);
    }
    return computeEnergyMap(grid);
}

void updateEnergyMapAfterRemoval(EnergyMap &energy, const PixelGrid &grid, const Seam &seam) {
    const bool vertical = seam.orientation == Orientation::Vertical;
    checkReshape(energy, grid, vertical ? -1 : 0, vertical ? 0 : -1,
                 "updateEnergyMapAfterRemoval");

    // Drop the seam cells first so the map has the same stride as the carved grid. Without this
    // the following seam searches would read the map with the wrong row length.
    const bool reshaped =
        vertical ? energy.removeColumn(seam.indices) : energy.removeRow(seam.indices);
    if (!reshaped) {
        seamRejected(energy, seam, "updateEnergyMapAfterRemoval");
    }

    refreshAroundSeam(energy, grid, seam);
}

void updateEnergyMapAfterInsertion(EnergyMap &energy, const PixelGrid &grid, const Seam &seam) {
    const bool vertical = seam.orientation == Orientation::Vertical;
    checkReshape(energy, grid, vertical ? 1 : 0, vertical ? 0 : 1,
                 "updateEnergyMapAfterInsertion");

    // Placeholder cell for the new pixel, overwritten by the refresh below
    const bool reshaped =
        vertical ? energy.insertColumn(seam.indices, 0) : energy.insertRow(seam.indices, 0);
    if (!reshaped) {
        seamRejected(energy, seam, "updateEnergyMapAfterInsertion");
    }

    refreshAroundSeam(energy, grid, seam);
}

} // namespace seamresize
