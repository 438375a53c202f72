/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <algorithm>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "seamresize/errors.hpp"
#include "seamresize/pixel_grid.hpp"

namespace seamresize {

namespace {

// Every seam coordinate must address an existing pixel, one coordinate per row (or column)
void checkSeam(const std::vector<int> &seam, int length, int bound, const char *operation) {
    if (seam.size() != static_cast<size_t>(length)) {
        spdlog::error("{}: seam has {} entries, expected {}", operation, seam.size(), length);
        throw SeamLengthMismatch(
            fmt::format("{}: seam has {} entries, expected {}", operation, seam.size(), length));
    }
    for (size_t i = 0; i < seam.size(); i++) {
        if (seam[i] < 0 || seam[i] >= bound) {
            spdlog::error("{}: seam entry {} = {} is outside [0, {})", operation, i, seam[i],
                          bound);
            throw OutOfRangeIndex(fmt::format("{}: seam entry {} = {} is outside [0, {})",
                                              operation, i, seam[i], bound));
        }
    }
}

} // namespace

PixelGrid::PixelGrid(std::vector<std::uint8_t> pixels, int width, int height, int channels)
    : width_(width), height_(height), channels_(channels), pixels_(std::move(pixels)) {

    if (width <= 0 || height <= 0 || channels <= 0) {
        spdlog::error("PixelGrid: invalid dimensions {}x{}x{}", width, height, channels);
        throw ShapeError(
            fmt::format("invalid grid dimensions {}x{}x{}", width, height, channels));
    }

    const size_t expected =
        static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
    if (pixels_.size() != expected) {
        spdlog::error("PixelGrid: buffer holds {} bytes, {}x{}x{} needs {}", pixels_.size(), width,
                      height, channels, expected);
        throw ShapeError(fmt::format("buffer holds {} bytes, {}x{}x{} needs {}", pixels_.size(),
                                     width, height, channels, expected));
    }
}

bool PixelGrid::operator==(const PixelGrid &other) const {
    return width_ == other.width_ && height_ == other.height_ && channels_ == other.channels_ &&
           pixels_ == other.pixels_;
}

PixelGrid PixelGrid::transposed() const {
    std::vector<std::uint8_t> swapped(pixels_.size());
    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            std::memcpy(swapped.data() + (static_cast<size_t>(x) * height_ + y) * channels_,
                        pixel(y, x), static_cast<size_t>(channels_));
        }
    }
    return PixelGrid(std::move(swapped), height_, width_, channels_);
}

// Per-channel integer average of two pixels (truncated). With a == b this is a plain copy.
void PixelGrid::blend(const std::uint8_t *a, const std::uint8_t *b, std::uint8_t *out) const {
    for (int ch = 0; ch < channels_; ch++) {
        out[ch] = static_cast<std::uint8_t>((static_cast<int>(a[ch]) + static_cast<int>(b[ch])) / 2);
    }
}

// Modifies the buffer in-place: each row is compacted over the seam pixel and the buffer is
// truncated at the end, so no extra allocation is needed.
void PixelGrid::removeColumn(const std::vector<int> &cols) {
    if (width_ <= 1) {
        spdlog::error("removeColumn: cannot remove a column from a {}x{} grid", width_, height_);
        throw DegenerateGrid(
            fmt::format("cannot remove a column from a {}x{} grid", width_, height_));
    }
    checkSeam(cols, height_, width_, "removeColumn");

    const int old_width = width_;
    const int new_width = width_ - 1;

    for (int y = 0; y < height_; y++) {

        const int seam_x = cols[y];

        // Row start in the old layout (old_width) and in the new layout (new_width)
        std::uint8_t *src_row = pixels_.data() + (static_cast<size_t>(y) * old_width) * channels_;
        std::uint8_t *dst_row = pixels_.data() + (static_cast<size_t>(y) * new_width) * channels_;

        // Pixels left of the seam (0 .. seam_x-1)
        if (seam_x > 0) {
            std::memmove(dst_row, src_row, static_cast<size_t>(seam_x) * channels_);
        }

        // Pixels right of the seam (seam_x+1 .. old_width-1), the seam pixel gets overwritten
        const int right_count = old_width - seam_x - 1;
        if (right_count > 0) {
            std::memmove(dst_row + static_cast<size_t>(seam_x) * channels_,
                         src_row + static_cast<size_t>(seam_x + 1) * channels_,
                         static_cast<size_t>(right_count) * channels_);
        }
    }

    width_ = new_width;
    pixels_.resize(static_cast<size_t>(width_) * height_ * channels_);
}

void PixelGrid::removeRow(const std::vector<int> &rows) {
    if (height_ <= 1) {
        spdlog::error("removeRow: cannot remove a row from a {}x{} grid", width_, height_);
        throw DegenerateGrid(fmt::format("cannot remove a row from a {}x{} grid", width_, height_));
    }
    checkSeam(rows, width_, height_, "removeRow");

    // The row stride does not change, so every column moves up by one below its seam pixel and
    // the last row becomes garbage that is cut off by the resize.
    for (int x = 0; x < width_; x++) {
        for (int y = rows[x]; y < height_ - 1; y++) {
            std::memcpy(pixel(y, x), pixel(y + 1, x), static_cast<size_t>(channels_));
        }
    }

    height_--;
    pixels_.resize(static_cast<size_t>(width_) * height_ * channels_);
}

void PixelGrid::insertColumn(const std::vector<int> &cols) {
    insertColumns(std::vector<std::vector<int>>{cols});
}

void PixelGrid::insertRow(const std::vector<int> &rows) {
    insertRows(std::vector<std::vector<int>>{rows});
}

void PixelGrid::insertColumns(const std::vector<std::vector<int>> &seams) {
    for (const auto &seam : seams) {
        checkSeam(seam, height_, width_, "insertColumns");
    }
    if (seams.empty()) {
        return;
    }

    const int new_width = width_ + static_cast<int>(seams.size());
    std::vector<std::uint8_t> grown(static_cast<size_t>(new_width) * height_ * channels_);

    // inserts_before[x] = number of new pixels that go in front of old column x in this row
    std::vector<int> inserts_before(width_);

    for (int y = 0; y < height_; y++) {
        std::fill(inserts_before.begin(), inserts_before.end(), 0);
        for (const auto &seam : seams) {
            inserts_before[seam[y]]++;
        }

        std::uint8_t *dst = grown.data() + static_cast<size_t>(y) * new_width * channels_;
        for (int x = 0; x < width_; x++) {
            const std::uint8_t *current = pixel(y, x);
            const std::uint8_t *left = x > 0 ? pixel(y, x - 1) : current;

            for (int k = 0; k < inserts_before[x]; k++) {
                blend(left, current, dst);
                dst += channels_;
            }
            std::memcpy(dst, current, static_cast<size_t>(channels_));
            dst += channels_;
        }
    }

    width_ = new_width;
    pixels_.swap(grown);
}

void PixelGrid::insertRows(const std::vector<std::vector<int>> &seams) {
    for (const auto &seam : seams) {
        checkSeam(seam, width_, height_, "insertRows");
    }
    if (seams.empty()) {
        return;
    }

    const int new_height = height_ + static_cast<int>(seams.size());
    std::vector<std::uint8_t> grown(static_cast<size_t>(width_) * new_height * channels_);
    std::vector<int> inserts_before(height_);

    for (int x = 0; x < width_; x++) {
        std::fill(inserts_before.begin(), inserts_before.end(), 0);
        for (const auto &seam : seams) {
            inserts_before[seam[x]]++;
        }

        int out_y = 0;
        for (int y = 0; y < height_; y++) {
            const std::uint8_t *current = pixel(y, x);
            const std::uint8_t *above = y > 0 ? pixel(y - 1, x) : current;

            for (int k = 0; k < inserts_before[y]; k++) {
                blend(above, current,
                      grown.data() + (static_cast<size_t>(out_y) * width_ + x) * channels_);
                out_y++;
            }
            std::memcpy(grown.data() + (static_cast<size_t>(out_y) * width_ + x) * channels_,
                        current, static_cast<size_t>(channels_));
            out_y++;
        }
    }

    height_ = new_height;
    pixels_.swap(grown);
}

} // namespace seamresize
