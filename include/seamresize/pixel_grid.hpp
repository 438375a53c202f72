/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace seamresize {

/**
 * @brief Owns the pixels of an image being carved
 *
 * Pixels are stored in a single 1-dimensional buffer in row-major order with interleaved
 * channels: [R1,G1,B1, R2,G2,B2, ...]. The byte index of channel ch of pixel (row, col) is
 * (row * width + col) * channels + ch.
 *
 * The grid is never empty: width, height and channels are at least 1 for its whole life. It is a
 * value type; the Resizer moves it in and out instead of sharing it.
 */
class PixelGrid {
  public:
    /**
     * @brief Takes ownership of a caller-supplied pixel buffer
     *
     * @param pixels   Row-major, channel-interleaved 8-bit pixel data
     * @param width    Number of columns (>= 1)
     * @param height   Number of rows (>= 1)
     * @param channels Number of components per pixel (>= 1)
     * @throws ShapeError if a dimension is zero or pixels.size() != width * height * channels
     */
    PixelGrid(std::vector<std::uint8_t> pixels, int width, int height, int channels);

    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }

    // Pointer to the `channels` contiguous components of pixel (row, col)
    const std::uint8_t *pixel(int row, int col) const {
        return pixels_.data() + (static_cast<size_t>(row) * width_ + col) * channels_;
    }
    std::uint8_t *pixel(int row, int col) {
        return pixels_.data() + (static_cast<size_t>(row) * width_ + col) * channels_;
    }

    const std::vector<std::uint8_t> &data() const { return pixels_; }

    // Moves the pixel buffer out; the grid must not be used afterwards
    std::vector<std::uint8_t> takePixels() { return std::move(pixels_); }

    bool operator==(const PixelGrid &other) const;
    bool operator!=(const PixelGrid &other) const { return !(*this == other); }

    // Copy with rows and columns swapped (pixel (r, c) becomes pixel (c, r))
    PixelGrid transposed() const;

    /**
     * @brief Removes one pixel per row and shifts the rest of each row left (width - 1)
     *
     * @param cols cols[y] is the column removed from row y; size must equal height
     * @throws SeamLengthMismatch, OutOfRangeIndex, DegenerateGrid (width is 1)
     */
    void removeColumn(const std::vector<int> &cols);

    /**
     * @brief Removes one pixel per column and shifts the rest of each column up (height - 1)
     *
     * @param rows rows[x] is the row removed from column x; size must equal width
     * @throws SeamLengthMismatch, OutOfRangeIndex, DegenerateGrid (height is 1)
     */
    void removeRow(const std::vector<int> &rows);

    /**
     * @brief Inserts a blended pixel at cols[y] in every row y (width + 1)
     *
     * The new pixel is the average of the pixels that end up on either side of it (the old
     * pixels at cols[y] - 1 and cols[y]); in column 0 it is a copy of its only neighbour.
     */
    void insertColumn(const std::vector<int> &cols);

    // Row analogue of insertColumn (height + 1)
    void insertRow(const std::vector<int> &rows);

    /**
     * @brief Inserts several seams at once, all expressed in the current grid's coordinates
     *
     * Every blended pixel is computed from the current (pre-insertion) neighbours, so the result
     * does not depend on the order of the seams. The width grows by seams.size().
     */
    void insertColumns(const std::vector<std::vector<int>> &seams);

    // Row analogue of insertColumns
    void insertRows(const std::vector<std::vector<int>> &seams);

  private:
    void blend(const std::uint8_t *a, const std::uint8_t *b, std::uint8_t *out) const;

    int width_;
    int height_;
    int channels_;
    std::vector<std::uint8_t> pixels_;
};

} // namespace seamresize
