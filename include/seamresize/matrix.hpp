/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <cstddef>
#include <cstring>
#include <type_traits>
#include <utility>
#include <vector>

namespace seamresize {

/**
 * @brief Row-major 2-D buffer of scalars that can lose or gain one seam-shaped column/row
 *
 * Used for the energy map, the DP cost table and the index maps that remember where a cell of a
 * carved working copy came from. Element (row, col) lives at data[row * width + col].
 *
 * The seam methods return false on invalid input (wrong seam length, coordinate out of range or
 * a removal that would leave a zero dimension) and leave the matrix untouched in that case.
 */
template <typename T> class Matrix {
    static_assert(std::is_trivially_copyable<T>::value, "Matrix rows are shifted with memmove");

  public:
    Matrix() = default;
    Matrix(int width, int height, T value = T{})
        : width_(width), height_(height),
          data_(static_cast<size_t>(width) * static_cast<size_t>(height), value) {}

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    T &at(int row, int col) { return data_[static_cast<size_t>(row) * width_ + col]; }
    const T &at(int row, int col) const { return data_[static_cast<size_t>(row) * width_ + col]; }

    const T *data() const { return data_.data(); }
    const std::vector<T> &values() const { return data_; }

    bool operator==(const Matrix &other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }
    bool operator!=(const Matrix &other) const { return !(*this == other); }

    Matrix transposed() const {
        Matrix result(height_, width_);
        for (int y = 0; y < height_; y++) {
            for (int x = 0; x < width_; x++) {
                result.at(x, y) = at(y, x);
            }
        }
        return result;
    }

    // Removes cols[y] from every row y (in-place, the width shrinks by 1)
    bool removeColumn(const std::vector<int> &cols) {
        if (width_ <= 1 || !fits(cols, height_, width_)) {
            return false;
        }

        const int old_width = width_;
        const int new_width = width_ - 1;

        for (int y = 0; y < height_; y++) {
            const int seam_x = cols[y];
            T *src_row = data_.data() + static_cast<size_t>(y) * old_width;
            T *dst_row = data_.data() + static_cast<size_t>(y) * new_width;

            if (seam_x > 0) {
                std::memmove(dst_row, src_row, static_cast<size_t>(seam_x) * sizeof(T));
            }
            const int right_count = old_width - seam_x - 1;
            if (right_count > 0) {
                std::memmove(dst_row + seam_x, src_row + seam_x + 1,
                             static_cast<size_t>(right_count) * sizeof(T));
            }
        }

        width_ = new_width;
        data_.resize(static_cast<size_t>(width_) * height_);
        return true;
    }

    // Removes rows[x] from every column x (in-place, the height shrinks by 1)
    bool removeRow(const std::vector<int> &rows) {
        if (height_ <= 1 || !fits(rows, width_, height_)) {
            return false;
        }

        // Same stride before and after, so each column simply moves up below its seam cell
        for (int x = 0; x < width_; x++) {
            for (int y = rows[x]; y < height_ - 1; y++) {
                at(y, x) = at(y + 1, x);
            }
        }

        height_--;
        data_.resize(static_cast<size_t>(width_) * height_);
        return true;
    }

    // Inserts `value` at cols[y] in every row y, shifting the rest of the row right
    bool insertColumn(const std::vector<int> &cols, T value) {
        if (!fits(cols, height_, width_)) {
            return false;
        }

        const int new_width = width_ + 1;
        std::vector<T> grown(static_cast<size_t>(new_width) * height_);
        for (int y = 0; y < height_; y++) {
            const T *src_row = data_.data() + static_cast<size_t>(y) * width_;
            T *dst_row = grown.data() + static_cast<size_t>(y) * new_width;
            const int seam_x = cols[y];

            std::memcpy(dst_row, src_row, static_cast<size_t>(seam_x) * sizeof(T));
            dst_row[seam_x] = value;
            std::memcpy(dst_row + seam_x + 1, src_row + seam_x,
                        static_cast<size_t>(width_ - seam_x) * sizeof(T));
        }

        width_ = new_width;
        data_.swap(grown);
        return true;
    }

    // Inserts `value` at rows[x] in every column x, shifting the rest of the column down
    bool insertRow(const std::vector<int> &rows, T value) {
        if (!fits(rows, width_, height_)) {
            return false;
        }

        Matrix grown(width_, height_ + 1);
        for (int x = 0; x < width_; x++) {
            const int seam_y = rows[x];
            for (int y = 0; y <= height_; y++) {
                if (y < seam_y) {
                    grown.at(y, x) = at(y, x);
                }
                else if (y == seam_y) {
                    grown.at(y, x) = value;
                }
                else {
                    grown.at(y, x) = at(y - 1, x);
                }
            }
        }

        *this = std::move(grown);
        return true;
    }

  private:
    static bool fits(const std::vector<int> &seam, int length, int bound) {
        if (seam.size() != static_cast<size_t>(length)) {
            return false;
        }
        for (int index : seam) {
            if (index < 0 || index >= bound) {
                return false;
            }
        }
        return true;
    }

    int width_ = 0;
    int height_ = 0;
    std::vector<T> data_;
};

} // namespace seamresize
