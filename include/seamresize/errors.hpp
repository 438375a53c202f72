/*  SeamResize - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <stdexcept>
#include <string>

namespace seamresize {

/**
 * @brief Base class of every error thrown by the seam carving core
 *
 * ShapeError and InvalidTarget are caller errors and are raised before any seam work starts.
 * The remaining kinds signal broken bookkeeping inside the core and are never retried.
 */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Pixel buffer length does not match width * height * channels (or a dimension is zero)
class ShapeError : public Error {
  public:
    using Error::Error;
};

// Requested target width or height is zero
class InvalidTarget : public Error {
  public:
    using Error::Error;
};

// A seam coordinate lies outside the current grid
class OutOfRangeIndex : public Error {
  public:
    using Error::Error;
};

// A seam does not have one entry per row (vertical) or per column (horizontal)
class SeamLengthMismatch : public Error {
  public:
    using Error::Error;
};

// A zero-sized grid reached the seam finder, or an operation would produce one
class DegenerateGrid : public Error {
  public:
    using Error::Error;
};

} // namespace seamresize
