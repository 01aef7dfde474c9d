#pragma once

#include <iostream>

namespace pix {

/**
 * Represents a location (or displacement) in a raster's coordinate space.
 */
class Point {
 public:
  /// Column coordinate, increasing to the right.
  int x;
  /// Row coordinate, increasing downwards.
  int y;

  constexpr Point() noexcept : x(0), y(0) {}

  constexpr Point(int const x, int const y) noexcept : x(x), y(y) {}

  /**
   * Add another Point to this one.
   */
  Point operator+(Point const &other) const;

  /**
   * Subtract another Point from this one.
   */
  Point operator-(Point const &other) const;

  bool operator==(const Point &other) const;
  bool operator!=(const Point &other) const;
};

/**
 * Represents an axis-aligned rectangle of pixels.
 *
 * A Rect with a non-positive width or height is empty.
 */
class Rect {
 public:
  /// First column included in the rectangle
  int x;
  /// First row included in the rectangle
  int y;
  /// Number of columns included in the rectangle (starting from `x`)
  int width;
  /// Number of rows included in the rectangle (starting from `y`)
  int height;

  constexpr Rect() noexcept : x(0), y(0), width(0), height(0) {}

  constexpr Rect(int x, int y, int width, int height) noexcept
      : x(x), y(y), width(width), height(height) {}

  /**
   * The top-left corner of the rectangle.
   */
  Point Origin() const { return Point(x, y); }

  /**
   * The first column after the rectangle.
   */
  int MaxX() const { return x + width; }

  /**
   * The first row after the rectangle.
   */
  int MaxY() const { return y + height; }

  bool IsEmpty() const { return width <= 0 || height <= 0; }

  /**
   * Test whether the specified pixel lies inside this rectangle.
   */
  bool Contains(int px, int py) const;

  /**
   * Test whether `other` lies entirely inside this rectangle.
   */
  bool Contains(const Rect &other) const;

  /**
   * The largest rectangle contained in both this rectangle and `other`. The
   * result is empty (with zero width/height) when they do not overlap.
   */
  Rect Intersection(const Rect &other) const;

  /**
   * This rectangle moved by the specified amount.
   */
  Rect Translate(int dx, int dy) const;

  int PixelCount() const { return IsEmpty() ? 0 : width * height; }

  bool operator==(const Rect &other) const;
  bool operator!=(const Rect &other) const;
};

inline std::ostream &operator<<(std::ostream &stream, const Point &pt) {
  return stream << "(" << pt.x << "," << pt.y << ")";
}

inline std::ostream &operator<<(std::ostream &stream, const Rect &r) {
  return stream << "{ [" << r.x << "," << r.MaxX() << "), "
                << "[" << r.y << "," << r.MaxY() << ") }";
}

}  // namespace pix
