#include "geom/util.hpp"

#include <algorithm>

using namespace pix;

/////////////////////////////////////////////////////////////////
//                    Point
/////////////////////////////////////////////////////////////////
Point Point::operator+(Point const &other) const {
  return Point(this->x + other.x, this->y + other.y);
}

Point Point::operator-(Point const &other) const {
  return Point(this->x - other.x, this->y - other.y);
}

bool Point::operator==(const Point &other) const {
  return (x == other.x) && (y == other.y);
}

bool Point::operator!=(const Point &other) const { return !(*this == other); }

/////////////////////////////////////////////////////////////////
//                    Rect
/////////////////////////////////////////////////////////////////
bool Rect::Contains(int px, int py) const {
  if (px < x || px >= MaxX()) return false;
  if (py < y || py >= MaxY()) return false;
  return true;
}

bool Rect::Contains(const Rect &other) const {
  if (other.x < x || other.y < y) return false;
  if (other.MaxX() > MaxX() || other.MaxY() > MaxY()) return false;
  return true;
}

Rect Rect::Intersection(const Rect &other) const {
  const int x0 = std::max(x, other.x);
  const int y0 = std::max(y, other.y);
  const int x1 = std::min(MaxX(), other.MaxX());
  const int y1 = std::min(MaxY(), other.MaxY());

  if (x1 <= x0 || y1 <= y0) return Rect(x0, y0, 0, 0);
  return Rect(x0, y0, x1 - x0, y1 - y0);
}

Rect Rect::Translate(int dx, int dy) const {
  return Rect(x + dx, y + dy, width, height);
}

bool Rect::operator==(const Rect &other) const {
  return (x == other.x) && (y == other.y) && (width == other.width) &&
         (height == other.height);
}

bool Rect::operator!=(const Rect &other) const { return !(*this == other); }
