#pragma once
#include <vector>

namespace xa {

// 2D coordinate. Annotation points are always image space; pointer
// positions arrive in screen space.
struct Point {
  double x{0}, y{0};

  Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
  Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
  Point operator*(double s) const { return {x * s, y * s}; }
  Point operator/(double s) const { return {x / s, y / s}; }
  bool operator==(const Point& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Bounds {
  double minX{0}, minY{0};
  double maxX{0}, maxY{0};

  double width() const { return maxX - minX; }
  double height() const { return maxY - minY; }
  double midX() const { return (minX + maxX) * 0.5; }
  double midY() const { return (minY + maxY) * 0.5; }

  bool contains(const Point& p) const {
    return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
  }

  Bounds expanded(double d) const {
    return {minX - d, minY - d, maxX + d, maxY + d};
  }

  bool operator==(const Bounds& o) const {
    return minX == o.minX && minY == o.minY && maxX == o.maxX && maxY == o.maxY;
  }
};

double distance(const Point& a, const Point& b);

// Perpendicular distance from p to segment [a,b], with the projection
// parameter clamped to [0,1]. Returns -1 for a zero-length segment.
double distanceToSegment(const Point& p, const Point& a, const Point& b);

// Min/max over all points. Empty input yields a zero Bounds.
Bounds boundsOf(const std::vector<Point>& points);

} // namespace xa
