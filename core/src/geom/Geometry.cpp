#include "xa/geom/Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace xa {

double distance(const Point& a, const Point& b) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  return std::sqrt(dx * dx + dy * dy);
}

double distanceToSegment(const Point& p, const Point& a, const Point& b) {
  double vx = b.x - a.x;
  double vy = b.y - a.y;
  double lenSq = vx * vx + vy * vy;
  if (lenSq == 0.0) return -1.0;

  double t = ((p.x - a.x) * vx + (p.y - a.y) * vy) / lenSq;
  t = std::max(0.0, std::min(1.0, t));

  Point proj{a.x + t * vx, a.y + t * vy};
  return distance(p, proj);
}

Bounds boundsOf(const std::vector<Point>& points) {
  if (points.empty()) return {};
  Bounds b{points[0].x, points[0].y, points[0].x, points[0].y};
  for (const auto& p : points) {
    b.minX = std::min(b.minX, p.x);
    b.minY = std::min(b.minY, p.y);
    b.maxX = std::max(b.maxX, p.x);
    b.maxY = std::max(b.maxY, p.y);
  }
  return b;
}

} // namespace xa
