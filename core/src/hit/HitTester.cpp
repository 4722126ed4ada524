#include "xa/hit/HitTester.hpp"
#include "xa/annotation/ShapeGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace xa {

const char* handleName(ResizeHandle h) {
  switch (h) {
    case ResizeHandle::None: return "none";
    case ResizeHandle::NW: return "nw";
    case ResizeHandle::NE: return "ne";
    case ResizeHandle::SW: return "sw";
    case ResizeHandle::SE: return "se";
    case ResizeHandle::N: return "n";
    case ResizeHandle::S: return "s";
    case ResizeHandle::W: return "w";
    case ResizeHandle::E: return "e";
  }
  return "none";
}

namespace {

bool nearSegment(const Point& p, const Point& a, const Point& b, double threshold) {
  double d = distanceToSegment(p, a, b);
  return d >= 0.0 && d < threshold;
}

} // namespace

bool HitTester::isNear(const Point& p, const Annotation& a, double threshold) const {
  const auto& pts = a.points;

  switch (a.type) {
    case AnnotationType::Marker:
      if (pts.empty()) return false;
      return distance(pts[0], p) < threshold + config_.markerRadius;

    case AnnotationType::Box: {
      if (pts.size() < 2) return false;
      double minX = std::min(pts[0].x, pts[1].x);
      double maxX = std::max(pts[0].x, pts[1].x);
      double minY = std::min(pts[0].y, pts[1].y);
      double maxY = std::max(pts[0].y, pts[1].y);

      bool inside = p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
      bool withinY = p.y >= minY - threshold && p.y <= maxY + threshold;
      bool withinX = p.x >= minX - threshold && p.x <= maxX + threshold;
      bool nearLeft   = std::fabs(p.x - minX) < threshold && withinY;
      bool nearRight  = std::fabs(p.x - maxX) < threshold && withinY;
      bool nearTop    = std::fabs(p.y - minY) < threshold && withinX;
      bool nearBottom = std::fabs(p.y - maxY) < threshold && withinX;
      return inside || nearLeft || nearRight || nearTop || nearBottom;
    }

    case AnnotationType::Circle: {
      if (pts.size() < 2) return false;
      Point c = circleCenter(pts[0], pts[1]);
      double r = circleRadius(pts[0], pts[1]);
      double d = distance(c, p);
      return std::fabs(d - r) < threshold || d <= r;
    }

    case AnnotationType::Ellipse: {
      if (pts.size() < 2) return false;
      double rx = std::fabs(pts[1].x - pts[0].x) * 0.5;
      double ry = std::fabs(pts[1].y - pts[0].y) * 0.5;
      if (rx == 0.0 || ry == 0.0) return false;
      Point c = circleCenter(pts[0], pts[1]);
      double nx = (p.x - c.x) / rx;
      double ny = (p.y - c.y) / ry;
      return std::sqrt(nx * nx + ny * ny) <= 1.0 + threshold / std::min(rx, ry);
    }

    case AnnotationType::Line:
    case AnnotationType::Ruler:
      if (pts.size() < 2) return false;
      return nearSegment(p, pts[0], pts[1], threshold);

    case AnnotationType::Angle:
      if (pts.size() < 2) return false;
      for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
        if (nearSegment(p, pts[i], pts[i + 1], threshold)) return true;
      }
      return false;

    case AnnotationType::Freehand:
      return std::any_of(pts.begin(), pts.end(),
        [&](const Point& q) { return distance(q, p) < threshold; });

    case AnnotationType::Text: {
      if (pts.size() < 2) return false;
      Bounds b{std::min(pts[0].x, pts[1].x), std::min(pts[0].y, pts[1].y),
               std::max(pts[0].x, pts[1].x), std::max(pts[0].y, pts[1].y)};
      return b.expanded(threshold).contains(p);
    }

    case AnnotationType::Select:
    case AnnotationType::Eraser:
      return false;
  }
  return false;
}

const Annotation* HitTester::findFirstHit(const AnnotationList& list, const Point& p,
                                          double threshold, bool skipLocked) const {
  for (const auto& a : list) {
    if (skipLocked && a.locked) continue;
    if (isNear(p, a, threshold)) return &a;
  }
  return nullptr;
}

ResizeHandle HitTester::handleAt(const Point& p, const Annotation& a,
                                 double handleSize) const {
  if (a.points.size() < 2 || !supportsResize(a.type)) return ResizeHandle::None;

  Bounds b;
  if (!shapeBounds(a, b, config_.markerRadius)) return ResizeHandle::None;

  for (const auto& hp : handlePositions(b)) {
    if (std::fabs(p.x - hp.position.x) < handleSize &&
        std::fabs(p.y - hp.position.y) < handleSize) {
      return hp.handle;
    }
  }
  return ResizeHandle::None;
}

std::array<HandlePosition, 8> HitTester::handlePositions(const Bounds& b) {
  return {{
    {ResizeHandle::NW, {b.minX, b.minY}},
    {ResizeHandle::NE, {b.maxX, b.minY}},
    {ResizeHandle::SW, {b.minX, b.maxY}},
    {ResizeHandle::SE, {b.maxX, b.maxY}},
    {ResizeHandle::N,  {b.midX(), b.minY}},
    {ResizeHandle::S,  {b.midX(), b.maxY}},
    {ResizeHandle::W,  {b.minX, b.midY()}},
    {ResizeHandle::E,  {b.maxX, b.midY()}},
  }};
}

Point HitTester::resizeAnchor(const Bounds& b, ResizeHandle h) {
  Point anchor{b.minX, b.minY};
  switch (h) {
    case ResizeHandle::NW: anchor = {b.maxX, b.maxY}; break;
    case ResizeHandle::NE: anchor = {b.minX, b.maxY}; break;
    case ResizeHandle::SW: anchor = {b.maxX, b.minY}; break;
    case ResizeHandle::SE: anchor = {b.minX, b.minY}; break;
    case ResizeHandle::N:  anchor = {b.minX, b.maxY}; break;
    case ResizeHandle::S:  anchor = {b.minX, b.minY}; break;
    case ResizeHandle::W:  anchor = {b.maxX, b.minY}; break;
    case ResizeHandle::E:  anchor = {b.minX, b.minY}; break;
    case ResizeHandle::None: break;
  }
  return anchor;
}

} // namespace xa
