#include "xa/annotation/ShapeGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace xa {

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string fmt1(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

} // namespace

bool shapeBounds(const Annotation& a, Bounds& out, double markerHalfSize) {
  const auto& pts = a.points;
  switch (a.type) {
    case AnnotationType::Marker:
      if (pts.empty()) return false;
      out = {pts[0].x - markerHalfSize, pts[0].y - markerHalfSize,
             pts[0].x + markerHalfSize, pts[0].y + markerHalfSize};
      return true;

    case AnnotationType::Box:
    case AnnotationType::Text:
    case AnnotationType::Ellipse:
    case AnnotationType::Line:
    case AnnotationType::Ruler:
      if (pts.size() < 2) return false;
      out = {std::min(pts[0].x, pts[1].x), std::min(pts[0].y, pts[1].y),
             std::max(pts[0].x, pts[1].x), std::max(pts[0].y, pts[1].y)};
      return true;

    case AnnotationType::Circle: {
      if (pts.size() < 2) return false;
      Point c = circleCenter(pts[0], pts[1]);
      double r = circleRadius(pts[0], pts[1]);
      out = {c.x - r, c.y - r, c.x + r, c.y + r};
      return true;
    }

    case AnnotationType::Angle:
      if (pts.size() < 2) return false;
      out = boundsOf(pts);
      return true;

    case AnnotationType::Freehand:
      if (pts.empty()) return false;
      out = boundsOf(pts);
      return true;

    case AnnotationType::Select:
    case AnnotationType::Eraser:
      return false;
  }
  return false;
}

Point circleCenter(const Point& p0, const Point& p1) {
  return {(p0.x + p1.x) * 0.5, (p0.y + p1.y) * 0.5};
}

double circleRadius(const Point& p0, const Point& p1) {
  return std::max(std::fabs(p1.x - p0.x), std::fabs(p1.y - p0.y)) * 0.5;
}

double interiorAngleDeg(const Point& a, const Point& vertex, const Point& b) {
  Point v1 = a - vertex;
  Point v2 = b - vertex;
  double mag1 = std::sqrt(v1.x * v1.x + v1.y * v1.y);
  double mag2 = std::sqrt(v2.x * v2.x + v2.y * v2.y);
  if (mag1 == 0.0 || mag2 == 0.0) return 0.0;

  double cosAngle = (v1.x * v2.x + v1.y * v2.y) / (mag1 * mag2);
  cosAngle = std::max(-1.0, std::min(1.0, cosAngle));
  return std::acos(cosAngle) * 180.0 / kPi;
}

ShapeMeasurement measure(const Annotation& a) {
  ShapeMeasurement m;
  m.type = a.type;
  const auto& pts = a.points;

  switch (a.type) {
    case AnnotationType::Marker:
      if (pts.empty()) return m;
      m.x = pts[0].x;
      m.y = pts[0].y;
      m.valid = true;
      return m;

    case AnnotationType::Box:
    case AnnotationType::Text:
      if (pts.size() < 2) return m;
      m.width = std::fabs(pts[1].x - pts[0].x);
      m.height = std::fabs(pts[1].y - pts[0].y);
      m.valid = true;
      return m;

    case AnnotationType::Circle:
      if (pts.size() < 2) return m;
      m.radius = circleRadius(pts[0], pts[1]);
      m.diameter = m.radius * 2.0;
      m.valid = true;
      return m;

    case AnnotationType::Ellipse:
      if (pts.size() < 2) return m;
      m.rx = std::fabs(pts[1].x - pts[0].x) * 0.5;
      m.ry = std::fabs(pts[1].y - pts[0].y) * 0.5;
      m.width = m.rx * 2.0;
      m.height = m.ry * 2.0;
      m.valid = true;
      return m;

    case AnnotationType::Line:
    case AnnotationType::Ruler:
      if (pts.size() < 2) return m;
      m.length = distance(pts[0], pts[1]);
      m.valid = true;
      return m;

    case AnnotationType::Angle:
      if (pts.size() < 3) return m;
      m.angleDeg = interiorAngleDeg(pts[0], pts[1], pts[2]);
      m.ray1Length = distance(pts[0], pts[1]);
      m.ray2Length = distance(pts[2], pts[1]);
      m.valid = true;
      return m;

    case AnnotationType::Freehand: {
      if (pts.size() < 2) return m;
      Bounds b = boundsOf(pts);
      m.width = b.width();
      m.height = b.height();
      m.pointCount = pts.size();
      m.valid = true;
      return m;
    }

    case AnnotationType::Select:
    case AnnotationType::Eraser:
      return m;
  }
  return m;
}

std::vector<DimensionRow> dimensionRows(const Annotation& a) {
  std::vector<DimensionRow> rows;
  ShapeMeasurement m = measure(a);
  if (!m.valid) return rows;

  switch (a.type) {
    case AnnotationType::Marker:
      rows.push_back({"X", fmt1(m.x), "px"});
      rows.push_back({"Y", fmt1(m.y), "px"});
      break;
    case AnnotationType::Box:
    case AnnotationType::Text:
    case AnnotationType::Ellipse:
      rows.push_back({"Width", fmt1(m.width), "px"});
      rows.push_back({"Height", fmt1(m.height), "px"});
      break;
    case AnnotationType::Circle:
      rows.push_back({"Radius", fmt1(m.radius), "px"});
      rows.push_back({"Diameter", fmt1(m.diameter), "px"});
      break;
    case AnnotationType::Line:
    case AnnotationType::Ruler:
      rows.push_back({"Length", fmt1(m.length), "px"});
      break;
    case AnnotationType::Angle:
      rows.push_back({"Angle", fmt1(m.angleDeg), "\xC2\xB0"});
      rows.push_back({"Line 1", fmt1(m.ray1Length), "px"});
      rows.push_back({"Line 2", fmt1(m.ray2Length), "px"});
      break;
    case AnnotationType::Freehand:
      rows.push_back({"Bounding Width", fmt1(m.width), "px"});
      rows.push_back({"Bounding Height", fmt1(m.height), "px"});
      rows.push_back({"Points", std::to_string(m.pointCount), ""});
      break;
    case AnnotationType::Select:
    case AnnotationType::Eraser:
      break;
  }
  return rows;
}

bool isCommittable(const Annotation& a, double minExtent) {
  if (!isShapeType(a.type)) return false;

  const auto& pts = a.points;
  std::size_t need = requiredPointCount(a.type);
  if (a.type == AnnotationType::Freehand) {
    if (pts.size() < need) return false;
  } else if (pts.size() != need) {
    return false;
  }

  switch (a.type) {
    case AnnotationType::Box:
    case AnnotationType::Ellipse: {
      double w = std::fabs(pts[1].x - pts[0].x);
      double h = std::fabs(pts[1].y - pts[0].y);
      return w > minExtent && h > minExtent;
    }
    case AnnotationType::Circle:
      return circleRadius(pts[0], pts[1]) > minExtent;
    case AnnotationType::Line:
    case AnnotationType::Ruler:
      return distance(pts[0], pts[1]) > minExtent;
    case AnnotationType::Freehand: {
      Bounds b = boundsOf(pts);
      return b.width() > minExtent || b.height() > minExtent;
    }
    case AnnotationType::Marker:
    case AnnotationType::Angle:
    case AnnotationType::Text:
      return true;
    case AnnotationType::Select:
    case AnnotationType::Eraser:
      return false;
  }
  return false;
}

Annotation translated(const Annotation& a, const Point& delta) {
  Annotation out = a;
  for (auto& p : out.points) {
    p = p + delta;
  }
  return out;
}

} // namespace xa
