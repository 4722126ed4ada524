#pragma once
#include "xa/annotation/Annotation.hpp"
#include "xa/geom/Geometry.hpp"
#include <string>
#include <vector>

namespace xa {

inline constexpr double kMarkerHalfSize = 15.0;

// Per-variant bounding box in image space. Returns false when the shape
// does not yet carry enough points.
bool shapeBounds(const Annotation& a, Bounds& out,
                 double markerHalfSize = kMarkerHalfSize);

// Circle derived from two points: centre (p0+p1)/2, r = max(|dx|,|dy|)/2.
Point circleCenter(const Point& p0, const Point& p1);
double circleRadius(const Point& p0, const Point& p1);

// Interior angle at vertex in degrees. Cosine is clamped to [-1,1];
// a zero-length ray yields 0.
double interiorAngleDeg(const Point& a, const Point& vertex, const Point& b);

struct ShapeMeasurement {
  AnnotationType type{AnnotationType::Marker};
  double x{0}, y{0};               // marker position
  double width{0}, height{0};      // box, text, ellipse, freehand bounds
  double radius{0}, diameter{0};   // circle
  double rx{0}, ry{0};             // ellipse semi-axes
  double length{0};                // line, ruler
  double angleDeg{0};              // angle
  double ray1Length{0}, ray2Length{0};
  std::size_t pointCount{0};       // freehand
  bool valid{false};
};

ShapeMeasurement measure(const Annotation& a);

// One row of the dimensions panel: value already formatted to one decimal.
struct DimensionRow {
  std::string name;
  std::string value;
  std::string unit;
};

std::vector<DimensionRow> dimensionRows(const Annotation& a);

// True if the shape may enter the committed collection: exact point count
// (freehand: at least 2) and, for area/length shapes, an extent strictly
// greater than minExtent.
bool isCommittable(const Annotation& a, double minExtent = 0.0);

// Copy of a with every point shifted by delta.
Annotation translated(const Annotation& a, const Point& delta);

} // namespace xa
