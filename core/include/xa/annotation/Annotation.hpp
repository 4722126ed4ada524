#pragma once
#include "xa/geom/Geometry.hpp"
#include "xa/ids/Id.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xa {

// Closed set of annotation kinds. Select and Eraser are tool modes only and
// never appear in a committed collection.
enum class AnnotationType : std::uint8_t {
  Marker = 0,
  Box,
  Circle,
  Ellipse,
  Line,
  Ruler,
  Angle,
  Text,
  Freehand,
  Select,
  Eraser
};

inline constexpr std::array<AnnotationType, 11> kAllTypes = {
  AnnotationType::Marker, AnnotationType::Box, AnnotationType::Circle,
  AnnotationType::Ellipse, AnnotationType::Line, AnnotationType::Ruler,
  AnnotationType::Angle, AnnotationType::Text, AnnotationType::Freehand,
  AnnotationType::Select, AnnotationType::Eraser
};

// Tools are the same closed set; the active tool may be a tool mode.
using Tool = AnnotationType;

const char* typeName(AnnotationType t);

// Returns false if the name is unknown.
bool parseTypeName(const std::string& name, AnnotationType& out);

// "Box", "Freehand", ... for default labels.
std::string displayName(AnnotationType t);

bool isShapeType(AnnotationType t);

// Variants that expose the eight resize handles when selected.
bool supportsResize(AnnotationType t);

// Point count a committed shape must have. Freehand returns its minimum (2).
// Tool modes return 0.
std::size_t requiredPointCount(AnnotationType t);

struct Annotation {
  Id id{kInvalidId};
  AnnotationType type{AnnotationType::Marker};
  std::vector<Point> points;
  std::string color;   // "#rrggbb"
  std::string text;    // text variant payload, empty if absent
  std::string label;   // caption, empty if absent
  bool locked{false};

  bool operator==(const Annotation& o) const {
    return id == o.id && type == o.type && points == o.points &&
           color == o.color && text == o.text && label == o.label &&
           locked == o.locked;
  }
  bool operator!=(const Annotation& o) const { return !(*this == o); }
};

using AnnotationList = std::vector<Annotation>;

} // namespace xa
