#include "xa/annotation/Annotation.hpp"

namespace xa {

const char* typeName(AnnotationType t) {
  switch (t) {
    case AnnotationType::Marker:   return "marker";
    case AnnotationType::Box:      return "box";
    case AnnotationType::Circle:   return "circle";
    case AnnotationType::Ellipse:  return "ellipse";
    case AnnotationType::Line:     return "line";
    case AnnotationType::Ruler:    return "ruler";
    case AnnotationType::Angle:    return "angle";
    case AnnotationType::Text:     return "text";
    case AnnotationType::Freehand: return "freehand";
    case AnnotationType::Select:   return "select";
    case AnnotationType::Eraser:   return "eraser";
  }
  return "unknown";
}

bool parseTypeName(const std::string& name, AnnotationType& out) {
  for (AnnotationType t : kAllTypes) {
    if (name == typeName(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

std::string displayName(AnnotationType t) {
  std::string s = typeName(t);
  if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') {
    s[0] = static_cast<char>(s[0] - 'a' + 'A');
  }
  return s;
}

bool isShapeType(AnnotationType t) {
  switch (t) {
    case AnnotationType::Marker:
    case AnnotationType::Box:
    case AnnotationType::Circle:
    case AnnotationType::Ellipse:
    case AnnotationType::Line:
    case AnnotationType::Ruler:
    case AnnotationType::Angle:
    case AnnotationType::Text:
    case AnnotationType::Freehand:
      return true;
    case AnnotationType::Select:
    case AnnotationType::Eraser:
      return false;
  }
  return false;
}

bool supportsResize(AnnotationType t) {
  switch (t) {
    case AnnotationType::Box:
    case AnnotationType::Ellipse:
    case AnnotationType::Text:
    case AnnotationType::Circle:
    case AnnotationType::Line:
    case AnnotationType::Ruler:
      return true;
    case AnnotationType::Marker:
    case AnnotationType::Angle:
    case AnnotationType::Freehand:
    case AnnotationType::Select:
    case AnnotationType::Eraser:
      return false;
  }
  return false;
}

std::size_t requiredPointCount(AnnotationType t) {
  switch (t) {
    case AnnotationType::Marker:   return 1;
    case AnnotationType::Box:
    case AnnotationType::Circle:
    case AnnotationType::Ellipse:
    case AnnotationType::Line:
    case AnnotationType::Ruler:
    case AnnotationType::Text:     return 2;
    case AnnotationType::Angle:    return 3;
    case AnnotationType::Freehand: return 2;
    case AnnotationType::Select:
    case AnnotationType::Eraser:   return 0;
  }
  return 0;
}

} // namespace xa
