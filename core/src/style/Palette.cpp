#include "xa/style/Palette.hpp"

namespace xa {

Palette defaultPalette() {
  return Palette{};
}

const std::string& colorFor(const Palette& p, AnnotationType t) {
  switch (t) {
    case AnnotationType::Marker:   return p.marker;
    case AnnotationType::Box:      return p.box;
    case AnnotationType::Circle:   return p.circle;
    case AnnotationType::Ellipse:  return p.ellipse;
    case AnnotationType::Line:     return p.line;
    case AnnotationType::Ruler:    return p.ruler;
    case AnnotationType::Angle:    return p.angle;
    case AnnotationType::Text:     return p.text;
    case AnnotationType::Freehand: return p.freehand;
    case AnnotationType::Select:
    case AnnotationType::Eraser:   return p.tool;
  }
  return p.tool;
}

} // namespace xa
