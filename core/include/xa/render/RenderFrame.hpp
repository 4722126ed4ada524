#pragma once
#include "xa/annotation/Annotation.hpp"
#include "xa/geom/Geometry.hpp"
#include "xa/hit/HitTester.hpp"
#include "xa/view/ViewTransform.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace xa {

class GestureController;

enum class CursorHint : std::uint8_t {
  Default = 0,
  Crosshair,     // drawing tools
  Grab,          // panning / pan-hold
  Move,          // over a draggable selection
  ResizeNWSE,
  ResizeNESW,
  ResizeNS,
  ResizeEW,
  Eraser
};

const char* cursorHintName(CursorHint c);

// Label badge drawn beside the selected shape, sized in image units.
struct LabelBadge {
  Id id{kInvalidId};
  std::string text;
  std::string color;
  Bounds rect;
  bool locked{false};
};

// Measurement text anchored in image space ("42.0px", "90.0°").
struct Caption {
  Id id{kInvalidId};   // kInvalidId for the preview shape
  std::string text;
  Point anchor;
};

// Everything a presentation layer needs to draw one frame. Geometry is in
// image space unless noted; the renderer applies `view`.
struct RenderFrame {
  ViewTransform view;
  const AnnotationList* annotations{nullptr};

  const Annotation* preview{nullptr};
  bool hasStartDot{false};
  Point startDot;

  Id selectedId{kInvalidId};
  bool hasOutline{false};
  Bounds outline;
  bool hasHandles{false};
  std::array<HandlePosition, 8> handles{};
  double handleSize{0};   // image units

  std::vector<LabelBadge> labels;
  std::vector<Caption> captions;

  bool textEntryOpen{false};
  Bounds textEntryScreen;  // screen space

  CursorHint cursor{CursorHint::Default};
};

RenderFrame buildRenderFrame(const GestureController& gc);

// Implemented by the embedding presentation layer.
class AnnotationRenderer {
public:
  virtual ~AnnotationRenderer() = default;
  virtual void render(const RenderFrame& frame) = 0;
};

} // namespace xa
