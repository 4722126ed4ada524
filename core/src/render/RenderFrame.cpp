#include "xa/render/RenderFrame.hpp"
#include "xa/annotation/ShapeGeometry.hpp"
#include "xa/interaction/GestureController.hpp"

#include <algorithm>
#include <cstdio>

namespace xa {

const char* cursorHintName(CursorHint c) {
  switch (c) {
    case CursorHint::Default: return "default";
    case CursorHint::Crosshair: return "crosshair";
    case CursorHint::Grab: return "grab";
    case CursorHint::Move: return "move";
    case CursorHint::ResizeNWSE: return "nwse-resize";
    case CursorHint::ResizeNESW: return "nesw-resize";
    case CursorHint::ResizeNS: return "ns-resize";
    case CursorHint::ResizeEW: return "ew-resize";
    case CursorHint::Eraser: return "eraser";
  }
  return "default";
}

namespace {

constexpr double kOutlinePadPx = 5.0;
constexpr double kBadgeOffsetPx = 8.0;
constexpr double kBadgeHeightPx = 16.0;
constexpr double kBadgeCharPx = 7.0;
constexpr double kBadgePadPx = 10.0;
constexpr double kBadgeLockPadPx = 25.0;
constexpr double kRulerCaptionRisePx = 8.0;
constexpr double kAngleCaptionDxPx = 42.0;
constexpr double kAngleCaptionDyPx = 12.0;

CursorHint cursorForHandle(ResizeHandle h) {
  switch (h) {
    case ResizeHandle::NW:
    case ResizeHandle::SE: return CursorHint::ResizeNWSE;
    case ResizeHandle::NE:
    case ResizeHandle::SW: return CursorHint::ResizeNESW;
    case ResizeHandle::N:
    case ResizeHandle::S: return CursorHint::ResizeNS;
    case ResizeHandle::W:
    case ResizeHandle::E: return CursorHint::ResizeEW;
    case ResizeHandle::None: break;
  }
  return CursorHint::Default;
}

void appendCaption(std::vector<Caption>& out, const Annotation& a, double zoom) {
  char buf[64];
  if (a.type == AnnotationType::Ruler && a.points.size() >= 2) {
    const Point& p0 = a.points[0];
    const Point& p1 = a.points[1];
    std::snprintf(buf, sizeof(buf), "%.1fpx", distance(p0, p1));
    Point mid = (p0 + p1) / 2.0;
    out.push_back({a.id, buf, {mid.x, mid.y - kRulerCaptionRisePx / zoom}});
  } else if (a.type == AnnotationType::Angle && a.points.size() == 3) {
    const Point& v = a.points[1];
    double deg = interiorAngleDeg(a.points[0], v, a.points[2]);
    std::snprintf(buf, sizeof(buf), "%.1f\xC2\xB0", deg);
    out.push_back({a.id, buf, {v.x + kAngleCaptionDxPx / zoom, v.y - kAngleCaptionDyPx / zoom}});
  }
}

} // namespace

RenderFrame buildRenderFrame(const GestureController& gc) {
  RenderFrame f;
  f.view = gc.view();
  f.annotations = &gc.annotations();
  f.selectedId = gc.selectedId();
  f.handleSize = gc.handleSize();

  double zoom = f.view.zoom();
  double markerRadius = gc.config().hit.markerRadius;

  // Committed shapes: measurement captions, and the badge of the selected one.
  for (const auto& a : gc.annotations()) {
    appendCaption(f.captions, a, zoom);

    if (a.id != f.selectedId || a.label.empty()) continue;
    Bounds b;
    if (!shapeBounds(a, b, markerRadius)) continue;

    LabelBadge badge;
    badge.id = a.id;
    badge.text = a.label;
    badge.color = a.color;
    badge.locked = a.locked;
    double w = (static_cast<double>(a.label.size()) * kBadgeCharPx +
                (a.locked ? kBadgeLockPadPx : kBadgePadPx)) / zoom;
    double x = b.maxX + kBadgeOffsetPx / zoom;
    badge.rect = {x, b.minY, x + w, b.minY + kBadgeHeightPx / zoom};
    f.labels.push_back(std::move(badge));
  }

  // Selection chrome.
  if (const Annotation* sel = gc.selected()) {
    Bounds b;
    if (shapeBounds(*sel, b, markerRadius)) {
      if (sel->type != AnnotationType::Angle && sel->type != AnnotationType::Circle) {
        f.hasOutline = true;
        f.outline = b.expanded(kOutlinePadPx / zoom);
      }
      if (!sel->locked && supportsResize(sel->type) && sel->points.size() >= 2) {
        f.hasHandles = true;
        f.handles = HitTester::handlePositions(b);
      }
    }
  }

  // In-progress shape.
  if (const Annotation* p = gc.preview()) {
    f.preview = p;
    if (!p->points.empty()) {
      f.hasStartDot = true;
      f.startDot = p->points[0];
    }
    appendCaption(f.captions, *p, zoom);
  }

  const TextEntry& te = gc.textEntry();
  if (te.open) {
    f.textEntryOpen = true;
    Point a = f.view.toScreen({te.region.minX, te.region.minY});
    Point b = f.view.toScreen({te.region.maxX, te.region.maxY});
    f.textEntryScreen = {std::min(a.x, b.x), std::min(a.y, b.y),
                         std::max(a.x, b.x), std::max(a.y, b.y)};
  }

  // Cursor.
  switch (gc.state()) {
    case GestureState::Panning:
      f.cursor = CursorHint::Grab;
      break;
    case GestureState::Dragging:
      f.cursor = CursorHint::Move;
      break;
    case GestureState::Resizing:
      f.cursor = CursorHint::Crosshair;
      break;
    default:
      if (gc.panHold()) {
        f.cursor = CursorHint::Grab;
      } else if (gc.hoverHandle() != ResizeHandle::None) {
        f.cursor = cursorForHandle(gc.hoverHandle());
      } else if (gc.activeTool() == Tool::Eraser) {
        f.cursor = CursorHint::Eraser;
      } else if (gc.activeTool() != Tool::Select) {
        f.cursor = CursorHint::Crosshair;
      }
      break;
  }

  return f;
}

} // namespace xa
