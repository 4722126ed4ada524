#pragma once
#include "xa/annotation/Annotation.hpp"
#include "xa/geom/Geometry.hpp"
#include <array>
#include <cstdint>

namespace xa {

// Screen-space sizes; divide by zoom before use.
struct HitConfig {
  double hitThresholdPx{15.0};
  double handleSizePx{8.0};
  double markerRadius{15.0};   // image units, added to the marker threshold
};

enum class ResizeHandle : std::uint8_t {
  None = 0, NW, NE, SW, SE, N, S, W, E
};

const char* handleName(ResizeHandle h);

inline bool isEdgeHandle(ResizeHandle h) {
  return h == ResizeHandle::N || h == ResizeHandle::S ||
         h == ResizeHandle::W || h == ResizeHandle::E;
}

struct HandlePosition {
  ResizeHandle handle{ResizeHandle::None};
  Point position;
};

class HitTester {
public:
  void setConfig(const HitConfig& cfg) { config_ = cfg; }
  const HitConfig& config() const { return config_; }

  // threshold is in image units (hitThresholdPx / zoom).
  bool isNear(const Point& p, const Annotation& a, double threshold) const;

  // First annotation in collection order near p, or nullptr.
  // skipLocked ignores locked shapes (eraser).
  const Annotation* findFirstHit(const AnnotationList& list, const Point& p,
                                 double threshold, bool skipLocked = false) const;

  // Handle under p for a resizable shape. handleSize is in image units.
  // Corners take precedence over edge midpoints.
  ResizeHandle handleAt(const Point& p, const Annotation& a, double handleSize) const;

  // 4 corners then 4 edge midpoints: NW, NE, SW, SE, N, S, W, E.
  static std::array<HandlePosition, 8> handlePositions(const Bounds& b);

  // Point held fixed while dragging handle h of a shape with bounds b.
  static Point resizeAnchor(const Bounds& b, ResizeHandle h);

private:
  HitConfig config_;
};

} // namespace xa
