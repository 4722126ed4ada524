#pragma once
#include "xa/geom/Geometry.hpp"

namespace xa {

// Screen <-> image mapping: image = (screen - pan) / zoom.
// Process-wide view state; never part of annotation history.
class ViewTransform {
public:
  ViewTransform() = default;
  ViewTransform(double zoom, Point pan) : zoom_(zoom), pan_(pan) {}

  Point toImage(const Point& screen) const;
  Point toScreen(const Point& image) const;

  // Screen-space pixel distance expressed in image units (K / zoom).
  double screenToImageDistance(double px) const;

  // Scale by factor clamped to [zoomMin, zoomMax], keeping the image point
  // under pivot fixed. Returns false if the zoom did not change.
  bool zoomAt(const Point& pivot, double factor, double zoomMin, double zoomMax);

  void panBy(const Point& delta);
  void setPan(const Point& pan) { pan_ = pan; }
  void setZoom(double zoom) { zoom_ = zoom; }

  double zoom() const { return zoom_; }
  const Point& pan() const { return pan_; }

  bool operator==(const ViewTransform& o) const {
    return zoom_ == o.zoom_ && pan_ == o.pan_;
  }

private:
  double zoom_{1.0};
  Point pan_{0, 0};
};

} // namespace xa
