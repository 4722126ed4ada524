#pragma once
#include "xa/geom/Geometry.hpp"
#include "xa/view/ViewTransform.hpp"

namespace xa {

// One bound pair for every zoom path (wheel, keys, buttons).
struct ViewConfig {
  double zoomMin{0.1};
  double zoomMax{10.0};
  double wheelZoomIn{1.1};     // per wheel tick towards the user
  double wheelZoomOut{0.9};
  double stepZoom{1.2};        // +/- keys and toolbar buttons
  double fitScale{0.85};       // fraction of the surface a fitted image fills
  double fitMinOffset{20.0};   // px
};

class ZoomController {
public:
  void setConfig(const ViewConfig& cfg) { config_ = cfg; }
  const ViewConfig& config() const { return config_; }

  // deltaY > 0 zooms out. Returns true if the view changed.
  bool applyWheel(ViewTransform& vt, const Point& pivot, double deltaY) const;

  bool zoomIn(ViewTransform& vt, const Point& pivot) const;
  bool zoomOut(ViewTransform& vt, const Point& pivot) const;

  // Fit an image into the surface and centre it.
  void fitImage(ViewTransform& vt, double surfaceW, double surfaceH,
                double imageW, double imageH) const;

private:
  ViewConfig config_;
};

} // namespace xa
