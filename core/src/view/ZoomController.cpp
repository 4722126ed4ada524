#include "xa/view/ZoomController.hpp"
#include <algorithm>

namespace xa {

bool ZoomController::applyWheel(ViewTransform& vt, const Point& pivot,
                                double deltaY) const {
  if (deltaY == 0.0) return false;
  double factor = deltaY > 0.0 ? config_.wheelZoomOut : config_.wheelZoomIn;
  return vt.zoomAt(pivot, factor, config_.zoomMin, config_.zoomMax);
}

bool ZoomController::zoomIn(ViewTransform& vt, const Point& pivot) const {
  return vt.zoomAt(pivot, config_.stepZoom, config_.zoomMin, config_.zoomMax);
}

bool ZoomController::zoomOut(ViewTransform& vt, const Point& pivot) const {
  return vt.zoomAt(pivot, 1.0 / config_.stepZoom, config_.zoomMin, config_.zoomMax);
}

void ZoomController::fitImage(ViewTransform& vt, double surfaceW, double surfaceH,
                              double imageW, double imageH) const {
  if (imageW <= 0.0 || imageH <= 0.0 || surfaceW <= 0.0 || surfaceH <= 0.0) {
    vt = ViewTransform{};
    return;
  }

  double scaleX = surfaceW / imageW;
  double scaleY = surfaceH / imageH;
  double zoom = std::min(std::min(scaleX, scaleY), 1.0) * config_.fitScale;
  zoom = std::max(config_.zoomMin, std::min(zoom, config_.zoomMax));

  double cx = (surfaceW - imageW * zoom) * 0.5;
  double cy = (surfaceH - imageH * zoom) * 0.5;

  vt.setZoom(zoom);
  vt.setPan({std::max(config_.fitMinOffset, cx), std::max(config_.fitMinOffset, cy)});
}

} // namespace xa
