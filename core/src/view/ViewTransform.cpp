#include "xa/view/ViewTransform.hpp"
#include <algorithm>

namespace xa {

Point ViewTransform::toImage(const Point& screen) const {
  return (screen - pan_) / zoom_;
}

Point ViewTransform::toScreen(const Point& image) const {
  return image * zoom_ + pan_;
}

double ViewTransform::screenToImageDistance(double px) const {
  return px / zoom_;
}

bool ViewTransform::zoomAt(const Point& pivot, double factor,
                           double zoomMin, double zoomMax) {
  double newZoom = std::max(zoomMin, std::min(zoom_ * factor, zoomMax));
  if (newZoom == zoom_) return false;

  // Solve for the pan that keeps toImage(pivot) constant.
  pan_ = pivot - (pivot - pan_) * (newZoom / zoom_);
  zoom_ = newZoom;
  return true;
}

void ViewTransform::panBy(const Point& delta) {
  pan_ = pan_ + delta;
}

} // namespace xa
