#pragma once

namespace xa {

// Installed by the embedding layer: routes pointer move/up events that
// happen outside the drawing surface back to the controller while a
// gesture is active (window-level listeners, SetCapture, grabMouse, ...).
class PointerCaptureHost {
public:
  virtual ~PointerCaptureHost() = default;
  virtual void acquire() = 0;
  virtual void release() = 0;
};

// Holds the capture for exactly one gesture. Released on destruction, so
// every exit path of the gesture drops the subscription.
class ScopedPointerCapture {
public:
  explicit ScopedPointerCapture(PointerCaptureHost* host) : host_(host) {
    if (host_) host_->acquire();
  }
  ~ScopedPointerCapture() {
    if (host_) host_->release();
  }

  ScopedPointerCapture(const ScopedPointerCapture&) = delete;
  ScopedPointerCapture& operator=(const ScopedPointerCapture&) = delete;

private:
  PointerCaptureHost* host_;
};

} // namespace xa
