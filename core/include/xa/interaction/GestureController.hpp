#pragma once
#include "xa/annotation/Annotation.hpp"
#include "xa/annotation/AnnotationStore.hpp"
#include "xa/config/EngineConfig.hpp"
#include "xa/debug/Stats.hpp"
#include "xa/geom/Geometry.hpp"
#include "xa/history/HistoryStack.hpp"
#include "xa/hit/HitTester.hpp"
#include "xa/interaction/InputState.hpp"
#include "xa/interaction/PointerCapture.hpp"
#include "xa/view/ViewTransform.hpp"
#include "xa/view/ZoomController.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace xa {

// Gesture states. Idle is both initial and the state every completed
// gesture returns to; MultiStepPlacing survives between pointer gestures.
enum class GestureState : std::uint8_t {
  Idle = 0,
  Panning,
  Drawing,
  MultiStepPlacing,
  Dragging,
  Resizing,
  Erasing,
  TextBoxing
};

const char* gestureStateName(GestureState s);

// The single authoritative record of the gesture in progress. Updated in
// place on every event; nothing else caches gesture state.
struct GestureSession {
  GestureState state{GestureState::Idle};

  // Drawing / MultiStepPlacing / TextBoxing: shape being built.
  Annotation working;
  bool hasWorking{false};
  int step{0};

  // Panning
  Point downScreen;
  Point panAtDown;

  // Dragging: last image-space pointer position.
  Point dragReference;

  // Resizing
  Id targetId{kInvalidId};
  ResizeHandle handle{ResizeHandle::None};
  Point resizeStart;
  Point anchor;
  Annotation original;   // grabbed shape as it was at pointer-down

  // Erasing
  bool erasedAny{false};

  Point lastScreen;
  std::unique_ptr<ScopedPointerCapture> capture;

  void reset();
};

// Inline text-entry region opened after a valid text-box placement.
struct TextEntry {
  bool open{false};
  Bounds region;     // image space
};

// Pointer, wheel and keyboard in; annotation collection, selection and view
// out. Single-threaded: each call fully applies one event.
class GestureController {
public:
  explicit GestureController(const EngineConfig& cfg = EngineConfig{});
  ~GestureController();

  GestureController(const GestureController&) = delete;
  GestureController& operator=(const GestureController&) = delete;

  void setConfig(const EngineConfig& cfg);
  const EngineConfig& config() const { return config_; }

  // Optional: window-level pointer routing held for each gesture.
  void setPointerCaptureHost(PointerCaptureHost* host) { captureHost_ = host; }

  // ---- image / document ----
  void setSurfaceSize(double width, double height);
  // Fits the view, clears the collection and resets history to [[]].
  void loadImage(double imageWidth, double imageHeight);
  // Replaces the collection and resets history to [annotations].
  void loadAnnotations(AnnotationList annotations);
  bool hasImage() const { return hasImage_; }

  // ---- pointer (screen space) ----
  void pointerDown(const Point& screen);
  void pointerMove(const Point& screen);
  void pointerUp(const Point& screen);
  // Pointer left the surface: finalizes like pointerUp at the last position.
  void pointerLeave();
  void wheel(const Point& screen, double deltaY);

  // ---- keyboard ----
  // Returns true if the key was consumed.
  bool keyDown(const KeyEvent& e);
  bool keyUp(const KeyEvent& e);
  void setTextInputFocused(bool focused) { textInputFocused_ = focused; }

  // ---- tools and actions ----
  void setTool(Tool tool);
  Tool activeTool() const { return tool_; }

  bool select(Id id);
  void clearSelection() { selectedId_ = kInvalidId; }
  Id selectedId() const { return selectedId_; }
  const Annotation* selected() const;

  bool undo();
  bool redo();
  bool canUndo() const { return history_.canUndo(); }
  bool canRedo() const { return history_.canRedo(); }

  // Explicit deletion ignores the lock flag.
  bool deleteSelected();
  bool deleteAnnotation(Id id);
  bool toggleLock(Id id);
  bool setLabel(Id id, const std::string& label);

  // Commits a text shape at the open entry region if the trimmed text is
  // non-empty. Returns the new id, or kInvalidId.
  Id confirmText(const std::string& text);
  void cancelText();
  const TextEntry& textEntry() const { return textEntry_; }

  bool zoomIn();
  bool zoomOut();
  void togglePan() { panHold_ = !panHold_; }
  void setPanHold(bool hold) { panHold_ = hold; }
  bool panHold() const { return panHold_; }

  // ---- state for the render contract ----
  const ViewTransform& view() const { return view_; }
  void setView(const ViewTransform& vt) { view_ = vt; }
  const AnnotationStore& store() const { return store_; }
  const AnnotationList& annotations() const { return store_.annotations(); }
  const HistoryStack& history() const { return history_; }
  GestureState state() const { return session_.state; }
  int placementStep() const { return session_.step; }
  // Shape being drawn or placed, or nullptr.
  const Annotation* preview() const;
  ResizeHandle hoverHandle() const { return hoverHandle_; }
  bool gestureActive() const;
  bool captureHeld() const { return session_.capture != nullptr; }
  const EngineStats& stats() const { return stats_; }

  double hitThreshold() const;
  double handleSize() const;

private:
  EngineConfig config_;
  ZoomController zoom_;
  HitTester hitTester_;

  ViewTransform view_;
  AnnotationStore store_;
  HistoryStack history_;
  GestureSession session_;
  TextEntry textEntry_;

  Tool tool_{Tool::Select};
  Id selectedId_{kInvalidId};
  ResizeHandle hoverHandle_{ResizeHandle::None};
  bool panHold_{false};
  bool textInputFocused_{false};
  bool hasImage_{false};
  double surfaceW_{0}, surfaceH_{0};

  PointerCaptureHost* captureHost_{nullptr};
  EngineStats stats_;

  void beginGesture(GestureState s);
  void endGesture();
  void discardPlacement();
  void commitIfChanged(const char* what);
  void finalize();

  void beginPan(const Point& screen);
  bool tryBeginResize(const Point& image);
  void beginDraw(const Point& image);
  void placeMarker(const Point& image);
  void placeAngleStep(const Point& image);
  Id commitShape(Annotation shape);

  void moveResize(const Point& image);
  Point circleCorner(ResizeHandle h, const Point& damped) const;
  void moveDrag(const Point& image);
  void eraseAt(const Point& image);
  void updateWorking(const Point& image);
  void updateHover(const Point& image);

  void finishTextBox();
  Point zoomPivot() const;
  void trace(const char* what) const;
};

} // namespace xa
