#include "xa/interaction/GestureController.hpp"
#include "xa/annotation/ShapeGeometry.hpp"
#include "xa/interaction/Shortcuts.hpp"
#include "xa/style/Palette.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace xa {

const char* gestureStateName(GestureState s) {
  switch (s) {
    case GestureState::Idle: return "idle";
    case GestureState::Panning: return "panning";
    case GestureState::Drawing: return "drawing";
    case GestureState::MultiStepPlacing: return "multiStepPlacing";
    case GestureState::Dragging: return "dragging";
    case GestureState::Resizing: return "resizing";
    case GestureState::Erasing: return "erasing";
    case GestureState::TextBoxing: return "textBoxing";
  }
  return "unknown";
}

void GestureSession::reset() {
  capture.reset();
  state = GestureState::Idle;
  working = Annotation{};
  hasWorking = false;
  step = 0;
  targetId = kInvalidId;
  handle = ResizeHandle::None;
  original = Annotation{};
  erasedAny = false;
}

namespace {

std::string trimmed(const std::string& s) {
  const char* ws = " \t\r\n";
  auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) return {};
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

} // namespace

GestureController::GestureController(const EngineConfig& cfg) {
  setConfig(cfg);
}

GestureController::~GestureController() {
  session_.reset();
}

void GestureController::setConfig(const EngineConfig& cfg) {
  config_ = cfg;
  zoom_.setConfig(cfg.view);
  hitTester_.setConfig(cfg.hit);
}

// ---- image / document ----

void GestureController::setSurfaceSize(double width, double height) {
  surfaceW_ = width;
  surfaceH_ = height;
}

void GestureController::loadImage(double imageWidth, double imageHeight) {
  session_.reset();
  textEntry_ = TextEntry{};
  zoom_.fitImage(view_, surfaceW_, surfaceH_, imageWidth, imageHeight);
  store_.replaceAll({});
  history_.reset();
  selectedId_ = kInvalidId;
  hoverHandle_ = ResizeHandle::None;
  hasImage_ = true;
}

void GestureController::loadAnnotations(AnnotationList annotations) {
  session_.reset();
  textEntry_ = TextEntry{};
  store_.replaceAll(std::move(annotations));
  history_.reset(store_.annotations());
  selectedId_ = kInvalidId;
  hoverHandle_ = ResizeHandle::None;
}

// ---- gesture bookkeeping ----

void GestureController::beginGesture(GestureState s) {
  session_.state = s;
  if (s != GestureState::MultiStepPlacing && s != GestureState::Idle) {
    session_.capture = std::make_unique<ScopedPointerCapture>(captureHost_);
  }
  trace("begin");
}

void GestureController::endGesture() {
  session_.reset();
}

bool GestureController::gestureActive() const {
  return session_.state != GestureState::Idle &&
         session_.state != GestureState::MultiStepPlacing;
}

void GestureController::discardPlacement() {
  if (session_.state != GestureState::MultiStepPlacing) return;
  trace("discard placement");
  session_.reset();
  stats_.discardedGestures++;
}

void GestureController::commitIfChanged(const char* what) {
  if (store_.annotations() == history_.current()) return;
  history_.push(store_.annotations());
  stats_.historyCommits++;
  trace(what);
}

Id GestureController::commitShape(Annotation shape) {
  if (!isCommittable(shape, config_.gesture.minDrawExtent)) {
    stats_.discardedGestures++;
    trace("discard");
    return kInvalidId;
  }
  Id id = store_.add(std::move(shape));
  commitIfChanged("commit");
  return id;
}

void GestureController::trace(const char* what) const {
  if (!config_.debug.traceGestures) return;
  std::fprintf(stderr, "[GestureController] %s state=%s tool=%s shapes=%u history=%u/%u\n",
               what, gestureStateName(session_.state), typeName(tool_),
               static_cast<unsigned>(store_.count()),
               static_cast<unsigned>(history_.index()),
               static_cast<unsigned>(history_.size()));
}

double GestureController::hitThreshold() const {
  return view_.screenToImageDistance(config_.hit.hitThresholdPx);
}

double GestureController::handleSize() const {
  return view_.screenToImageDistance(config_.hit.handleSizePx);
}

const Annotation* GestureController::selected() const {
  if (selectedId_ == kInvalidId) return nullptr;
  return store_.get(selectedId_);
}

const Annotation* GestureController::preview() const {
  return session_.hasWorking ? &session_.working : nullptr;
}

// ---- pointer ----

void GestureController::pointerDown(const Point& screen) {
  if (!hasImage_) return;

  // A down without a matching up: close out the previous gesture first.
  if (gestureActive()) finalize();
  if (textEntry_.open) cancelText();

  session_.lastScreen = screen;
  Point image = view_.toImage(screen);

  if (panHold_) {
    beginPan(screen);
    return;
  }

  if (tryBeginResize(image)) return;

  if (tool_ == Tool::Select) {
    const Annotation* hit = hitTester_.findFirstHit(annotations(), image, hitThreshold());
    if (hit) {
      selectedId_ = hit->id;
      if (!hit->locked) {
        beginGesture(GestureState::Dragging);
        session_.dragReference = image;
      }
      return;
    }
    selectedId_ = kInvalidId;
    beginPan(screen);
    return;
  }

  selectedId_ = kInvalidId;

  switch (tool_) {
    case Tool::Eraser:
      beginGesture(GestureState::Erasing);
      eraseAt(image);
      return;

    case Tool::Text:
      beginGesture(GestureState::TextBoxing);
      session_.working = Annotation{};
      session_.working.type = AnnotationType::Text;
      session_.working.points = {image, image};
      session_.working.color = colorFor(config_.palette, AnnotationType::Text);
      session_.working.label = store_.defaultLabel(AnnotationType::Text);
      session_.hasWorking = true;
      return;

    case Tool::Marker:
      placeMarker(image);
      return;

    case Tool::Angle:
      placeAngleStep(image);
      return;

    case Tool::Box:
    case Tool::Circle:
    case Tool::Ellipse:
    case Tool::Line:
    case Tool::Ruler:
    case Tool::Freehand:
      beginDraw(image);
      return;

    case Tool::Select:
      return;
  }
}

void GestureController::pointerMove(const Point& screen) {
  session_.lastScreen = screen;
  if (!hasImage_) return;

  Point image = view_.toImage(screen);

  switch (session_.state) {
    case GestureState::Panning:
      view_.setPan(session_.panAtDown + (screen - session_.downScreen));
      return;
    case GestureState::Resizing:
      moveResize(image);
      return;
    case GestureState::Dragging:
      moveDrag(image);
      return;
    case GestureState::Erasing:
      eraseAt(image);
      return;
    case GestureState::Drawing:
    case GestureState::TextBoxing:
    case GestureState::MultiStepPlacing:
      updateWorking(image);
      return;
    case GestureState::Idle:
      updateHover(image);
      return;
  }
}

void GestureController::pointerUp(const Point& screen) {
  session_.lastScreen = screen;
  finalize();
}

void GestureController::pointerLeave() {
  finalize();
}

void GestureController::finalize() {
  switch (session_.state) {
    case GestureState::Idle:
    case GestureState::MultiStepPlacing:
      return;

    case GestureState::Panning:
      endGesture();
      return;

    case GestureState::Resizing:
      endGesture();
      commitIfChanged("resize");
      return;

    case GestureState::Dragging:
      endGesture();
      commitIfChanged("drag");
      return;

    case GestureState::Erasing: {
      bool erased = session_.erasedAny;
      endGesture();
      if (erased) commitIfChanged("erase");
      return;
    }

    case GestureState::TextBoxing:
      finishTextBox();
      return;

    case GestureState::Drawing: {
      Annotation shape = std::move(session_.working);
      endGesture();
      Id id = commitShape(std::move(shape));
      if (id != kInvalidId) {
        selectedId_ = id;
        setTool(Tool::Select);
      }
      return;
    }
  }
}

void GestureController::wheel(const Point& screen, double deltaY) {
  if (!hasImage_) return;
  zoom_.applyWheel(view_, screen, deltaY);
}

// ---- gesture starts ----

void GestureController::beginPan(const Point& screen) {
  discardPlacement();
  beginGesture(GestureState::Panning);
  session_.downScreen = screen;
  session_.panAtDown = view_.pan();
}

bool GestureController::tryBeginResize(const Point& image) {
  const Annotation* sel = selected();
  if (!sel || sel->locked) return false;

  ResizeHandle h = hitTester_.handleAt(image, *sel, handleSize());
  if (h == ResizeHandle::None) return false;

  Bounds b;
  if (!shapeBounds(*sel, b, config_.hit.markerRadius)) return false;

  beginGesture(GestureState::Resizing);
  session_.targetId = sel->id;
  session_.handle = h;
  session_.resizeStart = image;
  session_.anchor = HitTester::resizeAnchor(b, h);
  session_.original = *sel;
  return true;
}

void GestureController::beginDraw(const Point& image) {
  beginGesture(GestureState::Drawing);
  session_.working = Annotation{};
  session_.working.type = tool_;
  if (tool_ == Tool::Freehand) {
    session_.working.points = {image};
  } else {
    session_.working.points = {image, image};
  }
  session_.working.color = colorFor(config_.palette, tool_);
  session_.working.label = store_.defaultLabel(tool_);
  session_.hasWorking = true;
}

void GestureController::placeMarker(const Point& image) {
  Annotation m;
  m.type = AnnotationType::Marker;
  m.points = {image};
  m.color = colorFor(config_.palette, AnnotationType::Marker);
  m.label = store_.defaultLabel(AnnotationType::Marker);

  Id id = commitShape(std::move(m));
  if (id != kInvalidId) {
    selectedId_ = id;
    setTool(Tool::Select);
  }
}

void GestureController::placeAngleStep(const Point& image) {
  Annotation& w = session_.working;

  if (session_.state != GestureState::MultiStepPlacing) {
    beginGesture(GestureState::MultiStepPlacing);
    w = Annotation{};
    w.type = AnnotationType::Angle;
    w.points = {image, image};
    w.color = colorFor(config_.palette, AnnotationType::Angle);
    w.label = store_.defaultLabel(AnnotationType::Angle);
    session_.hasWorking = true;
    session_.step = 1;
    return;
  }

  if (session_.step == 1) {
    w.points = {w.points[0], image, image};
    session_.step = 2;
    return;
  }

  Annotation done = w;
  done.points = {w.points[0], w.points[1], image};
  session_.reset();

  Id id = commitShape(std::move(done));
  if (id != kInvalidId) {
    selectedId_ = id;
    setTool(Tool::Select);
  }
}

// ---- pointer-move handlers ----

void GestureController::moveResize(const Point& image) {
  Annotation* a = store_.getMutable(session_.targetId);
  if (!a || a->locked) return;

  const auto& orig = session_.original.points;
  if (orig.size() < 2) return;

  double k = config_.gesture.resizeDamping;
  Point damped = session_.resizeStart + (image - session_.resizeStart) * k;

  Point p0 = session_.anchor;
  Point p1 = damped;
  ResizeHandle h = session_.handle;

  if (a->type == AnnotationType::Circle) {
    a->points = {p0, circleCorner(h, damped)};
    return;
  }

  // Edge handles keep the untouched axis of the non-anchor point.
  if (h == ResizeHandle::N || h == ResizeHandle::S) {
    p1.x = (orig[0].x == session_.anchor.x) ? orig[1].x : orig[0].x;
  }
  if (h == ResizeHandle::E || h == ResizeHandle::W) {
    p1.y = (orig[0].y == session_.anchor.y) ? orig[1].y : orig[0].y;
  }

  a->points = {p0, p1};
}

// Circles keep a square extent: the far corner sits on the diagonal from the
// anchor, sized by the larger axis (or by the moved axis for edge handles).
Point GestureController::circleCorner(ResizeHandle h, const Point& damped) const {
  const Point& anchor = session_.anchor;
  Bounds b;
  if (!shapeBounds(session_.original, b, config_.hit.markerRadius)) return damped;
  double dirX = (b.minX + b.maxX) * 0.5 >= anchor.x ? 1.0 : -1.0;
  double dirY = (b.minY + b.maxY) * 0.5 >= anchor.y ? 1.0 : -1.0;

  double dx = damped.x - anchor.x;
  double dy = damped.y - anchor.y;
  double sx = dx > 0 ? 1.0 : (dx < 0 ? -1.0 : dirX);
  double sy = dy > 0 ? 1.0 : (dy < 0 ? -1.0 : dirY);

  double side = std::max(std::fabs(dx), std::fabs(dy));
  if (h == ResizeHandle::N || h == ResizeHandle::S) {
    side = std::fabs(dy);
    sx = dirX;
  } else if (h == ResizeHandle::E || h == ResizeHandle::W) {
    side = std::fabs(dx);
    sy = dirY;
  }
  return {anchor.x + sx * side, anchor.y + sy * side};
}

void GestureController::moveDrag(const Point& image) {
  Annotation* a = store_.getMutable(selectedId_);
  if (!a || a->locked) return;

  Point delta = image - session_.dragReference;
  for (auto& p : a->points) {
    p = p + delta;
  }
  session_.dragReference = image;
}

void GestureController::eraseAt(const Point& image) {
  const Annotation* hit = hitTester_.findFirstHit(annotations(), image, hitThreshold(), true);
  if (!hit) return;

  Id id = hit->id;
  store_.remove(id);
  if (selectedId_ == id) selectedId_ = kInvalidId;
  session_.erasedAny = true;
  stats_.erasedShapes++;
}

void GestureController::updateWorking(const Point& image) {
  if (!session_.hasWorking) return;
  Annotation& w = session_.working;
  if (w.points.empty()) return;

  if (w.type == AnnotationType::Freehand) {
    w.points.push_back(image);
    return;
  }

  if (session_.state == GestureState::MultiStepPlacing && session_.step == 2) {
    w.points = {w.points[0], w.points[1], image};
    return;
  }

  w.points = {w.points[0], image};
}

void GestureController::updateHover(const Point& image) {
  hoverHandle_ = ResizeHandle::None;
  if (tool_ != Tool::Select) return;
  const Annotation* sel = selected();
  if (!sel || sel->locked) return;
  hoverHandle_ = hitTester_.handleAt(image, *sel, handleSize());
}

// ---- text ----

void GestureController::finishTextBox() {
  Annotation w = std::move(session_.working);
  endGesture();

  Point s = w.points.empty() ? Point{} : w.points[0];
  Point e = w.points.size() > 1 ? w.points[1] : s;
  double width = std::fabs(e.x - s.x);
  double height = std::fabs(e.y - s.y);

  const GestureConfig& g = config_.gesture;
  if (!(width > g.textMinWidth && height > g.textMinHeight)) {
    stats_.discardedGestures++;
    trace("discard text box");
    return;
  }

  double x = std::min(s.x, e.x);
  double y = std::min(s.y, e.y);
  textEntry_.open = true;
  textEntry_.region = {x, y,
                       x + std::max(width, g.textEntryMinWidth),
                       y + std::max(height, g.textEntryMinHeight)};
  trace("text entry open");
}

Id GestureController::confirmText(const std::string& text) {
  if (!textEntry_.open) return kInvalidId;
  Bounds region = textEntry_.region;
  textEntry_ = TextEntry{};

  std::string value = trimmed(text);
  if (value.empty()) {
    stats_.discardedGestures++;
    trace("discard empty text");
    return kInvalidId;
  }

  Annotation t;
  t.type = AnnotationType::Text;
  t.points = {{region.minX, region.minY}, {region.maxX, region.maxY}};
  t.color = colorFor(config_.palette, AnnotationType::Text);
  t.text = value;
  t.label = store_.defaultLabel(AnnotationType::Text);

  Id id = commitShape(std::move(t));
  if (id != kInvalidId) {
    selectedId_ = id;
    setTool(Tool::Select);
  }
  return id;
}

void GestureController::cancelText() {
  if (!textEntry_.open) return;
  textEntry_ = TextEntry{};
  stats_.discardedGestures++;
}

// ---- tools and actions ----

void GestureController::setTool(Tool tool) {
  if (session_.state == GestureState::MultiStepPlacing) discardPlacement();
  tool_ = tool;
  hoverHandle_ = ResizeHandle::None;
  if (tool != Tool::Select) panHold_ = false;
}

bool GestureController::select(Id id) {
  if (!store_.get(id)) return false;
  selectedId_ = id;
  return true;
}

bool GestureController::undo() {
  if (gestureActive()) return false;
  if (!history_.undo()) return false;
  discardPlacement();
  store_.replaceAll(history_.current());
  selectedId_ = kInvalidId;
  stats_.undos++;
  trace("undo");
  return true;
}

bool GestureController::redo() {
  if (gestureActive()) return false;
  if (!history_.redo()) return false;
  discardPlacement();
  store_.replaceAll(history_.current());
  selectedId_ = kInvalidId;
  stats_.redos++;
  trace("redo");
  return true;
}

bool GestureController::deleteSelected() {
  if (selectedId_ == kInvalidId) return false;
  return deleteAnnotation(selectedId_);
}

bool GestureController::deleteAnnotation(Id id) {
  if (gestureActive()) return false;
  if (!store_.remove(id)) return false;
  if (selectedId_ == id) selectedId_ = kInvalidId;
  commitIfChanged("delete");
  return true;
}

bool GestureController::toggleLock(Id id) {
  if (gestureActive()) return false;
  if (!store_.toggleLock(id)) return false;
  commitIfChanged("lock");
  return true;
}

bool GestureController::setLabel(Id id, const std::string& label) {
  if (gestureActive()) return false;
  if (!store_.setLabel(id, label)) return false;
  commitIfChanged("label");
  return true;
}

Point GestureController::zoomPivot() const {
  if (surfaceW_ > 0.0 && surfaceH_ > 0.0) return {surfaceW_ * 0.5, surfaceH_ * 0.5};
  return {0.0, 0.0};
}

bool GestureController::zoomIn() {
  return zoom_.zoomIn(view_, zoomPivot());
}

bool GestureController::zoomOut() {
  return zoom_.zoomOut(view_, zoomPivot());
}

// ---- keyboard ----

bool GestureController::keyDown(const KeyEvent& e) {
  if (textInputFocused_ || textEntry_.open) return false;

  ShortcutBinding b = mapShortcut(e);
  switch (b.action) {
    case ShortcutAction::None:
      return false;
    case ShortcutAction::SelectTool:
      setTool(b.tool);
      return true;
    case ShortcutAction::ZoomIn:
      zoomIn();
      return true;
    case ShortcutAction::ZoomOut:
      zoomOut();
      return true;
    case ShortcutAction::PanHold:
      panHold_ = true;
      return true;
    case ShortcutAction::Undo:
      undo();
      return true;
    case ShortcutAction::Redo:
      redo();
      return true;
    case ShortcutAction::DeleteSelected:
      return deleteSelected();
  }
  return false;
}

bool GestureController::keyUp(const KeyEvent& e) {
  bool space = e.code == KeyCode::Space || (e.code == KeyCode::Char && e.ch == ' ');
  if (!space) return false;
  panHold_ = false;
  return true;
}

} // namespace xa
