// Headless replay of a JSON interaction script.
// Usage: xa_replay <events.json> [config.json]
//
// Script: {"events":[{"type":"loadImage","width":1024,"height":768}, ...]}
// Entry types: loadImage, surface, down, move, up, leave, wheel, key, tool,
// text, lock, label, delete, undo, redo. Prints the final annotation DTO,
// the render frame summary and the engine stats.

#include "xa/config/EngineConfig.hpp"
#include "xa/ids/Id.hpp"
#include "xa/interaction/GestureController.hpp"
#include "xa/render/RenderFrame.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

namespace {

bool readFile(const char* path, std::string& out) {
  FILE* f = std::fopen(path, "rb");
  if (!f) return false;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  std::fclose(f);
  return true;
}

class CountingCapture : public xa::PointerCaptureHost {
public:
  void acquire() override { acquired++; }
  void release() override { released++; }
  int acquired{0};
  int released{0};
};

// Prints one line per frame.
class TextRenderer : public xa::AnnotationRenderer {
public:
  void render(const xa::RenderFrame& f) override {
    std::printf("frame zoom=%.3f pan=(%.1f,%.1f) shapes=%zu preview=%s selected=%llu"
                " handles=%s labels=%zu captions=%zu cursor=%s\n",
                f.view.zoom(), f.view.pan().x, f.view.pan().y,
                f.annotations ? f.annotations->size() : 0,
                f.preview ? xa::typeName(f.preview->type) : "none",
                static_cast<unsigned long long>(f.selectedId),
                f.hasHandles ? "yes" : "no",
                f.labels.size(), f.captions.size(),
                xa::cursorHintName(f.cursor));
    for (const auto& c : f.captions) {
      std::printf("  caption %s at (%.1f,%.1f)\n", c.text.c_str(), c.anchor.x, c.anchor.y);
    }
  }
};

double num(const rapidjson::Value& v, const char* key, double fallback = 0.0) {
  if (v.HasMember(key) && v[key].IsNumber()) return v[key].GetDouble();
  return fallback;
}

bool flag(const rapidjson::Value& v, const char* key) {
  return v.HasMember(key) && v[key].IsBool() && v[key].GetBool();
}

std::string str(const rapidjson::Value& v, const char* key) {
  if (v.HasMember(key) && v[key].IsString()) return v[key].GetString();
  return {};
}

// "id" may be a decimal string; absent means the current selection.
xa::Id targetId(const rapidjson::Value& v, const xa::GestureController& gc) {
  std::string s = str(v, "id");
  if (s.empty()) return gc.selectedId();
  try {
    return xa::parseIdString(s);
  } catch (const std::runtime_error& e) {
    std::fprintf(stderr, "[xa_replay] bad id '%s': %s\n", s.c_str(), e.what());
    return xa::kInvalidId;
  }
}

bool parseKey(const rapidjson::Value& v, xa::KeyEvent& out) {
  std::string k = str(v, "key");
  if (k.empty()) return false;
  if (k == "space") out = xa::KeyEvent::key(xa::KeyCode::Space);
  else if (k == "delete") out = xa::KeyEvent::key(xa::KeyCode::Delete);
  else if (k == "backspace") out = xa::KeyEvent::key(xa::KeyCode::Backspace);
  else if (k.size() == 1) out = xa::KeyEvent::character(k[0]);
  else return false;
  out.ctrl = flag(v, "ctrl");
  out.meta = flag(v, "meta");
  out.shift = flag(v, "shift");
  return true;
}

bool applyEvent(xa::GestureController& gc, const rapidjson::Value& ev) {
  std::string type = str(ev, "type");
  xa::Point p{num(ev, "x"), num(ev, "y")};

  if (type == "loadImage") {
    gc.loadImage(num(ev, "width"), num(ev, "height"));
  } else if (type == "surface") {
    gc.setSurfaceSize(num(ev, "width"), num(ev, "height"));
  } else if (type == "down") {
    gc.pointerDown(p);
  } else if (type == "move") {
    gc.pointerMove(p);
  } else if (type == "up") {
    gc.pointerUp(p);
  } else if (type == "leave") {
    gc.pointerLeave();
  } else if (type == "wheel") {
    gc.wheel(p, num(ev, "deltaY"));
  } else if (type == "key") {
    xa::KeyEvent k;
    if (!parseKey(ev, k)) return false;
    if (flag(ev, "release")) gc.keyUp(k);
    else gc.keyDown(k);
  } else if (type == "tool") {
    xa::AnnotationType t;
    if (!xa::parseTypeName(str(ev, "tool"), t)) return false;
    gc.setTool(t);
  } else if (type == "text") {
    if (flag(ev, "cancel")) gc.cancelText();
    else gc.confirmText(str(ev, "text"));
  } else if (type == "lock") {
    gc.toggleLock(targetId(ev, gc));
  } else if (type == "label") {
    gc.setLabel(targetId(ev, gc), str(ev, "text"));
  } else if (type == "delete") {
    gc.deleteAnnotation(targetId(ev, gc));
  } else if (type == "undo") {
    gc.undo();
  } else if (type == "redo") {
    gc.redo();
  } else {
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <events.json> [config.json]\n", argv[0]);
    return 2;
  }

  xa::EngineConfig cfg;
  if (argc > 2) {
    std::string cfgText;
    if (!readFile(argv[2], cfgText)) {
      std::fprintf(stderr, "[xa_replay] cannot read %s\n", argv[2]);
      return 1;
    }
    if (!xa::loadEngineConfig(cfgText, cfg)) return 1;
  }

  std::string script;
  if (!readFile(argv[1], script)) {
    std::fprintf(stderr, "[xa_replay] cannot read %s\n", argv[1]);
    return 1;
  }

  rapidjson::Document doc;
  doc.Parse(script.c_str());
  if (doc.HasParseError() || !doc.IsObject() ||
      !doc.HasMember("events") || !doc["events"].IsArray()) {
    std::fprintf(stderr, "[xa_replay] script must be {\"events\":[...]}\n");
    return 1;
  }

  CountingCapture capture;
  TextRenderer renderer;
  xa::GestureController gc(cfg);
  gc.setPointerCaptureHost(&capture);

  int index = 0;
  for (const auto& ev : doc["events"].GetArray()) {
    if (!ev.IsObject() || !applyEvent(gc, ev)) {
      std::fprintf(stderr, "[xa_replay] skipping event %d\n", index);
    }
    ++index;
  }

  renderer.render(xa::buildRenderFrame(gc));

  std::printf("%s\n", gc.store().toJSON().c_str());

  const auto& s = gc.stats();
  std::printf("events=%d commits=%u discarded=%u erased=%u undos=%u redos=%u"
              " history=%zu/%zu capture=%d/%d\n",
              index, s.historyCommits, s.discardedGestures, s.erasedShapes,
              s.undos, s.redos, gc.history().index(), gc.history().size(),
              capture.acquired, capture.released);
  return 0;
}
