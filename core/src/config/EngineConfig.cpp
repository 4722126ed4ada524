#include "xa/config/EngineConfig.hpp"

#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace xa {

namespace {

void readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  if (obj.HasMember(key) && obj[key].IsString()) out = obj[key].GetString();
}

void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (obj.HasMember(key) && obj[key].IsBool()) out = obj[key].GetBool();
}

} // namespace

bool loadEngineConfig(const std::string& json, EngineConfig& cfg) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "[EngineConfig] parse error at offset %u\n",
                 static_cast<unsigned>(doc.GetErrorOffset()));
    return false;
  }

  EngineConfig next = cfg;

  if (doc.HasMember("view") && doc["view"].IsObject()) {
    const auto& v = doc["view"];
    readNumber(v, "zoomMin", next.view.zoomMin);
    readNumber(v, "zoomMax", next.view.zoomMax);
    readNumber(v, "wheelZoomIn", next.view.wheelZoomIn);
    readNumber(v, "wheelZoomOut", next.view.wheelZoomOut);
    readNumber(v, "stepZoom", next.view.stepZoom);
    readNumber(v, "fitScale", next.view.fitScale);
    readNumber(v, "fitMinOffset", next.view.fitMinOffset);
  }

  if (doc.HasMember("hit") && doc["hit"].IsObject()) {
    const auto& h = doc["hit"];
    readNumber(h, "hitThresholdPx", next.hit.hitThresholdPx);
    readNumber(h, "handleSizePx", next.hit.handleSizePx);
    readNumber(h, "markerRadius", next.hit.markerRadius);
  }

  if (doc.HasMember("gesture") && doc["gesture"].IsObject()) {
    const auto& g = doc["gesture"];
    readNumber(g, "resizeDamping", next.gesture.resizeDamping);
    readNumber(g, "textMinWidth", next.gesture.textMinWidth);
    readNumber(g, "textMinHeight", next.gesture.textMinHeight);
    readNumber(g, "textEntryMinWidth", next.gesture.textEntryMinWidth);
    readNumber(g, "textEntryMinHeight", next.gesture.textEntryMinHeight);
    readNumber(g, "minDrawExtent", next.gesture.minDrawExtent);
  }

  if (doc.HasMember("palette") && doc["palette"].IsObject()) {
    const auto& p = doc["palette"];
    readString(p, "marker", next.palette.marker);
    readString(p, "box", next.palette.box);
    readString(p, "circle", next.palette.circle);
    readString(p, "ellipse", next.palette.ellipse);
    readString(p, "line", next.palette.line);
    readString(p, "freehand", next.palette.freehand);
    readString(p, "ruler", next.palette.ruler);
    readString(p, "angle", next.palette.angle);
    readString(p, "text", next.palette.text);
    readString(p, "tool", next.palette.tool);
    readString(p, "selection", next.palette.selection);
    readString(p, "selectionFill", next.palette.selectionFill);
    readString(p, "handle", next.palette.handle);
    readString(p, "handleStroke", next.palette.handleStroke);
  }

  if (doc.HasMember("debug") && doc["debug"].IsObject()) {
    readBool(doc["debug"], "traceGestures", next.debug.traceGestures);
  }

  if (next.view.zoomMin <= 0.0 || next.view.zoomMax < next.view.zoomMin) {
    std::fprintf(stderr, "[EngineConfig] invalid zoom bounds %g..%g\n",
                 next.view.zoomMin, next.view.zoomMax);
    return false;
  }

  cfg = next;
  return true;
}

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value view(rapidjson::kObjectType);
  view.AddMember("zoomMin", cfg.view.zoomMin, alloc);
  view.AddMember("zoomMax", cfg.view.zoomMax, alloc);
  view.AddMember("wheelZoomIn", cfg.view.wheelZoomIn, alloc);
  view.AddMember("wheelZoomOut", cfg.view.wheelZoomOut, alloc);
  view.AddMember("stepZoom", cfg.view.stepZoom, alloc);
  view.AddMember("fitScale", cfg.view.fitScale, alloc);
  view.AddMember("fitMinOffset", cfg.view.fitMinOffset, alloc);
  doc.AddMember("view", view, alloc);

  rapidjson::Value hit(rapidjson::kObjectType);
  hit.AddMember("hitThresholdPx", cfg.hit.hitThresholdPx, alloc);
  hit.AddMember("handleSizePx", cfg.hit.handleSizePx, alloc);
  hit.AddMember("markerRadius", cfg.hit.markerRadius, alloc);
  doc.AddMember("hit", hit, alloc);

  rapidjson::Value gesture(rapidjson::kObjectType);
  gesture.AddMember("resizeDamping", cfg.gesture.resizeDamping, alloc);
  gesture.AddMember("textMinWidth", cfg.gesture.textMinWidth, alloc);
  gesture.AddMember("textMinHeight", cfg.gesture.textMinHeight, alloc);
  gesture.AddMember("textEntryMinWidth", cfg.gesture.textEntryMinWidth, alloc);
  gesture.AddMember("textEntryMinHeight", cfg.gesture.textEntryMinHeight, alloc);
  gesture.AddMember("minDrawExtent", cfg.gesture.minDrawExtent, alloc);
  doc.AddMember("gesture", gesture, alloc);

  rapidjson::Value palette(rapidjson::kObjectType);
  auto addColor = [&](const char* key, const std::string& value) {
    palette.AddMember(rapidjson::Value(key, alloc),
                      rapidjson::Value(value.c_str(), alloc), alloc);
  };
  addColor("marker", cfg.palette.marker);
  addColor("box", cfg.palette.box);
  addColor("circle", cfg.palette.circle);
  addColor("ellipse", cfg.palette.ellipse);
  addColor("line", cfg.palette.line);
  addColor("freehand", cfg.palette.freehand);
  addColor("ruler", cfg.palette.ruler);
  addColor("angle", cfg.palette.angle);
  addColor("text", cfg.palette.text);
  addColor("tool", cfg.palette.tool);
  addColor("selection", cfg.palette.selection);
  addColor("selectionFill", cfg.palette.selectionFill);
  addColor("handle", cfg.palette.handle);
  addColor("handleStroke", cfg.palette.handleStroke);
  doc.AddMember("palette", palette, alloc);

  rapidjson::Value debug(rapidjson::kObjectType);
  debug.AddMember("traceGestures", cfg.debug.traceGestures, alloc);
  doc.AddMember("debug", debug, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace xa
