#include "xa/annotation/AnnotationStore.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace xa {

Id AnnotationStore::add(Annotation a) {
  if (a.id == kInvalidId) {
    a.id = nextId_++;
  } else if (a.id >= nextId_) {
    nextId_ = a.id + 1;
  }
  annotations_.push_back(std::move(a));
  return annotations_.back().id;
}

bool AnnotationStore::remove(Id id) {
  auto it = std::remove_if(annotations_.begin(), annotations_.end(),
    [id](const Annotation& a) { return a.id == id; });
  if (it == annotations_.end()) return false;
  annotations_.erase(it, annotations_.end());
  return true;
}

void AnnotationStore::clear() {
  annotations_.clear();
}

void AnnotationStore::replaceAll(AnnotationList annotations) {
  annotations_ = std::move(annotations);
  bumpNextId();
}

const Annotation* AnnotationStore::get(Id id) const {
  for (const auto& a : annotations_) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

Annotation* AnnotationStore::getMutable(Id id) {
  for (auto& a : annotations_) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

bool AnnotationStore::setLabel(Id id, const std::string& label) {
  Annotation* a = getMutable(id);
  if (!a) return false;
  a->label = label;
  return true;
}

bool AnnotationStore::setLocked(Id id, bool locked) {
  Annotation* a = getMutable(id);
  if (!a) return false;
  a->locked = locked;
  return true;
}

bool AnnotationStore::toggleLock(Id id) {
  Annotation* a = getMutable(id);
  if (!a) return false;
  a->locked = !a->locked;
  return true;
}

std::size_t AnnotationStore::countOfType(AnnotationType t) const {
  return static_cast<std::size_t>(std::count_if(annotations_.begin(), annotations_.end(),
    [t](const Annotation& a) { return a.type == t; }));
}

std::string AnnotationStore::defaultLabel(AnnotationType t) const {
  return displayName(t) + " " + std::to_string(countOfType(t) + 1);
}

void AnnotationStore::bumpNextId() {
  for (const auto& a : annotations_) {
    if (a.id >= nextId_) nextId_ = a.id + 1;
  }
}

std::string AnnotationStore::toJSON() const {
  return annotationsToJSON(annotations_);
}

bool AnnotationStore::loadJSON(const std::string& json) {
  AnnotationList loaded;
  if (!annotationsFromJSON(json, loaded)) return false;
  replaceAll(std::move(loaded));
  return true;
}

// ---- DTO codec ----

std::string annotationsToJSON(const AnnotationList& list) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("annotations");
  w.StartArray();
  for (const auto& a : list) {
    std::string id = idToString(a.id);
    w.StartObject();
    w.Key("id");    w.String(id.c_str());
    w.Key("type");  w.String(typeName(a.type));
    w.Key("points");
    w.StartArray();
    for (const auto& p : a.points) {
      w.StartObject();
      w.Key("x"); w.Double(p.x);
      w.Key("y"); w.Double(p.y);
      w.EndObject();
    }
    w.EndArray();
    w.Key("color"); w.String(a.color.c_str());
    if (!a.text.empty()) {
      w.Key("text"); w.String(a.text.c_str());
    }
    if (!a.label.empty()) {
      w.Key("label"); w.String(a.label.c_str());
    }
    if (a.locked) {
      w.Key("locked"); w.Bool(true);
    }
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

namespace {

bool readAnnotation(const rapidjson::Value& v, Annotation& a) {
  if (!v.IsObject()) return false;

  if (!v.HasMember("id") || !v["id"].IsString()) return false;
  try {
    a.id = parseIdString(v["id"].GetString());
  } catch (const std::runtime_error&) {
    return false;
  }
  if (a.id == kInvalidId) return false;

  if (!v.HasMember("type") || !v["type"].IsString()) return false;
  if (!parseTypeName(v["type"].GetString(), a.type)) return false;
  if (!isShapeType(a.type)) return false;

  if (!v.HasMember("points") || !v["points"].IsArray()) return false;
  for (const auto& pv : v["points"].GetArray()) {
    if (!pv.IsObject()) return false;
    if (!pv.HasMember("x") || !pv["x"].IsNumber()) return false;
    if (!pv.HasMember("y") || !pv["y"].IsNumber()) return false;
    a.points.push_back({pv["x"].GetDouble(), pv["y"].GetDouble()});
  }
  std::size_t need = requiredPointCount(a.type);
  if (a.type == AnnotationType::Freehand ? a.points.size() < need : a.points.size() != need)
    return false;

  if (v.HasMember("color") && v["color"].IsString())
    a.color = v["color"].GetString();
  if (v.HasMember("text") && v["text"].IsString())
    a.text = v["text"].GetString();
  if (v.HasMember("label") && v["label"].IsString())
    a.label = v["label"].GetString();
  if (v.HasMember("locked") && v["locked"].IsBool())
    a.locked = v["locked"].GetBool();

  return true;
}

} // namespace

bool annotationsFromJSON(const std::string& json, AnnotationList& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "[AnnotationStore] malformed annotation JSON\n");
    return false;
  }
  if (!doc.HasMember("annotations") || !doc["annotations"].IsArray()) return false;

  const auto& arr = doc["annotations"].GetArray();
  AnnotationList loaded;
  loaded.reserve(arr.Size());

  for (const auto& v : arr) {
    Annotation a;
    if (!readAnnotation(v, a)) {
      std::fprintf(stderr, "[AnnotationStore] rejected annotation entry %u\n",
                   static_cast<unsigned>(loaded.size()));
      return false;
    }
    loaded.push_back(std::move(a));
  }

  out = std::move(loaded);
  return true;
}

} // namespace xa
