#include "xa/session/AnnotationRecord.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>

namespace xa {

std::string serializeAnnotationRecord(const AnnotationRecord& record) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(record.version.c_str(), alloc), alloc);
  doc.AddMember("patientId",
                rapidjson::Value(record.patientId.c_str(), alloc), alloc);
  doc.AddMember("imageName",
                rapidjson::Value(record.imageName.c_str(), alloc), alloc);

  rapidjson::Value image(rapidjson::kObjectType);
  image.AddMember("width", record.imageWidth, alloc);
  image.AddMember("height", record.imageHeight, alloc);
  doc.AddMember("image", image, alloc);

  rapidjson::Value view(rapidjson::kObjectType);
  view.AddMember("zoom", record.view.zoom(), alloc);
  view.AddMember("panX", record.view.pan().x, alloc);
  view.AddMember("panY", record.view.pan().y, alloc);
  doc.AddMember("view", view, alloc);

  // Annotations: embedded as a nested object, not a string.
  if (!record.annotationsJSON.empty()) {
    rapidjson::Document annDoc;
    annDoc.Parse(record.annotationsJSON.c_str());
    if (!annDoc.HasParseError()) {
      rapidjson::Value annCopy(annDoc, alloc);
      doc.AddMember("annotations", annCopy, alloc);
    } else {
      std::fprintf(stderr, "[AnnotationRecord] dropping unparsable annotations for %s/%s\n",
                   record.patientId.c_str(), record.imageName.c_str());
    }
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeAnnotationRecord(const std::string& json, AnnotationRecord& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "[AnnotationRecord] parse error\n");
    return false;
  }

  if (!doc.HasMember("patientId") || !doc["patientId"].IsString() ||
      !doc.HasMember("imageName") || !doc["imageName"].IsString()) {
    std::fprintf(stderr, "[AnnotationRecord] missing patientId or imageName\n");
    return false;
  }

  AnnotationRecord rec = out;
  rec.patientId = doc["patientId"].GetString();
  rec.imageName = doc["imageName"].GetString();

  if (doc.HasMember("version") && doc["version"].IsString())
    rec.version = doc["version"].GetString();

  if (doc.HasMember("image") && doc["image"].IsObject()) {
    const auto& img = doc["image"];
    if (img.HasMember("width") && img["width"].IsNumber())
      rec.imageWidth = img["width"].GetDouble();
    if (img.HasMember("height") && img["height"].IsNumber())
      rec.imageHeight = img["height"].GetDouble();
  }

  if (doc.HasMember("view") && doc["view"].IsObject()) {
    const auto& v = doc["view"];
    Point pan = rec.view.pan();
    if (v.HasMember("zoom") && v["zoom"].IsNumber()) {
      double z = v["zoom"].GetDouble();
      if (!(z > 0.0)) {
        std::fprintf(stderr, "[AnnotationRecord] non-positive zoom\n");
        return false;
      }
      rec.view.setZoom(z);
    }
    if (v.HasMember("panX") && v["panX"].IsNumber()) pan.x = v["panX"].GetDouble();
    if (v.HasMember("panY") && v["panY"].IsNumber()) pan.y = v["panY"].GetDouble();
    rec.view.setPan(pan);
  }

  // Re-serialize the embedded object back to a JSON string.
  if (doc.HasMember("annotations") && doc["annotations"].IsObject()) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    doc["annotations"].Accept(writer);
    rec.annotationsJSON = sb.GetString();
  }

  out = std::move(rec);
  return true;
}

} // namespace xa
