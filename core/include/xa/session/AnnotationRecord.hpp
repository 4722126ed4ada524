#pragma once
#include "xa/view/ViewTransform.hpp"
#include <string>

namespace xa {

// Persisted per (patientId, imageName). The storage backend is external;
// this is the DTO it receives and returns.
struct AnnotationRecord {
  std::string version{"1.0"};
  std::string patientId;
  std::string imageName;
  double imageWidth{0};
  double imageHeight{0};
  ViewTransform view;
  std::string annotationsJSON;  // AnnotationStore::toJSON() output
};

std::string serializeAnnotationRecord(const AnnotationRecord& record);

// Returns false on malformed input. Missing optional fields keep the values
// already in out.
bool deserializeAnnotationRecord(const std::string& json, AnnotationRecord& out);

} // namespace xa
