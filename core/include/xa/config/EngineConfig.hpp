#pragma once
#include "xa/debug/Stats.hpp"
#include "xa/hit/HitTester.hpp"
#include "xa/style/Palette.hpp"
#include "xa/view/ZoomController.hpp"
#include <string>

namespace xa {

struct GestureConfig {
  double resizeDamping{0.7};
  double textMinWidth{20.0};        // placement below this is discarded
  double textMinHeight{15.0};
  double textEntryMinWidth{100.0};  // inline entry region is at least this big
  double textEntryMinHeight{30.0};
  double minDrawExtent{0.0};        // box/ellipse/circle/line extent must exceed this
};

struct EngineConfig {
  ViewConfig view;
  HitConfig hit;
  GestureConfig gesture;
  Palette palette;
  DebugToggles debug;
};

// Missing keys keep their current values. Returns false (and leaves cfg
// untouched) if the document is malformed.
bool loadEngineConfig(const std::string& json, EngineConfig& cfg);

std::string serializeEngineConfig(const EngineConfig& cfg);

} // namespace xa
