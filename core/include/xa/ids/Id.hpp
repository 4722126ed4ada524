#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace xa {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Annotation ids travel as decimal strings in the DTO.
inline Id parseIdString(const std::string& s) {
  if (s.empty()) return kInvalidId;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::runtime_error("Id must be decimal digits");
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return static_cast<Id>(v);
}

inline std::string idToString(Id id) {
  return std::to_string(id);
}

} // namespace xa
