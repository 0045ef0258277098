#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace collab::model {

// Credit role kind as delivered by the upstream catalog.
enum class RoleKind : std::uint8_t {
  kUnspecified = 0,
  kPerformer   = 1,
  kDirector    = 2,
  kCrew        = 3,
};

constexpr std::string_view ToString(RoleKind kind) {
  switch (kind) {
    case RoleKind::kPerformer:
      return "performer";
    case RoleKind::kDirector:
      return "director";
    case RoleKind::kCrew:
      return "crew";
    case RoleKind::kUnspecified:
    default:
      return "unspecified";
  }
}

constexpr std::optional<RoleKind> RoleKindFromString(std::string_view value) {
  if (value == "performer") return RoleKind::kPerformer;
  if (value == "director") return RoleKind::kDirector;
  if (value == "crew") return RoleKind::kCrew;
  return std::nullopt;
}

} // namespace collab::model
