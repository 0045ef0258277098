#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/role.hpp"

namespace collab::model {

/*
  Collaboration type of one pair on one work.

  Numeric order is precedence: when a pair qualifies under several types on
  the same work the lowest value wins.
*/
enum class CollaborationType : std::uint8_t {
  kUnspecified       = 0,
  kPerformerDirector = 1,
  kDirectorDirector  = 2,
  kPerformerPerformer = 3,
  kDirectorCrew      = 4,
  kCrewCrew          = 5,
};

inline constexpr int kCollaborationTypeCount = 5;

constexpr std::string_view ToString(CollaborationType type) {
  switch (type) {
    case CollaborationType::kPerformerDirector:
      return "performer-director";
    case CollaborationType::kDirectorDirector:
      return "director-director";
    case CollaborationType::kPerformerPerformer:
      return "performer-performer";
    case CollaborationType::kDirectorCrew:
      return "director-crew";
    case CollaborationType::kCrewCrew:
      return "crew-crew";
    case CollaborationType::kUnspecified:
    default:
      return "unspecified";
  }
}

std::optional<CollaborationType> CollaborationTypeFromString(std::string_view value);

constexpr bool TakesPrecedence(CollaborationType candidate, CollaborationType current) {
  return current == CollaborationType::kUnspecified ||
         static_cast<std::uint8_t>(candidate) < static_cast<std::uint8_t>(current);
}

// Bit set of collaboration types; bit (type - 1).
class TypeSet {
 public:
  TypeSet() = default;
  explicit TypeSet(std::uint32_t bits) : bits_(bits) {
  }

  void Add(CollaborationType type) {
    if (type != CollaborationType::kUnspecified) {
      bits_ |= 1u << (static_cast<std::uint8_t>(type) - 1);
    }
  }

  bool Contains(CollaborationType type) const {
    return type != CollaborationType::kUnspecified && (bits_ & (1u << (static_cast<std::uint8_t>(type) - 1))) != 0;
  }

  int Size() const {
    return __builtin_popcount(bits_);
  }

  bool Empty() const {
    return bits_ == 0;
  }

  std::uint32_t Bits() const {
    return bits_;
  }

  std::vector<CollaborationType> Types() const;
  std::string                    ToString() const;

  friend bool operator==(const TypeSet&, const TypeSet&) = default;

 private:
  std::uint32_t bits_ = 0;
};

} // namespace collab::model
