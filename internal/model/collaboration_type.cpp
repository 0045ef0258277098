#include "internal/model/collaboration_type.hpp"

namespace collab::model {

std::optional<CollaborationType> CollaborationTypeFromString(std::string_view value) {
  for (int i = 1; i <= kCollaborationTypeCount; ++i) {
    const auto type = static_cast<CollaborationType>(i);
    if (ToString(type) == value) {
      return type;
    }
  }
  return std::nullopt;
}

std::vector<CollaborationType> TypeSet::Types() const {
  std::vector<CollaborationType> out;
  for (int i = 1; i <= kCollaborationTypeCount; ++i) {
    const auto type = static_cast<CollaborationType>(i);
    if (Contains(type)) {
      out.push_back(type);
    }
  }
  return out;
}

std::string TypeSet::ToString() const {
  std::string out;
  for (const auto type : Types()) {
    if (!out.empty()) {
      out += ',';
    }
    out += model::ToString(type);
  }
  return out;
}

} // namespace collab::model
