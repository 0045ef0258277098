#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace collab::model {

using PersonId = std::int64_t;
using WorkId   = std::int64_t;

/*
  Unordered pair of people, always stored with the lower id first.

  Canonical() is the only way to build one from two arbitrary ids; it
  rejects self pairs so no caller can persist a 0-length edge.
*/
struct PersonPair {
  PersonId low  = 0;
  PersonId high = 0;

  static PersonPair Canonical(PersonId a, PersonId b) {
    if (a == b) {
      throw std::invalid_argument("person pair requires two distinct people: " + std::to_string(a));
    }
    return a < b ? PersonPair{a, b} : PersonPair{b, a};
  }

  bool IsCanonical() const {
    return low < high;
  }

  bool Contains(PersonId id) const {
    return id == low || id == high;
  }

  PersonId Other(PersonId id) const {
    return id == low ? high : low;
  }

  friend bool operator==(const PersonPair&, const PersonPair&) = default;

  friend bool operator<(const PersonPair& a, const PersonPair& b) {
    return a.low != b.low ? a.low < b.low : a.high < b.high;
  }
};

struct PersonPairHash {
  std::size_t operator()(const PersonPair& pair) const noexcept {
    const auto h1 = std::hash<PersonId>{}(pair.low);
    const auto h2 = std::hash<PersonId>{}(pair.high);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

} // namespace collab::model
