#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace collab::db::sql {

/*
  Text encodings for list columns shared by the SQL backends.

  Genre tags are free text and are stored as a JSON array so any tag,
  including one with a comma or an empty one, reads back unchanged.
  Integer lists (years, path ids) are stored comma separated.
*/

// ["Drama","Crime"]; throws std::runtime_error on a corrupt column
std::string EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& text);

std::string JoinInts(const std::vector<std::int64_t>& values);
std::vector<std::int64_t> SplitInts(const std::string& text);

// "1,2,3" list for an IN (...) clause built from trusted integers
std::string InList(const std::vector<std::int64_t>& values, std::size_t begin, std::size_t end);

} // namespace collab::db::sql
