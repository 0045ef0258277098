#include "internal/db/sql/sql_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace collab::db::sql {

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) {
    list.add_values()->set_string_value(v);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode string list: " + std::string(status.message()));
  }
  return json;
}

std::vector<std::string> DecodeStringList(const std::string& text) {
  std::vector<std::string> out;
  // column default for rows written without tags
  if (text.empty()) return out;

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(text, &list);
  if (!status.ok()) {
    throw std::runtime_error("corrupt string list column: " + std::string(status.message()));
  }

  out.reserve(list.values_size());
  for (const auto& v : list.values()) {
    if (v.kind_case() != google::protobuf::Value::kStringValue) {
      throw std::runtime_error("corrupt string list column: non-string entry in " + text);
    }
    out.push_back(v.string_value());
  }
  return out;
}

std::string JoinInts(const std::vector<std::int64_t>& values) {
  std::string out;
  for (const auto v : values) {
    if (!out.empty()) out += ',';
    out += std::to_string(v);
  }
  return out;
}

std::vector<std::int64_t> SplitInts(const std::string& text) {
  std::vector<std::int64_t> out;
  if (text.empty()) return out;

  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find(',', start);
    if (end == std::string::npos) end = text.size();
    try {
      out.push_back(std::stoll(text.substr(start, end - start)));
    } catch (const std::exception&) {
      throw std::runtime_error("corrupt integer list column: " + text);
    }
    start = end + 1;
  }
  return out;
}

std::string InList(const std::vector<std::int64_t>& values, std::size_t begin, std::size_t end) {
  std::string out;
  for (std::size_t i = begin; i < end && i < values.size(); ++i) {
    if (i != begin) out += ',';
    out += std::to_string(values[i]);
  }
  return out;
}

} // namespace collab::db::sql
