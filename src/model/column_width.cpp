#include "rtcsv/column_width.hpp"
#include <stdexcept>

namespace rtcsv {

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

static void check_width(int width) {
  if (width < 1) throw std::invalid_argument("column width must be at least 1");
}

std::string_view to_string(TruncationStrategy s) {
  switch (s) {
    case TruncationStrategy::None:     return "none";
    case TruncationStrategy::Truncate: return "truncate";
    case TruncationStrategy::Ellipsis: return "ellipsis";
  }
  return "truncate";
}

std::optional<TruncationStrategy> truncation_from_name(std::string_view name) {
  if (name == "none")     return TruncationStrategy::None;
  if (name == "truncate") return TruncationStrategy::Truncate;
  if (name == "ellipsis") return TruncationStrategy::Ellipsis;
  return std::nullopt;
}

std::size_t utf8_length(std::string_view s) {
  std::size_t n = 0;
  for (char c : s) if (!is_continuation(static_cast<unsigned char>(c))) ++n;
  return n;
}

std::string_view utf8_prefix(std::string_view s, std::size_t n) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
    if (seen == n) return s.substr(0, i);
    ++seen;
  }
  return s;
}

ColumnWidthConfig::ColumnWidthConfig(std::optional<int> default_width) {
  set_default_width(default_width);
}

ColumnWidthConfig& ColumnWidthConfig::set_width(const std::string& column, int width) {
  check_width(width);
  by_name_[column] = width;
  return *this;
}

ColumnWidthConfig& ColumnWidthConfig::set_width(std::size_t index, int width) {
  check_width(width);
  by_index_[index] = width;
  return *this;
}

ColumnWidthConfig& ColumnWidthConfig::set_default_width(std::optional<int> width) {
  if (width) check_width(*width);
  default_ = width;
  return *this;
}

std::optional<int> ColumnWidthConfig::width_for(std::string_view column, std::size_t index) const {
  if (!column.empty()) {
    auto it = by_name_.find(column);
    if (it != by_name_.end()) return it->second;
  }
  auto jt = by_index_.find(index);
  if (jt != by_index_.end()) return jt->second;
  return default_;
}

std::string ColumnWidthConfig::truncate(std::string_view value, std::string_view column, std::size_t index) const {
  const auto width = width_for(column, index);
  if (!width || strategy_ == TruncationStrategy::None) return std::string(value);
  const auto max = static_cast<std::size_t>(*width);
  if (utf8_length(value) <= max) return std::string(value);
  if (strategy_ == TruncationStrategy::Ellipsis && max > 3) {
    return std::string(utf8_prefix(value, max - 3)) + "...";
  }
  return std::string(utf8_prefix(value, max));
}

}
