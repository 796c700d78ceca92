#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rtcsv {

enum class TruncationStrategy {
  None,      // never shorten
  Truncate,  // cut at the width
  Ellipsis,  // cut and end with "..." (plain cut when width <= 3)
};

std::string_view to_string(TruncationStrategy s);
std::optional<TruncationStrategy> truncation_from_name(std::string_view name);

// Maximum widths in characters (UTF-8 code points) per column. A column is
// looked up by name first, then by index, then falls back to the default.
// Widths below 1 throw std::invalid_argument.
class ColumnWidthConfig {
public:
  explicit ColumnWidthConfig(std::optional<int> default_width = std::nullopt);

  ColumnWidthConfig& set_width(const std::string& column, int width);
  ColumnWidthConfig& set_width(std::size_t index, int width);
  ColumnWidthConfig& set_default_width(std::optional<int> width);
  ColumnWidthConfig& set_strategy(TruncationStrategy s) { strategy_ = s; return *this; }

  std::optional<int> default_width() const noexcept { return default_; }
  TruncationStrategy strategy() const noexcept { return strategy_; }

  std::optional<int> width_for(std::string_view column, std::size_t index) const;
  bool has_width(std::string_view column, std::size_t index) const { return width_for(column, index).has_value(); }

  // `value` shortened to the column's width, or unchanged.
  std::string truncate(std::string_view value, std::string_view column, std::size_t index) const;

private:
  std::map<std::string, int, std::less<>> by_name_;
  std::map<std::size_t, int> by_index_;
  std::optional<int> default_;
  TruncationStrategy strategy_ = TruncationStrategy::Truncate;
};

// Code points in `s`; bytes that do not start a sequence are not counted.
std::size_t utf8_length(std::string_view s);
// Leading `n` code points of `s`.
std::string_view utf8_prefix(std::string_view s, std::size_t n);

}
