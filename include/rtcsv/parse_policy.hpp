#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rtcsv/diagnostics.hpp"
#include "rtcsv/locale.hpp"
#include "rtcsv/typed_value.hpp"

namespace rtcsv {

struct DatePolicy;
struct BoolPolicy;

// Typed-value inference for unquoted cells. Every accepted value reproduces
// its source text exactly through format_value(); anything else stays text.
struct ParsePolicy {
  Country country = Country::Germany;
  const DatePolicy* date_policy = nullptr; // nullptr -> default_date_policy()
  const BoolPolicy* bool_policy = nullptr; // nullptr -> default_bool_policy()

  // Canonical integers only: "-?(0|[1-9][0-9]*)" within int64.
  std::optional<std::int64_t> parse_int(std::string_view s) const;

  // Locale number (fast_float in .cpp); needs a decimal or grouping separator.
  std::optional<std::pair<double, NumberFormat>> parse_number(std::string_view s) const;

  // Locale date patterns plus 10-digit Unix timestamps.
  std::optional<std::pair<DateTime, std::string>> parse_date(std::string_view s) const;

  std::optional<bool> parse_bool(std::string_view s) const;

  // "", "null", "NULL", "NaN", "NA".
  bool is_null_token(std::string_view s) const;

  // Full inference chain; `s` is already trimmed.
  Inference infer(std::string_view s, DiagnosticSink* diag = nullptr) const;

  const DatePolicy& dates() const;
  const BoolPolicy& bools() const;
};

struct DatePolicy {
  bool detect_epoch_seconds = true;
  // Both bounds exclusive.
  std::int64_t epoch_min = 946684800;   // 2000-01-01
  std::int64_t epoch_max = 2147483647;  // 2038-01-19
};

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true", "yes", "on"};
  std::vector<std::string> false_tokens = {"false", "no", "off"};
  bool case_sensitive = false;
};

const DatePolicy& default_date_policy();
const BoolPolicy& default_bool_policy();

// Shortest round-trip fixed notation with the country's decimal separator.
std::string format_number_canonical(double v, Country c);
std::string format_number(double v, const NumberFormat& fmt);

// Text for a typed value. A template is applied only when its kind matches.
std::string format_value(const TypedValue& v, const std::optional<FormatTemplate>& fmt, Country c);

// "'0123'" style forced-text marks, stripped only around digit-like content.
std::string_view strip_excel_text_prefix(std::string_view s, bool* had_prefix = nullptr, bool* had_suffix = nullptr);

// "3,21001E+13": a number a spreadsheet mangled into exponent notation.
bool has_excel_exponential_notation(std::string_view s);

}
