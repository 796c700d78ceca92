#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace rtcsv {

// Calendar date-time without zone; seconds resolution.
struct DateTime {
  int year   = 1970;
  int month  = 1;
  int day    = 1;
  int hour   = 0;
  int minute = 0;
  int second = 0;
};

bool operator==(const DateTime& a, const DateTime& b);
bool operator!=(const DateTime& a, const DateTime& b);

// Alternative order matters: a default TypedValue is empty text.
using TypedValue = std::variant<std::string, std::int64_t, double, bool, DateTime>;

enum class ValueKind { Text, Integer, Float, Boolean, DateTime };

inline ValueKind kind_of(const TypedValue& v) { return static_cast<ValueKind>(v.index()); }

// Reversible number layout, e.g. "1.234,50" -> {',', '.', 2}.
struct NumberFormat {
  char decimal     = '.';
  char group       = '\0';  // '\0': no grouping
  int  decimals    = 0;
  bool text_prefix = false; // spreadsheet "'" forced-text marks
  bool text_suffix = false;
};

// strftime-like pattern the value was matched with ("%d.%m.%Y").
struct DatePattern {
  std::string pattern;
};

// Spelling of the boolean pair the value came from ("YES"/"NO").
struct BoolFormat {
  std::string true_text;
  std::string false_text;
};

using FormatTemplate = std::variant<NumberFormat, DatePattern, BoolFormat>;

bool operator==(const NumberFormat& a, const NumberFormat& b);
bool operator==(const DatePattern& a, const DatePattern& b);
bool operator==(const BoolFormat& a, const BoolFormat& b);

struct Inference {
  TypedValue value;
  std::optional<FormatTemplate> format;
};

}
