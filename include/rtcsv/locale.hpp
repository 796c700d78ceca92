#pragma once
#include <optional>
#include <string_view>

namespace rtcsv {

// Countries the inference layer knows conventions for.
enum class Country {
  Germany, Austria, Switzerland, France, Italy, Spain, Netherlands,
  UnitedStates, UnitedKingdom, Canada, Japan, China
};

enum class DateOrder { DayMonthYear, MonthDayYear, YearMonthDay };

struct NumberStyle {
  char decimal = '.';
  char group   = ',';
};

NumberStyle number_style(Country c);

// The convention tried when the locale's own does not match ("1.5" in DE).
NumberStyle alternate_number_style(Country c);

DateOrder date_order(Country c);

// ISO-3166 alpha-2 codes ("DE", "us"); case-insensitive.
std::optional<Country> country_from_code(std::string_view code);
std::string_view country_code(Country c);

}
