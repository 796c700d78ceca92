#include "rtcsv/locale.hpp"
#include <cctype>

namespace rtcsv {

namespace {

struct CountryRow {
  Country country;
  std::string_view code;
  NumberStyle style;
  DateOrder order;
};

constexpr CountryRow kCountries[] = {
  {Country::Germany,       "DE", {',', '.'},  DateOrder::DayMonthYear},
  {Country::Austria,       "AT", {',', '.'},  DateOrder::DayMonthYear},
  {Country::Switzerland,   "CH", {'.', '\''}, DateOrder::DayMonthYear},
  {Country::France,        "FR", {',', ' '},  DateOrder::DayMonthYear},
  {Country::Italy,         "IT", {',', '.'},  DateOrder::DayMonthYear},
  {Country::Spain,         "ES", {',', '.'},  DateOrder::DayMonthYear},
  {Country::Netherlands,   "NL", {',', '.'},  DateOrder::DayMonthYear},
  {Country::UnitedStates,  "US", {'.', ','},  DateOrder::MonthDayYear},
  {Country::UnitedKingdom, "GB", {'.', ','},  DateOrder::DayMonthYear},
  {Country::Canada,        "CA", {'.', ','},  DateOrder::MonthDayYear},
  {Country::Japan,         "JP", {'.', ','},  DateOrder::YearMonthDay},
  {Country::China,         "CN", {'.', ','},  DateOrder::YearMonthDay},
};

const CountryRow& row_for(Country c) {
  for (const auto& r : kCountries) if (r.country == c) return r;
  return kCountries[0];
}

}

NumberStyle number_style(Country c) { return row_for(c).style; }

NumberStyle alternate_number_style(Country c) {
  NumberStyle s = number_style(c);
  if (s.decimal == ',') return NumberStyle{'.', ','};
  return NumberStyle{',', '.'};
}

DateOrder date_order(Country c) { return row_for(c).order; }

std::optional<Country> country_from_code(std::string_view code) {
  if (code.size() != 2) return std::nullopt;
  const char a = (char)std::toupper((unsigned char)code[0]);
  const char b = (char)std::toupper((unsigned char)code[1]);
  if (a == 'U' && b == 'K') return Country::UnitedKingdom;
  for (const auto& r : kCountries) {
    if (r.code[0] == a && r.code[1] == b) return r.country;
  }
  return std::nullopt;
}

std::string_view country_code(Country c) { return row_for(c).code; }

}
