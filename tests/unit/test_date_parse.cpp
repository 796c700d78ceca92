#include "rtcsv/date_parse.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  using rtcsv::Country;
  using rtcsv::DateTime;

  auto d = rtcsv::parse_with_pattern("22.12.2025", "%d.%m.%Y");
  expect(d && *d == (DateTime{2025, 12, 22, 0, 0, 0}), "dd.mm.yyyy");
  expect(!rtcsv::parse_with_pattern("1.2.2025", "%d.%m.%Y"), "widths are strict");
  expect(!rtcsv::parse_with_pattern("31.02.2024", "%d.%m.%Y"), "31 Feb rejected");
  expect(rtcsv::parse_with_pattern("29.02.2024", "%d.%m.%Y").has_value(), "leap day accepted");
  expect(!rtcsv::parse_with_pattern("29.02.2023", "%d.%m.%Y"), "non-leap 29 Feb rejected");
  expect(!rtcsv::parse_with_pattern("2025-12-22x", "%Y-%m-%d"), "trailing bytes rejected");

  auto yy = rtcsv::parse_with_pattern("05.01.25", "%d.%m.%y");
  expect(yy && yy->year == 2025, "two-digit year");
  expect(yy && rtcsv::format_with_pattern(*yy, "%d.%m.%y") == "05.01.25", "two-digit year formats back");

  expect(rtcsv::format_with_pattern(DateTime{2025, 1, 5, 7, 8, 9}, rtcsv::kCanonicalDatePattern) ==
         "2025-01-05 07:08:09", "canonical pattern");
  expect(rtcsv::format_with_pattern(DateTime{2025, 1, 5, 0, 0, 0}, "100%% on %d/%m") == "100% on 05/01",
         "literal percent");

  expect(rtcsv::to_epoch_seconds(DateTime{2000, 1, 1, 0, 0, 0}) == 946684800, "epoch of 2000-01-01");
  expect(rtcsv::from_epoch_seconds(1735225800) == (DateTime{2024, 12, 26, 15, 10, 0}), "from epoch");
  auto e = rtcsv::parse_with_pattern("1735225800", "%s");
  expect(e && rtcsv::format_with_pattern(*e, "%s") == "1735225800", "%s round trip");

  expect(rtcsv::days_in_month(2024, 2) == 29 && rtcsv::days_in_month(1900, 2) == 28 &&
         rtcsv::days_in_month(2000, 2) == 29 && rtcsv::days_in_month(2025, 13) == 0, "days_in_month");

  auto iso = rtcsv::detect_date("2025-12-22", Country::Germany);
  expect(iso && iso->second == "%Y-%m-%d", "ISO date detected");
  auto us_order = rtcsv::detect_date("12/22/2025", Country::Germany);
  expect(us_order && us_order->second == "%m/%d/%Y", "month-first fallback when day-first is impossible");

  auto us = rtcsv::detect_date("01/02/2025", Country::UnitedStates);
  expect(us && us->first.month == 1 && us->first.day == 2, "US reads month first");
  auto de = rtcsv::detect_date("01/02/2025", Country::Germany);
  expect(de && de->first.month == 2 && de->first.day == 1, "Germany reads day first");

  auto stamp = rtcsv::detect_date("22.12.2025 15:30", Country::Germany);
  expect(stamp && stamp->second == "%d.%m.%Y %H:%M" && stamp->first.minute == 30, "date with minutes");
  expect(!rtcsv::detect_date("2025", Country::Germany), "too short");
  expect(!rtcsv::detect_date("Dec 22 2025", Country::UnitedStates), "non-numeric lead");

  if (failures) return 1;
  std::cout << "[PASS] date parse\n";
  return 0;
}
