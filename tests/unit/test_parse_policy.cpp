#include "rtcsv/parse_policy.hpp"
#include <cmath>
#include <iostream>
#include <string>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool is_kind(const rtcsv::Inference& inf, rtcsv::ValueKind k) { return rtcsv::kind_of(inf.value) == k; }

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

// Every inference must print back to the text it came from.
static bool reproduces(const rtcsv::ParsePolicy& p, const std::string& s) {
  const rtcsv::Inference inf = p.infer(s);
  return rtcsv::format_value(inf.value, inf.format, p.country) == s;
}

int main() {
  using rtcsv::Country;
  using rtcsv::ValueKind;

  rtcsv::ParsePolicy de;  // Germany
  rtcsv::ParsePolicy us; us.country = Country::UnitedStates;
  rtcsv::ParsePolicy ch; ch.country = Country::Switzerland;
  rtcsv::ParsePolicy fr; fr.country = Country::France;

  // integers
  auto i = de.infer("42");
  expect(is_kind(i, ValueKind::Integer) && std::get<std::int64_t>(i.value) == 42 && !i.format, "int");
  expect(is_kind(de.infer("-17"), ValueKind::Integer), "negative int");
  expect(is_kind(de.infer("007"), ValueKind::Text), "leading zeros stay text");
  expect(is_kind(de.infer("-0"), ValueKind::Text), "-0 stays text");
  expect(is_kind(de.infer("99999999999999999999"), ValueKind::Text), "int64 overflow stays text");
  expect(is_kind(de.infer("1234567890123"), ValueKind::Integer), "13 digits is not a timestamp");
  expect(is_kind(de.infer("9999999999"), ValueKind::Integer), "10 digits out of epoch range");

  // locale numbers
  auto n = de.infer("1.234,56");
  expect(is_kind(n, ValueKind::Float) && near(std::get<double>(n.value), 1234.56), "DE grouped decimal");
  expect(n.format && std::get<rtcsv::NumberFormat>(*n.format) == (rtcsv::NumberFormat{',', '.', 2, false, false}),
         "DE grouped template");
  auto canon = de.infer("12,5");
  expect(is_kind(canon, ValueKind::Float) && !canon.format, "canonical DE decimal needs no template");
  auto dot = de.infer("12.5");
  expect(is_kind(dot, ValueKind::Float) && dot.format &&
         std::get<rtcsv::NumberFormat>(*dot.format) == (rtcsv::NumberFormat{'.', '\0', 1, false, false}),
         "alternate decimal in DE");
  expect(is_kind(de.infer("1.000"), ValueKind::Float) && reproduces(de, "1.000"), "DE thousands group");
  expect(is_kind(us.infer("1,234.56"), ValueKind::Float) && reproduces(us, "1,234.56"), "US grouped decimal");
  expect(!us.infer("3.14").format, "canonical US decimal");
  expect(is_kind(ch.infer("1'234.50"), ValueKind::Float) && reproduces(ch, "1'234.50"), "Swiss apostrophe group");
  expect(is_kind(fr.infer("1 234,5"), ValueKind::Float) && reproduces(fr, "1 234,5"), "French space group");
  expect(is_kind(de.infer("12.34.5"), ValueKind::Text), "bad grouping stays text");
  expect(is_kind(de.infer("0,50"), ValueKind::Float) && reproduces(de, "0,50"), "trailing zero kept");

  // booleans
  auto t = de.infer("true");
  expect(is_kind(t, ValueKind::Boolean) && std::get<bool>(t.value) && !t.format, "true");
  auto yes = de.infer("YES");
  expect(yes.format && std::get<rtcsv::BoolFormat>(*yes.format) == (rtcsv::BoolFormat{"YES", "NO"}), "YES spelling");
  auto off = de.infer("Off");
  expect(is_kind(off, ValueKind::Boolean) && !std::get<bool>(off.value) && off.format &&
         std::get<rtcsv::BoolFormat>(*off.format) == (rtcsv::BoolFormat{"On", "Off"}), "Off spelling");
  expect(is_kind(de.infer("oFF"), ValueKind::Text), "mixed case stays text");
  expect(is_kind(de.infer("1"), ValueKind::Integer), "1 is an int");

  // dates
  auto d = de.infer("22.12.2025");
  expect(is_kind(d, ValueKind::DateTime) && d.format &&
         std::get<rtcsv::DatePattern>(*d.format).pattern == "%d.%m.%Y", "DE date");
  expect(reproduces(de, "2025-12-22 15:30:00"), "ISO date-time");
  auto ep = de.infer("1735225800");
  expect(is_kind(ep, ValueKind::DateTime) && std::get<rtcsv::DatePattern>(*ep.format).pattern == "%s" &&
         reproduces(de, "1735225800"), "epoch seconds");
  expect(is_kind(de.infer("2147483647"), ValueKind::Integer), "upper epoch bound is exclusive");
  expect(is_kind(de.infer("2147483646"), ValueKind::DateTime), "just below the upper epoch bound");
  rtcsv::DatePolicy narrow; narrow.epoch_min = 1735225800;
  rtcsv::ParsePolicy from_min; from_min.date_policy = &narrow;
  expect(is_kind(from_min.infer("1735225800"), ValueKind::Integer) &&
         is_kind(from_min.infer("1735225801"), ValueKind::DateTime), "lower epoch bound is exclusive");

  // spreadsheet artifacts
  rtcsv::DiagnosticLog log;
  auto lead0 = de.infer("'0123", &log);
  expect(is_kind(lead0, ValueKind::Text) && log.size() == 0, "'0123 stays text");
  auto quoted_num = de.infer("'123", &log);
  expect(is_kind(quoted_num, ValueKind::Float) && reproduces(de, "'123") &&
         log.count("excel-text-prefix") == 1, "forced-text integer");
  expect(reproduces(de, "'1.234,50'"), "forced-text with suffix");
  auto mangled = de.infer("3,21001E+13", &log);
  expect(is_kind(mangled, ValueKind::Text) && log.count("excel-exponent") == 1, "exponent warning");
  expect(rtcsv::has_excel_exponential_notation("1.5e-3") && !rtcsv::has_excel_exponential_notation("1E5"),
         "exponent pattern");

  bool pre = false, suf = false;
  expect(rtcsv::strip_excel_text_prefix("'12,5'", &pre, &suf) == "12,5" && pre && suf, "strip prefix and suffix");
  expect(rtcsv::strip_excel_text_prefix("'abc", &pre, &suf) == "'abc" && !pre, "no strip around text");

  // null tokens and text
  expect(de.is_null_token("NULL") && de.is_null_token("NA") && de.is_null_token("") && !de.is_null_token("none"),
         "null tokens");
  expect(is_kind(de.infer("hello"), ValueKind::Text) && is_kind(de.infer(""), ValueKind::Text), "text");

  // formatting
  expect(rtcsv::format_number(-1234567.891, rtcsv::NumberFormat{',', '.', 3, false, false}) == "-1.234.567,891",
         "format grouped negative");
  expect(rtcsv::format_number_canonical(0.1, Country::Germany) == "0,1", "canonical DE");
  expect(rtcsv::format_number_canonical(2.5, Country::UnitedStates) == "2.5", "canonical US");
  expect(rtcsv::format_value(true, std::nullopt, Country::Germany) == "true", "format bool");
  expect(rtcsv::format_value(std::int64_t(-3), rtcsv::FormatTemplate{rtcsv::DatePattern{"%d"}}, Country::Germany) == "-3",
         "template of another kind ignored");

  // custom policies
  rtcsv::BoolPolicy ja_nein;
  ja_nein.true_tokens = {"ja"};
  ja_nein.false_tokens = {"nein"};
  rtcsv::ParsePolicy custom; custom.bool_policy = &ja_nein;
  auto ja = custom.infer("Ja");
  expect(is_kind(ja, ValueKind::Boolean) && std::get<rtcsv::BoolFormat>(*ja.format) == (rtcsv::BoolFormat{"Ja", "Nein"}),
         "custom bool tokens");
  rtcsv::DatePolicy no_epoch; no_epoch.detect_epoch_seconds = false;
  rtcsv::ParsePolicy plain; plain.date_policy = &no_epoch;
  expect(is_kind(plain.infer("1735225800"), ValueKind::Integer), "epoch detection off");

  if (failures) return 1;
  std::cout << "[PASS] parse policy\n";
  return 0;
}
