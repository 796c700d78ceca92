#include "rtcsv/field.hpp"
#include "rtcsv/field_factory.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct QuoteCase {
  std::string raw;
  std::string value;
  int repeat;
};

int main() {
  using rtcsv::Field;
  const std::string_view q = "\"";

  // Raw text comes back untouched; forcing the enclosure rebuilds from state.
  const std::vector<QuoteCase> cases = {
    {"\"\"", "", 1},
    {"\"\"\"\"", "", 2},
    {"\"\"\"\"\"\"", "", 3},
    {"\"\"ABC\"\"", "ABC", 2},
    {"\"\"\"ABC\"\"\"", "ABC", 3},
    {"\"\"\"\"A\"\"\"\"", "A", 4},
    {"\"\"A \"B\" C\"\"", "A \"B\" C", 2},
    {"\"\"A \"\"B\"\" C\"\"", "A \"\"B\"\" C", 2},
    {"\"\"\"\"quoted\"\"\"", "\"quoted", 3},
    {"\"\"\"quoted\"\"\"\"", "quoted\"", 3},
    {"\"a,b\"", "a,b", 1},
  };
  for (const auto& c : cases) {
    Field f(c.raw);
    expect(f.is_quoted(), c.raw + ": quoted");
    expect(f.value() == c.value, c.raw + ": value '" + f.value() + "'");
    expect(f.enclosure_repeat() == c.repeat, c.raw + ": repeat " + std::to_string(f.enclosure_repeat()));
    expect(f.to_string() == c.raw, c.raw + ": raw round trip");
    expect(f.to_string(q) == c.raw, c.raw + ": rebuilt '" + f.to_string(q) + "'");
  }

  Field open("\"ABC");
  expect(!open.is_quoted() && open.is_string() && open.value() == "\"ABC", "unbalanced run is unquoted text");

  Field padded("\"  \"");
  expect(padded.is_quoted() && padded.is_empty() && padded.inner_padding() == 2 && padded.to_string(q) == "\"  \"",
         "quoted spaces rebuilt");

  // padded empty with repeat > 1 keeps only one level
  Field lossy("\"\"  \"\"");
  expect(lossy.to_string() == "\"\"  \"\"" && lossy.to_string(q) == "\"  \"", "padded double quotes collapse");

  Field num(" 42 ");
  expect(num.is_int() && num.is_float() && num.value() == "42", "trimmed int");
  expect(num.leading_whitespace() == " " && num.trailing_whitespace() == " ", "whitespace kept");
  expect(num.to_string(q) == " 42 " && num.to_string(std::nullopt, true) == "42", "whitespace rebuilt or trimmed");

  Field blank("   ");
  expect(blank.is_string() && blank.is_empty() && blank.is_blank() && blank.is_null(), "whitespace-only field");
  expect(blank.leading_whitespace() == "   " && blank.to_string(q) == "   ", "whitespace-only rebuilt");

  expect(Field("NULL").is_null() && !Field("\"NULL\"").is_null(), "null only when unquoted");
  expect(Field("26-12-2025").is_date_time(), "date inferred");
  Field slashed("\"2025/12/26\"");
  expect(!slashed.is_date_time() && slashed.is_date_time(std::string_view("%Y/%m/%d")), "date by explicit pattern");

  // in place vs copy
  Field n2(" 42 ");
  n2.set_value("43");
  expect(!n2.raw() && n2.is_int() && n2.to_string() == " 43 ", "set_value keeps whitespace");

  Field quoted("\"abc\"");
  Field changed = quoted.with_value("x y");
  expect(changed.to_string() == "\"x y\"" && !changed.raw(), "with_value rebuilds");
  expect(quoted.to_string() == "\"abc\"" && quoted.raw(), "with_value leaves receiver alone");

  // copy chain keeps the number template through quoting changes
  Field amount("1.234,56");
  Field b = amount.with_typed_value(99.5);
  expect(b.value() == "99,50", "typed value uses captured template: " + b.value());
  Field c = b.with_quoted(true);
  expect(c.is_quoted() && c.is_string() && c.to_string() == "\"99,50\"", "to quoted");
  Field d = c.with_quoted(false);
  expect(d.is_float() && !d.is_quoted() && d.to_string() == "99,50", "back to unquoted re-infers");
  expect(amount.to_string() == "1.234,56", "chain origin untouched");

  expect(Field("YES").with_typed_value(false).value() == "NO", "bool spelling reused");
  expect(Field("22.12.2025").with_typed_value(rtcsv::DateTime{2026, 1, 2, 0, 0, 0}).value() == "02.01.2026",
         "date pattern reused");
  expect(Field("22.12.2025").with_typed_value(std::int64_t(5)).value() == "5", "template dropped on kind change");

  Field deeper = Field("\"x\"").with_enclosure_repeat(3);
  expect(deeper.to_string() == "\"\"\"x\"\"\"", "repeat raised");
  Field clamped("\"x\"");
  clamped.set_enclosure_repeat(-2);
  expect(clamped.enclosure_repeat() == 0 && clamped.to_string() == "\"x\"", "negative repeat clamps to 0");

  expect(Field::from_value(std::int64_t(7)).to_string() == "7", "from_value int");
  expect(Field::from_value(std::string("x"), true).to_string() == "\"x\"", "from_value quoted");
  expect(Field::from_value(2.5, false, q, rtcsv::Country::UnitedStates).to_string() == "2.5", "from_value float US");

  // enclosure override
  expect(Field("\"x\"").to_string(std::string_view("'")) == "'x'", "enclosure override");

  // header cells stay literal
  rtcsv::FieldOptions header_opts;
  header_opts.infer_types = false;
  expect(Field("42", q, header_opts).is_string(), "header option disables inference");
  rtcsv::HeaderFieldFactory names;
  rtcsv::DataFieldFactory data;
  expect(names.create_field("2024", q).is_string() && data.create_field("2024", q).is_int(), "factories");
  auto made = rtcsv::make_field_factory(rtcsv::LineFormat::Header);
  expect(made && made->create_field("1,5", q).is_string(), "make_field_factory");

  // diagnostics
  rtcsv::DiagnosticLog log;
  Field inner("\"\"A \"B\" C\"\"");
  (void)inner.to_string(q, false, &log);
  expect(log.count("enclosure-in-value") == 1, "enclosure-in-value warning");
  rtcsv::FieldOptions diag_opts;
  diag_opts.diag = &log;
  Field forced("'123", q, diag_opts);
  expect(forced.is_float() && forced.to_string(q) == "'123" && log.count("excel-text-prefix") == 1,
         "construction diagnostics");

  if (failures) return 1;
  std::cout << "[PASS] field\n";
  return 0;
}
