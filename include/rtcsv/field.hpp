#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rtcsv/diagnostics.hpp"
#include "rtcsv/locale.hpp"
#include "rtcsv/typed_value.hpp"

namespace rtcsv {

struct FieldOptions {
  Country country     = Country::Germany;
  bool infer_types    = true;      // false for header cells
  DiagnosticSink* diag = nullptr;  // construction-time findings
};

// One delimited cell. Parsed from a raw slice it rebuilds that slice
// byte-for-byte; after a mutation the text is rebuilt from the typed value,
// quoting level, whitespace metadata and the kept format template.
class Field {
public:
  static constexpr std::string_view kDefaultEnclosure = "\"";

  Field() = default;
  explicit Field(std::string_view raw,
                 std::string_view enclosure = kDefaultEnclosure,
                 const FieldOptions& opts = {});

  // Built in code: no raw text, no inference.
  static Field from_value(TypedValue value, bool quoted = false,
                          std::string_view enclosure = kDefaultEnclosure,
                          Country country = Country::Germany);

  bool is_quoted() const noexcept { return quoted_; }
  bool is_empty() const;
  bool is_null() const;
  bool is_blank() const;
  bool is_int() const noexcept    { return kind_of(typed_) == ValueKind::Integer; }
  bool is_float() const noexcept  { return is_int() || kind_of(typed_) == ValueKind::Float; }
  bool is_bool() const noexcept   { return kind_of(typed_) == ValueKind::Boolean; }
  bool is_string() const noexcept { return kind_of(typed_) == ValueKind::Text; }
  bool is_date_time(std::optional<std::string_view> pattern = std::nullopt) const;

  std::string value() const;
  const TypedValue& typed_value() const noexcept { return typed_; }
  const std::optional<std::string>& raw() const noexcept { return raw_; }
  const std::optional<FormatTemplate>& original_format() const noexcept { return format_; }

  int enclosure_repeat() const noexcept { return repeat_; }
  const std::string& enclosure() const noexcept { return enclosure_; }
  const std::string& leading_whitespace() const noexcept { return leading_ws_; }
  const std::string& trailing_whitespace() const noexcept { return trailing_ws_; }
  int inner_padding() const noexcept { return inner_padding_; }
  Country country() const noexcept { return country_; }

  // In place.
  void set_value(std::string_view text, DiagnosticSink* diag = nullptr);
  void set_enclosure_repeat(int repeat);

  // Copies; the receiver is left untouched.
  Field with_value(std::string_view text, DiagnosticSink* diag = nullptr) const;
  Field with_typed_value(TypedValue value) const;
  Field with_quoted(bool quoted, DiagnosticSink* diag = nullptr) const;
  Field with_enclosure_repeat(int repeat) const;

  // `enclosure` overrides the one the field was parsed with.
  std::string to_string(std::optional<std::string_view> enclosure = std::nullopt,
                        bool trim = false,
                        DiagnosticSink* diag = nullptr) const;

private:
  void analyze(std::string_view raw, DiagnosticSink* diag);
  void assign_unquoted(std::string_view text, DiagnosticSink* diag);

  std::optional<std::string> raw_;
  bool quoted_ = false;
  int repeat_ = 0;
  std::string enclosure_{kDefaultEnclosure};
  TypedValue typed_;
  std::optional<FormatTemplate> format_;
  std::string leading_ws_;
  std::string trailing_ws_;
  int inner_padding_ = 0;
  Country country_ = Country::Germany;
  bool infer_types_ = true;
};

}
