#include "rtcsv/field.hpp"
#include "rtcsv/date_parse.hpp"
#include "rtcsv/parse_policy.hpp"
#include <algorithm>

namespace rtcsv {

namespace {

constexpr std::string_view kWhitespace(" \t\n\r\v\0", 6);

std::string_view trim(std::string_view s) {
  const auto b = s.find_first_not_of(kWhitespace);
  if (b == std::string_view::npos) return s.substr(s.size());
  const auto e = s.find_last_not_of(kWhitespace);
  return s.substr(b, e - b + 1);
}

std::size_t leading_run(std::string_view s, char q) {
  std::size_t n = 0;
  while (n < s.size() && s[n] == q) ++n;
  return n;
}

std::size_t trailing_run(std::string_view s, char q) {
  std::size_t n = 0;
  while (n < s.size() && s[s.size() - 1 - n] == q) ++n;
  return n;
}

bool template_matches(const FormatTemplate& f, ValueKind k) {
  switch (k) {
    case ValueKind::Float:    return std::holds_alternative<NumberFormat>(f);
    case ValueKind::DateTime: return std::holds_alternative<DatePattern>(f);
    case ValueKind::Boolean:  return std::holds_alternative<BoolFormat>(f);
    default:                  return false;
  }
}

}

Field::Field(std::string_view raw, std::string_view enclosure, const FieldOptions& opts)
  : raw_(std::string(raw)),
    enclosure_(enclosure),
    country_(opts.country),
    infer_types_(opts.infer_types) {
  analyze(raw, opts.diag);
}

Field Field::from_value(TypedValue value, bool quoted, std::string_view enclosure, Country country) {
  Field f;
  f.enclosure_ = std::string(enclosure);
  f.country_ = country;
  f.quoted_ = quoted;
  f.repeat_ = quoted ? 1 : 0;
  if (quoted) f.typed_ = format_value(value, std::nullopt, country);
  else        f.typed_ = std::move(value);
  return f;
}

void Field::analyze(std::string_view raw, DiagnosticSink* diag) {
  const std::string_view t = trim(raw);

  if (enclosure_.size() == 1 && !t.empty()) {
    const char q = enclosure_[0];
    const std::size_t lead = leading_run(t, q);

    if (lead == t.size()) {
      quoted_ = true;
      repeat_ = static_cast<int>(lead / 2);
      typed_ = std::string();
      return;
    }

    const std::size_t trail = trailing_run(t, q);
    if (lead > 0 && trail > 0) {
      const std::string_view inner = t.substr(lead, t.size() - lead - trail);
      quoted_ = true;
      if (trim(inner).empty() && lead == trail) {
        repeat_ = static_cast<int>(lead / 2);
        const bool spaces_only = inner.find_first_not_of(' ') == std::string_view::npos;
        inner_padding_ = spaces_only ? static_cast<int>(inner.size()) : 0;
        typed_ = std::string();
        return;
      }
      const std::size_t level = std::min(lead, trail);
      repeat_ = static_cast<int>(level);
      std::string value(lead - level, q);
      value.append(inner);
      value.append(trail - level, q);
      typed_ = std::move(value);
      return;
    }
  }

  if (t.empty()) {
    leading_ws_ = std::string(raw);
  } else {
    const std::size_t lead_len = static_cast<std::size_t>(t.data() - raw.data());
    leading_ws_ = std::string(raw.substr(0, lead_len));
    trailing_ws_ = std::string(raw.substr(lead_len + t.size()));
  }
  assign_unquoted(t, diag);
}

void Field::assign_unquoted(std::string_view text, DiagnosticSink* diag) {
  quoted_ = false;
  repeat_ = 0;
  format_.reset();
  if (!infer_types_) { typed_ = std::string(text); return; }

  ParsePolicy policy;
  policy.country = country_;
  Inference inf = policy.infer(text, diag);
  typed_ = std::move(inf.value);
  format_ = std::move(inf.format);
}

bool Field::is_empty() const {
  return is_string() && std::get<std::string>(typed_).empty();
}

bool Field::is_null() const {
  if (quoted_ || !is_string()) return false;
  return ParsePolicy{}.is_null_token(std::get<std::string>(typed_));
}

bool Field::is_blank() const {
  return is_string() && trim(std::get<std::string>(typed_)).empty();
}

bool Field::is_date_time(std::optional<std::string_view> pattern) const {
  if (kind_of(typed_) == ValueKind::DateTime) return true;
  if (!pattern || !is_string()) return false;
  return parse_with_pattern(std::get<std::string>(typed_), *pattern).has_value();
}

std::string Field::value() const {
  return format_value(typed_, format_, country_);
}

void Field::set_value(std::string_view text, DiagnosticSink* diag) {
  raw_.reset();
  format_.reset();
  if (quoted_) {
    typed_ = std::string(text);
    return;
  }
  assign_unquoted(trim(text), diag);
  if (is_string()) typed_ = std::string(text);
}

void Field::set_enclosure_repeat(int repeat) {
  repeat = std::max(0, repeat);
  if (repeat == repeat_) return;
  raw_.reset();
  repeat_ = repeat;
}

Field Field::with_value(std::string_view text, DiagnosticSink* diag) const {
  Field f(*this);
  f.set_value(text, diag);
  return f;
}

Field Field::with_typed_value(TypedValue value) const {
  Field f(*this);
  f.raw_.reset();
  if (f.format_ && !template_matches(*f.format_, kind_of(value))) f.format_.reset();
  if (f.quoted_) {
    f.typed_ = format_value(value, f.format_, f.country_);
    f.format_.reset();
  } else {
    f.typed_ = std::move(value);
  }
  return f;
}

Field Field::with_quoted(bool quoted, DiagnosticSink* diag) const {
  Field f(*this);
  if (quoted == quoted_) return f;
  const std::string text = value();
  f.raw_.reset();
  if (quoted) {
    f.quoted_ = true;
    f.repeat_ = std::max(1, repeat_);
    f.typed_ = text;
    f.format_.reset();
    f.leading_ws_.clear();
    f.trailing_ws_.clear();
  } else {
    f.inner_padding_ = 0;
    f.assign_unquoted(text, diag);
    if (f.is_string()) f.typed_ = text;
  }
  return f;
}

Field Field::with_enclosure_repeat(int repeat) const {
  Field f(*this);
  f.set_enclosure_repeat(repeat);
  return f;
}

std::string Field::to_string(std::optional<std::string_view> enclosure, bool trim_ws,
                             DiagnosticSink* diag) const {
  if (raw_ && !enclosure && !trim_ws) return *raw_;

  const std::string_view enc = enclosure ? *enclosure : std::string_view(enclosure_);
  std::string v = value();

  if (!quoted_) {
    if (trim_ws) return v;
    return leading_ws_ + v + trailing_ws_;
  }

  if (v.empty() && inner_padding_ > 0) {
    v.assign(static_cast<std::size_t>(inner_padding_), ' ');
  } else if (!enc.empty() && v.find(enc) != std::string::npos) {
    emit(diag, Severity::Warning, "enclosure-in-value",
         "quoted value '" + v + "' contains the enclosure unescaped");
  }

  std::string wrap;
  for (int i = 0; i < std::max(1, repeat_); ++i) wrap.append(enc);
  std::string out;
  out.reserve(wrap.size() * 2 + v.size());
  out.append(wrap).append(v).append(wrap);
  return out;
}

}
