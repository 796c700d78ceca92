#include "rtcsv/parse_policy.hpp"
#include "rtcsv/date_parse.hpp"
#include <algorithm>
#include <charconv>
#include <cctype>
#include <string_view>
#include <vector>
#include <fast_float/fast_float.h>

namespace rtcsv {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

bool operator==(const NumberFormat& a, const NumberFormat& b) {
  return a.decimal == b.decimal && a.group == b.group && a.decimals == b.decimals &&
         a.text_prefix == b.text_prefix && a.text_suffix == b.text_suffix;
}
bool operator==(const DatePattern& a, const DatePattern& b) { return a.pattern == b.pattern; }
bool operator==(const BoolFormat& a, const BoolFormat& b) {
  return a.true_text == b.true_text && a.false_text == b.false_text;
}

const DatePolicy& default_date_policy() { static const DatePolicy p; return p; }
const BoolPolicy& default_bool_policy() { static const BoolPolicy p; return p; }

const DatePolicy& ParsePolicy::dates() const { return date_policy ? *date_policy : default_date_policy(); }
const BoolPolicy& ParsePolicy::bools() const { return bool_policy ? *bool_policy : default_bool_policy(); }

std::optional<std::int64_t> ParsePolicy::parse_int(std::string_view s) const {
  const std::size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
  std::string_view digits = s.substr(i);
  if (!all_digits(digits)) return std::nullopt;
  if (digits[0] == '0' && (digits.size() > 1 || i == 1)) return std::nullopt; // "007", "-0"
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

// Integer part with optional grouping: first group 1-3 digits, then groups of 3.
static bool collect_integer_part(std::string_view s, char group, std::string& digits, bool& grouped) {
  grouped = group != '\0' && s.find(group) != std::string_view::npos;
  if (!grouped) {
    if (!all_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;
    digits.assign(s);
    return true;
  }
  std::size_t start = 0;
  bool first = true;
  while (true) {
    const std::size_t pos = s.find(group, start);
    std::string_view g = s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
    if (!all_digits(g)) return false;
    if (first) {
      if (g.size() > 3 || g[0] == '0') return false;
      first = false;
    } else if (g.size() != 3) {
      return false;
    }
    digits.append(g);
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return true;
}

static std::optional<std::pair<double, NumberFormat>> parse_with_style(std::string_view s, NumberStyle st) {
  std::string_view body = s;
  const bool neg = !body.empty() && body[0] == '-';
  if (neg) body.remove_prefix(1);
  if (body.empty()) return std::nullopt;

  const std::size_t dec_pos = body.find(st.decimal);
  if (dec_pos != std::string_view::npos && body.find(st.decimal, dec_pos + 1) != std::string_view::npos)
    return std::nullopt;
  std::string_view int_part = body.substr(0, dec_pos);
  std::string_view frac = dec_pos == std::string_view::npos ? std::string_view{} : body.substr(dec_pos + 1);
  if (dec_pos != std::string_view::npos && !all_digits(frac)) return std::nullopt;

  std::string normalized;
  if (neg) normalized += '-';
  std::string digits;
  bool grouped = false;
  if (!collect_integer_part(int_part, st.group, digits, grouped)) return std::nullopt;
  if (!grouped && dec_pos == std::string_view::npos) return std::nullopt; // bare digits are not a float
  normalized += digits;
  if (!frac.empty()) { normalized += '.'; normalized.append(frac); }

  double out;
  auto [ptr, ec] = fast_float::from_chars(normalized.data(), normalized.data() + normalized.size(), out);
  if (ec != std::errc() || ptr != normalized.data() + normalized.size()) return std::nullopt;

  NumberFormat fmt;
  fmt.decimal  = st.decimal;
  fmt.group    = grouped ? st.group : '\0';
  fmt.decimals = static_cast<int>(frac.size());
  return std::make_pair(out, fmt);
}

std::optional<std::pair<double, NumberFormat>> ParsePolicy::parse_number(std::string_view s) const {
  if (auto r = parse_with_style(s, number_style(country))) return r;
  return parse_with_style(s, alternate_number_style(country));
}

static std::optional<DateTime> parse_epoch(std::string_view s, const DatePolicy& dp) {
  if (!dp.detect_epoch_seconds || s.size() != 10 || !all_digits(s)) return std::nullopt;
  std::int64_t v = 0;
  if (std::from_chars(s.data(), s.data() + s.size(), v).ec != std::errc()) return std::nullopt;
  if (v <= dp.epoch_min || v >= dp.epoch_max) return std::nullopt;
  return from_epoch_seconds(v);
}

std::optional<std::pair<DateTime, std::string>> ParsePolicy::parse_date(std::string_view s) const {
  if (auto dt = parse_epoch(s, dates())) return std::make_pair(*dt, std::string("%s"));
  return detect_date(s, country);
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  const BoolPolicy& bp = bools();
  for (const auto& t : bp.true_tokens) {
    if (bp.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : bp.false_tokens) {
    if (bp.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

bool ParsePolicy::is_null_token(std::string_view s) const {
  if (s.empty()) return true;
  static constexpr std::string_view nulls[] = {"null","NULL","NaN","","NA"};
  for (auto n : nulls) if (s == n) return true;
  return false;
}

// Applies the letter case of `sample` ("YES", "Yes", "yes") to `word`.
static std::optional<std::string> spell_like(std::string_view sample, std::string_view word) {
  bool all_upper = true, all_lower = true;
  for (char c : sample) {
    if (std::isupper((unsigned char)c)) all_lower = false;
    if (std::islower((unsigned char)c)) all_upper = false;
  }
  std::string out(word);
  if (all_lower) {
    for (auto& c : out) c = (char)std::tolower((unsigned char)c);
  } else if (all_upper) {
    for (auto& c : out) c = (char)std::toupper((unsigned char)c);
  } else {
    bool tail_lower = true;
    for (std::size_t i = 1; i < sample.size(); ++i) if (std::isupper((unsigned char)sample[i])) tail_lower = false;
    if (!tail_lower) return std::nullopt;
    for (auto& c : out) c = (char)std::tolower((unsigned char)c);
    if (!out.empty()) out[0] = (char)std::toupper((unsigned char)out[0]);
  }
  return out;
}

static std::optional<BoolFormat> bool_spelling(std::string_view s, bool v, const BoolPolicy& bp) {
  const auto& same  = v ? bp.true_tokens : bp.false_tokens;
  const auto& other = v ? bp.false_tokens : bp.true_tokens;
  for (std::size_t i = 0; i < same.size(); ++i) {
    if (!(bp.case_sensitive ? (s == same[i]) : ieq(s, same[i]))) continue;
    const std::string& opposite = i < other.size() ? other[i] : (other.empty() ? same[i] : other[0]);
    auto a = spell_like(s, same[i]);
    auto b = spell_like(s, opposite);
    if (!a || !b) return std::nullopt;
    return v ? BoolFormat{*a, *b} : BoolFormat{*b, *a};
  }
  return std::nullopt;
}

Inference ParsePolicy::infer(std::string_view s, DiagnosticSink* diag) const {
  if (s.empty()) return Inference{std::string()};

  if (auto dt = parse_epoch(s, dates())) return Inference{*dt, FormatTemplate{DatePattern{"%s"}}};

  if (auto i = parse_int(s)) return Inference{*i};

  bool pre = false, suf = false;
  std::string_view core = strip_excel_text_prefix(s, &pre, &suf);
  if (pre) {
    std::optional<std::pair<double, NumberFormat>> n;
    if (auto i = parse_int(core)) {
      NumberFormat f; f.decimal = number_style(country).decimal;
      n = std::make_pair(static_cast<double>(*i), f);
    } else {
      n = parse_number(core);
    }
    if (n) {
      n->second.text_prefix = pre;
      n->second.text_suffix = suf;
      if (format_number(n->first, n->second) == s) {
        emit(diag, Severity::Info, "excel-text-prefix",
             "stripped forced-text marks from '" + std::string(s) + "'");
        return Inference{n->first, FormatTemplate{n->second}};
      }
    }
  }

  if (auto n = parse_number(s)) {
    if (format_number_canonical(n->first, country) == s) return Inference{n->first};
    if (format_number(n->first, n->second) == s) return Inference{n->first, FormatTemplate{n->second}};
  }

  if (auto b = parse_bool(s)) {
    if (s == (*b ? "true" : "false")) return Inference{*b};
    if (auto bf = bool_spelling(s, *b, bools())) {
      if ((*b ? bf->true_text : bf->false_text) == s) return Inference{*b, FormatTemplate{*bf}};
    }
  }

  if (auto d = detect_date(s, country)) return Inference{d->first, FormatTemplate{DatePattern{d->second}}};

  if (has_excel_exponential_notation(s)) {
    emit(diag, Severity::Warning, "excel-exponent",
         "value '" + std::string(s) + "' looks like a number mangled into exponent notation");
  }
  return Inference{std::string(s)};
}

std::string format_number_canonical(double v, Country c) {
  char buf[400];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
  if (ec != std::errc()) {
    ptr = std::to_chars(buf, buf + sizeof(buf), v).ptr;
  }
  std::string out(buf, ptr);
  const char dec = number_style(c).decimal;
  if (dec != '.') std::replace(out.begin(), out.end(), '.', dec);
  return out;
}

std::string format_number(double v, const NumberFormat& fmt) {
  const int decimals = std::max(0, fmt.decimals);
  std::vector<char> buf(400 + static_cast<std::size_t>(decimals));
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::fixed, decimals);
  if (ec != std::errc()) return format_number_canonical(v, Country::UnitedStates);
  std::string_view s(buf.data(), static_cast<std::size_t>(ptr - buf.data()));

  const bool neg = !s.empty() && s[0] == '-';
  if (neg) s.remove_prefix(1);
  const std::size_t dot = s.find('.');
  std::string_view int_part = s.substr(0, dot);
  std::string_view frac = dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);

  std::string out;
  out.reserve(s.size() + s.size() / 3 + 4);
  if (fmt.text_prefix) out += '\'';
  if (neg) out += '-';
  for (std::size_t i = 0; i < int_part.size(); ++i) {
    if (fmt.group != '\0' && i > 0 && (int_part.size() - i) % 3 == 0) out += fmt.group;
    out += int_part[i];
  }
  if (!frac.empty()) { out += fmt.decimal; out.append(frac); }
  if (fmt.text_suffix) out += '\'';
  return out;
}

std::string format_value(const TypedValue& v, const std::optional<FormatTemplate>& fmt, Country c) {
  switch (kind_of(v)) {
    case ValueKind::Text:
      return std::get<std::string>(v);
    case ValueKind::Integer:
      return std::to_string(std::get<std::int64_t>(v));
    case ValueKind::Float:
      if (fmt && std::holds_alternative<NumberFormat>(*fmt))
        return format_number(std::get<double>(v), std::get<NumberFormat>(*fmt));
      return format_number_canonical(std::get<double>(v), c);
    case ValueKind::Boolean: {
      const bool b = std::get<bool>(v);
      if (fmt && std::holds_alternative<BoolFormat>(*fmt)) {
        const auto& bf = std::get<BoolFormat>(*fmt);
        return b ? bf.true_text : bf.false_text;
      }
      return b ? "true" : "false";
    }
    case ValueKind::DateTime:
      if (fmt && std::holds_alternative<DatePattern>(*fmt))
        return format_with_pattern(std::get<DateTime>(v), std::get<DatePattern>(*fmt).pattern);
      return format_with_pattern(std::get<DateTime>(v), kCanonicalDatePattern);
  }
  return std::string();
}

std::string_view strip_excel_text_prefix(std::string_view s, bool* had_prefix, bool* had_suffix) {
  if (had_prefix) *had_prefix = false;
  if (had_suffix) *had_suffix = false;
  if (s.size() < 2 || s[0] != '\'') return s;
  std::string_view core = s.substr(1);
  bool suffix = false;
  if (core.back() == '\'') { core.remove_suffix(1); suffix = true; }

  bool any_digit = false;
  for (char c : core) {
    if (c >= '0' && c <= '9') { any_digit = true; continue; }
    if (c == '.' || c == ',' || c == ' ' || c == '-' || c == '+') continue;
    return s;
  }
  if (!any_digit) return s;
  if (had_prefix) *had_prefix = true;
  if (had_suffix) *had_suffix = suffix;
  return core;
}

bool has_excel_exponential_notation(std::string_view s) {
  std::size_t i = 0;
  auto digits = [&]() {
    const std::size_t start = i;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
    return i > start;
  };
  if (i < s.size() && s[i] == '-') ++i;
  if (!digits()) return false;
  if (i >= s.size() || (s[i] != ',' && s[i] != '.')) return false;
  ++i;
  if (!digits()) return false;
  if (i >= s.size() || (s[i] != 'E' && s[i] != 'e')) return false;
  ++i;
  if (i >= s.size() || (s[i] != '+' && s[i] != '-')) return false;
  ++i;
  if (!digits()) return false;
  return i == s.size();
}

}
