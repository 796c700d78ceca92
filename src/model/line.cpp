#include "rtcsv/line.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace rtcsv {

static void check_dialect(const std::string& delimiter, const std::string& enclosure) {
  if (delimiter.empty()) throw std::invalid_argument("line delimiter must not be empty");
  if (enclosure.size() > 1) throw std::invalid_argument("line enclosure must be a single character");
}

Line::Line(std::vector<Field> fields, std::string delimiter, std::string enclosure)
  : fields_(std::move(fields)), delimiter_(std::move(delimiter)), enclosure_(std::move(enclosure)) {
  check_dialect(delimiter_, enclosure_);
}

Line::Line(const std::vector<std::string_view>& raw_fields,
           const FieldFactory& factory,
           std::string delimiter,
           std::string enclosure)
  : delimiter_(std::move(delimiter)), enclosure_(std::move(enclosure)) {
  check_dialect(delimiter_, enclosure_);
  fields_.reserve(raw_fields.size());
  for (auto raw : raw_fields) fields_.push_back(factory.create_field(raw, enclosure_));
}

std::optional<Line> Line::from_string(std::string_view line,
                                      std::string_view delimiter,
                                      std::string_view enclosure,
                                      const FieldFactory& factory,
                                      ParseError* err) {
  std::vector<std::string_view> parts;
  if (!tokenize_line(line, delimiter, enclosure, parts, err)) return std::nullopt;
  return Line(parts, factory, std::string(delimiter), std::string(enclosure));
}

std::optional<Line> Line::from_string(std::string_view line, const CsvConfig& cfg,
                                      ParseError* err, DiagnosticSink* diag) {
  DataFieldFactory factory(cfg.country, diag);
  return from_string(line, cfg.delimiter, cfg.enclosure, factory, err);
}

std::size_t Line::count_quoted_fields() const {
  return static_cast<std::size_t>(std::count_if(fields_.begin(), fields_.end(),
                                                [](const Field& f){ return f.is_quoted(); }));
}

RepeatRange Line::enclosure_repeat_range(bool include_unquoted) const {
  int lo = std::numeric_limits<int>::max();
  int hi = std::numeric_limits<int>::min();
  bool any = false;
  for (const auto& f : fields_) {
    const int r = f.enclosure_repeat();
    if (r == 0 && !include_unquoted) continue;
    lo = std::min(lo, r);
    hi = std::max(hi, r);
    any = true;
  }
  if (!any) return RepeatRange{};
  return RepeatRange{lo, hi};
}

std::string Line::to_string(std::optional<std::string_view> delimiter,
                            std::optional<std::string_view> enclosure,
                            DiagnosticSink* diag) const {
  const std::string_view delim = delimiter ? *delimiter : std::string_view(delimiter_);
  std::string out;
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (i) out.append(delim);
    out += fields_[i].to_string(enclosure, false, diag);
  }
  return out;
}

// Quoting and outer whitespace kept around a shortened value.
static std::string wrap_value(const Field& f, const std::string& value, std::optional<std::string_view> enclosure) {
  if (!f.is_quoted()) return f.leading_whitespace() + value + f.trailing_whitespace();
  const std::string_view enc = enclosure ? *enclosure : std::string_view(f.enclosure());
  std::string wrap;
  for (int i = 0; i < std::max(1, f.enclosure_repeat()); ++i) wrap.append(enc);
  return wrap + value + wrap;
}

std::string Line::to_string(const ColumnWidthConfig& widths,
                            const Line* names,
                            std::optional<std::string_view> delimiter,
                            std::optional<std::string_view> enclosure,
                            DiagnosticSink* diag) const {
  const std::string_view delim = delimiter ? *delimiter : std::string_view(delimiter_);
  std::string out;
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (i) out.append(delim);
    const Field& f = fields_[i];
    const Field* name = names ? names->field(i) : nullptr;
    const std::string column = name ? name->value() : std::string();
    const std::string v = f.value();
    const std::string cut = widths.truncate(v, column, i);
    out += (cut == v) ? f.to_string(enclosure, false, diag) : wrap_value(f, cut, enclosure);
  }
  return out;
}

bool Line::equals(const Line& other) const {
  if (delimiter_ != other.delimiter_ || enclosure_ != other.enclosure_) return false;
  if (fields_.size() != other.fields_.size()) return false;
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].value() != other.fields_[i].value()) return false;
  }
  return true;
}

bool Line::set_field(std::size_t i, Field f) {
  if (i >= fields_.size()) return false;
  fields_[i] = std::move(f);
  return true;
}

Line Line::with_field(std::size_t i, Field f) const {
  Line copy(*this);
  if (i < copy.fields_.size()) copy.fields_[i] = std::move(f);
  return copy;
}

}
