#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rtcsv/column_width.hpp"
#include "rtcsv/diagnostics.hpp"
#include "rtcsv/field.hpp"
#include "rtcsv/field_factory.hpp"
#include "rtcsv/line_tokenizer.hpp"
#include "rtcsv/parse_error.hpp"

namespace rtcsv {

struct RepeatRange {
  int min = 0;
  int max = 0;
};

// Ordered fields plus the dialect they were split with.
class Line {
public:
  // Throws std::invalid_argument on an empty delimiter or a multi-byte enclosure.
  explicit Line(std::vector<Field> fields,
                std::string delimiter = ",",
                std::string enclosure = "\"");
  Line(const std::vector<std::string_view>& raw_fields,
       const FieldFactory& factory,
       std::string delimiter = ",",
       std::string enclosure = "\"");

  static std::optional<Line> from_string(std::string_view line,
                                         std::string_view delimiter,
                                         std::string_view enclosure,
                                         const FieldFactory& factory,
                                         ParseError* err = nullptr);
  // Data line with the config's country.
  static std::optional<Line> from_string(std::string_view line,
                                         const CsvConfig& cfg,
                                         ParseError* err = nullptr,
                                         DiagnosticSink* diag = nullptr);

  const std::vector<Field>& fields() const noexcept { return fields_; }
  const Field* field(std::size_t i) const { return i < fields_.size() ? &fields_[i] : nullptr; }
  Field*       field(std::size_t i)       { return i < fields_.size() ? &fields_[i] : nullptr; }

  std::size_t count_fields() const noexcept { return fields_.size(); }
  std::size_t count_quoted_fields() const;

  const std::string& delimiter() const noexcept { return delimiter_; }
  const std::string& enclosure() const noexcept { return enclosure_; }

  // [min,max] of per-field repeats; unquoted zeros ignored unless asked for.
  RepeatRange enclosure_repeat_range(bool include_unquoted = false) const;

  std::string to_string(std::optional<std::string_view> delimiter = std::nullopt,
                        std::optional<std::string_view> enclosure = std::nullopt,
                        DiagnosticSink* diag = nullptr) const;
  // Cells wider than their column are shortened; the rest rebuild as above.
  // `names` is the header line that names the columns by position.
  std::string to_string(const ColumnWidthConfig& widths,
                        const Line* names = nullptr,
                        std::optional<std::string_view> delimiter = std::nullopt,
                        std::optional<std::string_view> enclosure = std::nullopt,
                        DiagnosticSink* diag = nullptr) const;

  // Same dialect, same count, pairwise equal formatted values.
  bool equals(const Line& other) const;

  bool set_field(std::size_t i, Field f);
  Line with_field(std::size_t i, Field f) const;
  void add_field(Field f) { fields_.push_back(std::move(f)); }

private:
  std::vector<Field> fields_;
  std::string delimiter_;
  std::string enclosure_;
};

}
