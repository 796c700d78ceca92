#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rtcsv/column_width.hpp"
#include "rtcsv/diagnostics.hpp"
#include "rtcsv/line.hpp"
#include "rtcsv/line_tokenizer.hpp"
#include "rtcsv/parse_error.hpp"
#include "rtcsv/record_view.hpp"

namespace rtcsv {

// Optional header line plus data lines sharing one dialect.
class Document {
public:
  explicit Document(CsvConfig cfg = {}) : cfg_(std::move(cfg)) {}
  Document(std::optional<Line> header, std::vector<Line> rows, CsvConfig cfg = {})
    : header_(std::move(header)), rows_(std::move(rows)), cfg_(std::move(cfg)) {}

  const CsvConfig& config() const noexcept { return cfg_; }

  bool has_header() const noexcept { return header_.has_value(); }
  const Line* header() const { return header_ ? &*header_ : nullptr; }
  void set_header(Line header) { header_ = std::move(header); }

  const std::vector<Line>& rows() const noexcept { return rows_; }
  const Line* row(std::size_t i) const { return i < rows_.size() ? &rows_[i] : nullptr; }
  Line*       row(std::size_t i)       { return i < rows_.size() ? &rows_[i] : nullptr; }
  std::size_t count_rows() const noexcept { return rows_.size(); }
  void add_row(Line row) { rows_.push_back(std::move(row)); }

  RecordView record(std::size_t i) const { return RecordView(header(), row(i)); }

  // Every row has the header's width (or the first row's without a header).
  bool is_consistent(std::size_t* bad_row = nullptr) const;

  std::optional<std::size_t> column_index(std::string_view name) const;
  std::vector<std::string> column_names() const;
  bool has_column(std::string_view name) const { return column_index(name).has_value(); }

  // Cells of one column; rows too short contribute nullptr.
  std::vector<const Field*> column(std::size_t index) const;
  std::vector<const Field*> column(std::string_view name) const;

  struct WriteOptions {
    std::optional<std::string> delimiter;      // default: the document's
    std::optional<std::string> enclosure;
    std::optional<int> enclosure_repeat;       // forced on every quoted field
    const ColumnWidthConfig* widths = nullptr; // data rows only, header kept whole
    std::string line_ending = "\n";
  };

  std::string to_string(std::string_view line_ending = "\n") const;
  // Throws std::invalid_argument on an empty delimiter or a multi-byte enclosure.
  std::string to_string(const WriteOptions& opts) const;

  // One map per data row keyed by column name; empty without a header.
  // Missing cells map to "", cells past the header are left out and a
  // repeated column name keeps its last cell.
  using Record = std::map<std::string, std::string>;
  std::vector<Record> to_records() const;

  bool equals(const Document& other) const;

private:
  std::optional<Line> header_;
  std::vector<Line> rows_;
  CsvConfig cfg_;
};

// Logical lines, blank lines skipped, header first when cfg.header.
std::optional<Document> parse_document(std::string_view text,
                                       const CsvConfig& cfg,
                                       ParseError* err = nullptr,
                                       DiagnosticSink* diag = nullptr);

}
