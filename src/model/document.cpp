#include "rtcsv/document.hpp"
#include "rtcsv/field_factory.hpp"
#include "rtcsv/logical_lines.hpp"
#include <stdexcept>

namespace rtcsv {

static bool is_blank_line(std::string_view s) {
  return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

bool Document::is_consistent(std::size_t* bad_row) const {
  if (rows_.empty()) return true;
  const std::size_t width = header_ ? header_->count_fields() : rows_.front().count_fields();
  for (std::size_t i = 0; i < rows_.size(); ++i) {
    if (rows_[i].count_fields() != width) {
      if (bad_row) *bad_row = i;
      return false;
    }
  }
  return true;
}

std::optional<std::size_t> Document::column_index(std::string_view name) const {
  if (!header_) return std::nullopt;
  const auto& cells = header_->fields();
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (cells[i].value() == name) return i;
  }
  return std::nullopt;
}

std::vector<std::string> Document::column_names() const {
  std::vector<std::string> names;
  if (!header_) return names;
  names.reserve(header_->count_fields());
  for (const auto& f : header_->fields()) names.push_back(f.value());
  return names;
}

std::vector<const Field*> Document::column(std::size_t index) const {
  std::vector<const Field*> cells;
  cells.reserve(rows_.size());
  for (const auto& r : rows_) cells.push_back(r.field(index));
  return cells;
}

std::vector<const Field*> Document::column(std::string_view name) const {
  auto idx = column_index(name);
  if (!idx) return {};
  return column(*idx);
}

std::string Document::to_string(std::string_view line_ending) const {
  WriteOptions opts;
  opts.line_ending = std::string(line_ending);
  return to_string(opts);
}

std::string Document::to_string(const WriteOptions& opts) const {
  if (opts.delimiter && opts.delimiter->empty()) throw std::invalid_argument("document delimiter must not be empty");
  if (opts.enclosure && opts.enclosure->size() > 1) {
    throw std::invalid_argument("document enclosure must be a single character");
  }
  std::optional<std::string_view> delim, enc;
  if (opts.delimiter) delim = *opts.delimiter;
  if (opts.enclosure) enc = *opts.enclosure;

  std::string out;
  bool first = true;
  auto put = [&](const Line& l, bool data) {
    if (!first) out.append(opts.line_ending);
    first = false;
    std::optional<Line> forced;
    if (opts.enclosure_repeat) {
      forced = l;
      for (std::size_t i = 0; i < forced->count_fields(); ++i) {
        forced->field(i)->set_enclosure_repeat(*opts.enclosure_repeat);
      }
    }
    const Line& src = forced ? *forced : l;
    out += (data && opts.widths) ? src.to_string(*opts.widths, header(), delim, enc) : src.to_string(delim, enc);
  };
  if (header_) put(*header_, false);
  for (const auto& r : rows_) put(r, true);
  return out;
}

std::vector<Document::Record> Document::to_records() const {
  std::vector<Record> out;
  if (!header_) return out;
  const std::vector<std::string> names = column_names();
  out.reserve(rows_.size());
  for (const auto& r : rows_) {
    Record rec;
    for (std::size_t i = 0; i < names.size(); ++i) {
      const Field* f = r.field(i);
      rec[names[i]] = f ? f->value() : std::string();
    }
    out.push_back(std::move(rec));
  }
  return out;
}

bool Document::equals(const Document& other) const {
  if (has_header() != other.has_header()) return false;
  if (header_ && !header_->equals(*other.header_)) return false;
  if (rows_.size() != other.rows_.size()) return false;
  for (std::size_t i = 0; i < rows_.size(); ++i) {
    if (!rows_[i].equals(other.rows_[i])) return false;
  }
  return true;
}

std::optional<Document> parse_document(std::string_view text,
                                       const CsvConfig& cfg,
                                       ParseError* err,
                                       DiagnosticSink* diag) {
  auto fail = [&](ParseError e) -> std::optional<Document> {
    if (err) *err = std::move(e);
    return std::nullopt;
  };
  if (cfg.delimiter.empty()) {
    return fail(make_parse_error(ParseErrorKind::EmptyDelimiter, text, 0, "delimiter must not be empty"));
  }
  if (is_blank_line(text)) {
    return fail(make_parse_error(ParseErrorKind::EmptyInput, text, 0, "no content"));
  }

  const DataFieldFactory data(cfg.country, diag);
  const HeaderFieldFactory names(cfg.country);

  Document doc(cfg);
  std::vector<std::uint64_t> row_lines;
  ParseError line_err;
  bool want_header = cfg.header;

  const bool ok = for_each_logical_line(text, cfg.delimiter, cfg.enclosure, [&](std::string_view rec, std::uint64_t line_no) {
    if (is_blank_line(rec)) return true;
    const FieldFactory& factory = want_header ? static_cast<const FieldFactory&>(names) : data;
    auto line = Line::from_string(rec, cfg.delimiter, cfg.enclosure, factory, &line_err);
    if (!line) {
      line_err.line_no = static_cast<std::size_t>(line_no);
      line_err.message = "line " + std::to_string(line_no) + ": " + line_err.message;
      return false;
    }
    if (want_header) {
      doc.set_header(std::move(*line));
      want_header = false;
    } else {
      doc.add_row(std::move(*line));
      row_lines.push_back(line_no);
    }
    return true;
  });
  if (!ok) return fail(std::move(line_err));

  std::size_t bad = 0;
  if (!doc.is_consistent(&bad)) {
    const std::size_t expected = doc.has_header() ? doc.header()->count_fields() : doc.row(0)->count_fields();
    ParseError e;
    e.kind = ParseErrorKind::InconsistentFieldCount;
    e.line_no = static_cast<std::size_t>(row_lines[bad]);
    e.message = "line " + std::to_string(e.line_no) + ": " + std::to_string(doc.row(bad)->count_fields()) +
                " fields, expected " + std::to_string(expected);
    return fail(std::move(e));
  }
  return doc;
}

}
