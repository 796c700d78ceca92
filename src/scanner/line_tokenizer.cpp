#include "rtcsv/line_tokenizer.hpp"
#include <string_view>
#include <vector>

namespace rtcsv {

namespace {

bool fail(ParseError* err, ParseErrorKind kind, std::string_view line, std::size_t index,
          std::string_view detail, std::vector<std::string_view>& out) {
  out.clear();
  if (err) *err = make_parse_error(kind, line, index, detail);
  return false;
}

// Runs the quote-run machine over `line`. Fields go to `out` when it is
// given. Open means the last field is still inside quotes.
QuoteState run_machine(std::string_view line,
                       std::string_view delim,
                       std::string_view enclosure,
                       std::vector<std::string_view>* out,
                       ParseError* err,
                       std::size_t* open_at) {
  std::vector<std::string_view> scratch;
  auto malformed = [&](ParseErrorKind kind, std::size_t index, std::string_view detail) {
    fail(err, kind, line, index, detail, out ? *out : scratch);
    return QuoteState::Malformed;
  };
  if (delim.empty()) return malformed(ParseErrorKind::EmptyDelimiter, 0, "delimiter must not be empty");
  if (enclosure.size() > 1) return malformed(ParseErrorKind::InvalidEnclosure, 0, "enclosure must be a single character");
  if (line.empty()) return QuoteState::Closed;

  const bool quoting = !enclosure.empty();
  const char q = quoting ? enclosure[0] : '\0';
  const std::size_t n = line.size();
  auto delim_at = [&](std::size_t pos) {
    return pos + delim.size() <= n && line.compare(pos, delim.size(), delim) == 0;
  };

  enum class Mode { FieldStart, Unquoted, Quoted } mode = Mode::FieldStart;
  std::size_t field_start = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char c = line[i];
    switch (mode) {
      case Mode::FieldStart:
        if (quoting && c == q) { mode = Mode::Quoted; break; }
        mode = Mode::Unquoted;
        [[fallthrough]];
      case Mode::Unquoted:
        if (delim_at(i)) {
          if (out) out->emplace_back(line.substr(field_start, i - field_start));
          i += delim.size() - 1;
          field_start = i + 1;
          mode = Mode::FieldStart;
        } else if (quoting && c == q) {
          return malformed(ParseErrorKind::UnexpectedEnclosure, i, "unexpected enclosure");
        }
        break;
      case Mode::Quoted: {
        if (c != q) break;
        const std::size_t nx = i + 1;
        if (nx == n || delim_at(nx) || line[nx] == '\r' || line[nx] == '\n') {
          mode = Mode::Unquoted; // closed; only a delimiter may follow
          break;
        }
        if (i >= field_start + delim.size() && line.compare(i - delim.size(), delim.size(), delim) == 0) {
          return malformed(ParseErrorKind::DelimiterAfterQuoteClose, i,
                           "enclosure after delimiter inside quoted field");
        }
        break;
      }
    }
  }

  if (mode == Mode::Quoted) {
    if (open_at) *open_at = field_start;
    return QuoteState::Open;
  }
  if (out) out->emplace_back(line.substr(field_start));
  return QuoteState::Closed;
}

}

bool tokenize_line(std::string_view line,
                   std::string_view delim,
                   std::string_view enclosure,
                   std::vector<std::string_view>& out,
                   ParseError* err) {
  out.clear();
  std::size_t open_at = 0;
  switch (run_machine(line, delim, enclosure, &out, err, &open_at)) {
    case QuoteState::Closed:    return true;
    case QuoteState::Malformed: return false;
    case QuoteState::Open:      break;
  }
  return fail(err, ParseErrorKind::UnterminatedField, line, open_at, "unterminated quoted field", out);
}

QuoteState quote_state_at_end(std::string_view text,
                              std::string_view delimiter,
                              std::string_view enclosure) {
  return run_machine(text, delimiter, enclosure, nullptr, nullptr, nullptr);
}

struct QuoteRunTokenizer::Impl {
  CsvConfig cfg;
};

QuoteRunTokenizer::QuoteRunTokenizer(const CsvConfig& cfg)
  : p_(new Impl{cfg}) {}

QuoteRunTokenizer::~QuoteRunTokenizer() { delete p_; }

bool QuoteRunTokenizer::split(std::string_view line, std::vector<std::string_view>& out) {
  ++lines_;
  err_ = ParseError{};
  if (!tokenize_line(line, p_->cfg.delimiter, p_->cfg.enclosure, out, &err_)) {
    ++failures_;
    err_.line_no = static_cast<std::size_t>(lines_);
    return false;
  }
  return true;
}

}
