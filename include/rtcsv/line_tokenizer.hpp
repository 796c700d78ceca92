#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rtcsv/locale.hpp"
#include "rtcsv/parse_error.hpp"

namespace rtcsv {

struct CsvConfig {
  std::string delimiter = ",";   // one or more bytes
  std::string enclosure = "\"";  // one byte; empty disables quoting
  bool header           = true;
  Country country       = Country::Germany;
};

// Splits one logical line into raw field slices (enclosures kept).
// A run of enclosures opens quoting at field start; inside quotes an
// enclosure closes it only when followed by the delimiter, "\r", "\n" or
// end of line. Slices point into `line`.
bool tokenize_line(std::string_view line,
                   std::string_view delimiter,
                   std::string_view enclosure,
                   std::vector<std::string_view>& out,
                   ParseError* err = nullptr);

// Where the quote-run machine stands after the last byte of `text`.
enum class QuoteState { Closed, Open, Malformed };

// Open when a quoted field is still running at the end of `text` (the
// record continues on the next physical line). Malformed when
// tokenize_line rejects `text` for any other reason.
QuoteState quote_state_at_end(std::string_view text,
                              std::string_view delimiter,
                              std::string_view enclosure);

// Reusable form that keeps the last error and counters.
class QuoteRunTokenizer {
public:
  explicit QuoteRunTokenizer(const CsvConfig& cfg);
  ~QuoteRunTokenizer();
  QuoteRunTokenizer(const QuoteRunTokenizer&) = delete;
  QuoteRunTokenizer& operator=(const QuoteRunTokenizer&) = delete;

  bool split(std::string_view line, std::vector<std::string_view>& out);
  const ParseError& error() const { return err_; }
  std::uint64_t lines() const { return lines_; }
  std::uint64_t failures() const { return failures_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t lines_{0};
  std::uint64_t failures_{0};
  ParseError err_;
};

}
