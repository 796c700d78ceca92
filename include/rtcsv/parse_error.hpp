#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace rtcsv {

enum class ParseErrorKind {
  None,
  EmptyDelimiter,
  InvalidEnclosure,
  UnexpectedEnclosure,
  DelimiterAfterQuoteClose,
  UnterminatedField,
  EmptyInput,
  InconsistentFieldCount,
  OversizeRecord,
};

std::string_view to_string(ParseErrorKind k);

struct ParseError {
  ParseErrorKind kind = ParseErrorKind::None;
  std::size_t index   = 0;  // byte offset within the line
  std::size_t line_no = 0;  // 1-based physical line; 0 when unknown
  std::string context;      // up to 20 bytes around `index`
  std::string message;

  explicit operator bool() const noexcept { return kind != ParseErrorKind::None; }
};

// line[index-10 .. index+10), clamped.
std::string context_window(std::string_view line, std::size_t index);

ParseError make_parse_error(ParseErrorKind kind, std::string_view line, std::size_t index,
                            std::string_view detail);

}
