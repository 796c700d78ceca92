#include "rtcsv/parse_error.hpp"
#include <algorithm>

namespace rtcsv {

std::string_view to_string(ParseErrorKind k) {
  switch (k) {
    case ParseErrorKind::None:                     return "None";
    case ParseErrorKind::EmptyDelimiter:           return "EmptyDelimiter";
    case ParseErrorKind::InvalidEnclosure:         return "InvalidEnclosure";
    case ParseErrorKind::UnexpectedEnclosure:      return "UnexpectedEnclosure";
    case ParseErrorKind::DelimiterAfterQuoteClose: return "DelimiterAfterQuoteClose";
    case ParseErrorKind::UnterminatedField:        return "UnterminatedField";
    case ParseErrorKind::EmptyInput:               return "EmptyInput";
    case ParseErrorKind::InconsistentFieldCount:   return "InconsistentFieldCount";
    case ParseErrorKind::OversizeRecord:           return "OversizeRecord";
  }
  return "Unknown";
}

std::string context_window(std::string_view line, std::size_t index) {
  const std::size_t start = index > 10 ? index - 10 : 0;
  if (start >= line.size()) return std::string();
  return std::string(line.substr(start, 20));
}

ParseError make_parse_error(ParseErrorKind kind, std::string_view line, std::size_t index,
                            std::string_view detail) {
  ParseError e;
  e.kind = kind;
  e.index = index;
  e.context = context_window(line, index);
  e.message = std::string(detail) + " at index " + std::to_string(index);
  if (!e.context.empty()) e.message += " (near '" + e.context + "')";
  return e;
}

}
