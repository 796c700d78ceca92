#pragma once
#include <string_view>

#include "rtcsv/diagnostics.hpp"
#include "rtcsv/line_tokenizer.hpp"

namespace rtcsv {

// Dialect sniffing over a single line. Unparseable lines report 0 / false.

// strict: smallest repeat over all fields (unquoted count as 0);
// otherwise the largest. 0 when no field is quoted.
int detect_enclosure_repeat(std::string_view line, const CsvConfig& cfg, bool strict = true);

// repeat == 0: no enclosure at all and at least one delimiter.
// strict: every field quoted exactly `repeat` deep; otherwise any field reaches it.
bool has_repeated_enclosure(std::string_view line, const CsvConfig& cfg, int repeat = 1, bool strict = true);

// Parses and rebuilds every field from its typed state; true when the result
// equals `line`. Inference findings go to `diag`.
bool round_trips(std::string_view line, const CsvConfig& cfg, DiagnosticSink* diag = nullptr);

}
