#include "rtcsv/line_probe.hpp"
#include "rtcsv/line.hpp"

namespace rtcsv {

int detect_enclosure_repeat(std::string_view line, const CsvConfig& cfg, bool strict) {
  if (line.empty() || cfg.enclosure.empty()) return 0;
  auto parsed = Line::from_string(line, cfg);
  if (!parsed) return 0;
  const RepeatRange quoted = parsed->enclosure_repeat_range(false);
  if (quoted.max == 0) return 0;
  return strict ? parsed->enclosure_repeat_range(true).min : quoted.max;
}

bool has_repeated_enclosure(std::string_view line, const CsvConfig& cfg, int repeat, bool strict) {
  if (line.empty() || cfg.enclosure.empty()) return false;
  if (repeat == 0) {
    return line.find(cfg.enclosure) == std::string_view::npos &&
           line.find(cfg.delimiter) != std::string_view::npos;
  }
  auto parsed = Line::from_string(line, cfg);
  if (!parsed) return false;
  const int loose = parsed->enclosure_repeat_range(false).max;
  if (loose == 0) return false;
  if (strict) return parsed->enclosure_repeat_range(true).min == repeat && loose == repeat;
  return loose >= repeat;
}

bool round_trips(std::string_view line, const CsvConfig& cfg, DiagnosticSink* diag) {
  auto parsed = Line::from_string(line, cfg, nullptr, diag);
  if (!parsed) return false;
  return parsed->to_string(std::nullopt, std::string_view(cfg.enclosure)) == line;
}

}
