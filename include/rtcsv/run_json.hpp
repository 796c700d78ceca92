#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtcsv {

// One malformed line, as reported in run.json.
struct RunJsonIssue {
  std::uint64_t line = 0;
  std::string kind;
  std::uint64_t index = 0;
  std::string context;
  std::string message;
};

struct RunJsonPayload {
  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
  std::string delimiter;
  std::string enclosure;
  std::string country;
  bool header = true;

  // Counts
  std::uint64_t records = 0;
  std::uint64_t physical_lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t fields = 0;
  std::uint64_t quoted_fields = 0;
  std::uint64_t malformed = 0;
  std::uint64_t rebuild_mismatches = 0;
  bool round_trip_ok = true;

  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  // Stages and breakdowns
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::map<std::string, std::uint64_t> errors_by_kind;
  std::map<std::string, std::uint64_t> warnings_by_code;
  std::map<std::string, std::uint64_t> values_by_kind;

  std::vector<RunJsonIssue> issues; // capped by the caller
};

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);
};

}
