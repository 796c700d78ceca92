#pragma once
#include <cstdint>
#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rtcsv/typed_value.hpp"

namespace rtcsv {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct CheckStats {
  std::uint64_t records = 0;            // logical lines parsed (header included)
  std::uint64_t physical_lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t fields = 0;
  std::uint64_t quoted_fields = 0;
  std::uint64_t malformed = 0;
  std::uint64_t rebuild_mismatches = 0; // rebuilt-from-state text != source
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;
  std::map<std::string, std::uint64_t> errors_by_kind;
  std::map<std::string, std::uint64_t> warnings_by_code;
  std::map<std::string, std::uint64_t> values_by_kind;
};

std::string_view value_kind_name(ValueKind k);

class MetricsRegistry {
public:
  void reset();
  void add_record(std::uint64_t fields, std::uint64_t quoted) noexcept {
    ++records_; fields_ += fields; quoted_ += quoted;
  }
  void add_value(ValueKind k) { ++kinds_[std::string(value_kind_name(k))]; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void set_physical_lines(std::uint64_t n) noexcept { physical_lines_ = n; }
  void add_rebuild_mismatch() noexcept { ++mismatches_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_error(std::string_view kind);
  void add_warning(std::string_view code);

  std::uint64_t malformed() const noexcept { return malformed_; }
  std::uint64_t rebuild_mismatches() const noexcept { return mismatches_; }

  CheckStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t physical_lines_{0};
  std::uint64_t bytes_{0};
  std::uint64_t fields_{0};
  std::uint64_t quoted_{0};
  std::uint64_t malformed_{0};
  std::uint64_t mismatches_{0};
  std::map<std::string, std::uint64_t> errors_;
  std::map<std::string, std::uint64_t> warnings_;
  std::map<std::string, std::uint64_t> kinds_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
