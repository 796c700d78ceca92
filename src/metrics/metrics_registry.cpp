#include "rtcsv/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace rtcsv {

std::string_view value_kind_name(ValueKind k) {
  switch (k) {
    case ValueKind::Text:     return "text";
    case ValueKind::Integer:  return "int";
    case ValueKind::Float:    return "float";
    case ValueKind::Boolean:  return "bool";
    case ValueKind::DateTime: return "datetime";
  }
  return "text";
}

void MetricsRegistry::reset() {
  records_ = physical_lines_ = bytes_ = fields_ = quoted_ = malformed_ = mismatches_ = 0;
  errors_.clear();
  warnings_.clear();
  kinds_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_error(std::string_view kind) {
  ++malformed_;
  ++errors_[std::string(kind)];
}

void MetricsRegistry::add_warning(std::string_view code) {
  ++warnings_[std::string(code)];
}

CheckStats MetricsRegistry::snapshot(double wall_ms) const {
  CheckStats r;
  r.records = records_;
  r.physical_lines = physical_lines_;
  r.bytes = bytes_;
  r.fields = fields_;
  r.quoted_fields = quoted_;
  r.malformed = malformed_;
  r.rebuild_mismatches = mismatches_;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.errors_by_kind = errors_;
  r.warnings_by_code = warnings_;
  r.values_by_kind = kinds_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return r;
}

}
