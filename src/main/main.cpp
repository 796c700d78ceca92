#include "rtcsv/artifact_writer.hpp"
#include "rtcsv/diagnostics.hpp"
#include "rtcsv/field_factory.hpp"
#include "rtcsv/line.hpp"
#include "rtcsv/line_reader.hpp"
#include "rtcsv/locale.hpp"
#include "rtcsv/metrics.hpp"
#include "rtcsv/path_utils.hpp"
#include "rtcsv/run_json.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string delimiter;            // empty: pick from the file extension
  std::string enclosure = "\"";
  std::string country = "DE";
  bool header = true;
  std::string artifact_root = "artifacts/rtcsv";
  std::string slug_mode = "basename"; // hashprefix|basename|keypath
  int slug_len = 64;
  bool strict = false;
  bool quiet = false;
  int max_issues = 50;
  int max_record_bytes = 8 * 1024 * 1024;
  std::vector<std::string> checks;  // explicit file paths
};

void print_usage(std::ostream& os) {
  os <<
    "Usage: rtcsv-check [--delimiter=D] [--enclosure=E | --no-enclosure] [--country=CC]\n"
    "                   [--no-header] [--artifact-root=DIR]\n"
    "                   [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                   [--max-issues=N] [--max-record-bytes=N] [--strict] [--quiet]\n"
    "                   [--check <file> | --check=<file> | <file>]...\n";
}

// "\t" and "tab" spell a tab on the command line.
std::string unescape_delimiter(std::string d) {
  if (d == "\\t" || d == "tab") return "\t";
  return d;
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::strlen(pfx)); return true; }
      return false;
    };
    bool bad_int = false;
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::strlen(pfx));
      auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), *out);
      bad_int = ec != std::errc() || ptr != v.data() + v.size() || *out < 0;
      return true;
    };
    if (eat("--delimiter=", &c.delimiter)) { c.delimiter = unescape_delimiter(c.delimiter); continue; }
    if (eat("--enclosure=", &c.enclosure)) continue;
    if (eat("--country=", &c.country)) continue;
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len) || eat_i("--max-issues=", &c.max_issues) ||
        eat_i("--max-record-bytes=", &c.max_record_bytes)) {
      if (bad_int) { std::cerr << "[check] bad number in " << a << "\n"; return false; }
      continue;
    }
    if (a == "--no-enclosure") { c.enclosure.clear(); continue; }
    if (a == "--no-header")    { c.header = false; continue; }
    if (a == "--strict")       { c.strict = true;  continue; }
    if (a == "--quiet")        { c.quiet  = true;  continue; }
    if (a == "--check" && i+1 < argc) { c.checks.push_back(argv[++i]); continue; }
    if (eat("--check=", &a)) { c.checks.push_back(a); continue; }
    if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      std::exit(0);
    }
    if (a.rfind("--", 0) == 0) { std::cerr << "[check] unknown flag: " << a << "\n"; return false; }
    c.checks.push_back(a);
  }
  if (c.max_record_bytes < 1) { std::cerr << "[check] --max-record-bytes must be positive\n"; return false; }
  if (c.enclosure.size() > 1) { std::cerr << "[check] enclosure must be one character\n"; return false; }
  if (c.checks.empty()) { std::cerr << "[check] no input files\n"; return false; }
  return true;
}

// Inference and rebuild warnings feed the per-file counters.
class MetricsSink : public rtcsv::DiagnosticSink {
public:
  explicit MetricsSink(rtcsv::MetricsRegistry& m) : m_(m) {}
  void report(const rtcsv::Diagnostic& d) override { m_.add_warning(d.code); }

private:
  rtcsv::MetricsRegistry& m_;
};

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // For hashprefix mode, hash the full absolute path to be stable across cwd.
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return rtcsv::make_slug(key, mode, len);
}

int check_one_file(const std::string& filepath, const Cli& cli, rtcsv::Country country) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  rtcsv::CsvConfig cfg;
  cfg.delimiter = cli.delimiter.empty() ? rtcsv::default_delimiter(rtcsv::detect_format(filepath)) : cli.delimiter;
  cfg.enclosure = cli.enclosure;
  cfg.header = cli.header;
  cfg.country = country;

  rtcsv::MetricsRegistry metrics;
  MetricsSink counting(metrics);
  rtcsv::StderrSink console;
  rtcsv::TeeSink diag(&counting, cli.quiet ? nullptr : &console);

  const rtcsv::DataFieldFactory data(cfg.country, &diag);
  const rtcsv::HeaderFieldFactory names(cfg.country);

  std::string rebuilt;
  std::vector<rtcsv::RunJsonIssue> issues;
  bool want_header = cfg.header;
  const std::string_view enclosure(cfg.enclosure);

  auto note_issue = [&](std::uint64_t line_no, std::string kind, std::size_t index,
                        std::string context, std::string message) {
    if (!cli.quiet) std::cerr << "[check] " << filepath << ":" << line_no << ": " << message << "\n";
    if ((int)issues.size() >= cli.max_issues) return;
    issues.push_back(rtcsv::RunJsonIssue{line_no, std::move(kind), index, std::move(context), std::move(message)});
  };

  rtcsv::LineReader::Config rcfg;
  rcfg.delimiter = cfg.delimiter;
  rcfg.enclosure = cfg.enclosure;
  rcfg.join_quoted = !cfg.enclosure.empty();
  rcfg.max_record_bytes = static_cast<std::size_t>(cli.max_record_bytes);
  // Dropped lines are missing from rebuilt.csv, so they count as malformed.
  rcfg.on_oversize = [&](std::uint64_t line_no) {
    const std::string_view kind = rtcsv::to_string(rtcsv::ParseErrorKind::OversizeRecord);
    metrics.add_error(kind);
    note_issue(line_no, std::string(kind), 0, std::string(),
               "line longer than " + std::to_string(cli.max_record_bytes) + " bytes dropped");
  };
  rtcsv::LineReader reader(filepath, rcfg);

  metrics.start_stage("parse_rebuild");
  const bool read_ok = reader.for_each_record([&](std::string_view rec, std::uint64_t line_no) {
    const std::string_view eol = reader.record_terminator();
    if (want_header && rec.find_first_not_of(" \t") == std::string_view::npos) {
      rebuilt.append(rec).append(eol);
      return true;
    }
    rtcsv::ParseError pe;
    const rtcsv::FieldFactory& factory = want_header ? static_cast<const rtcsv::FieldFactory&>(names) : data;
    auto line = rtcsv::Line::from_string(rec, cfg.delimiter, cfg.enclosure, factory, &pe);
    if (!line) {
      metrics.add_error(rtcsv::to_string(pe.kind));
      note_issue(line_no, std::string(rtcsv::to_string(pe.kind)), pe.index, pe.context, pe.message);
      rebuilt.append(rec).append(eol);
      return !cli.strict;
    }
    want_header = false;
    metrics.add_record(line->count_fields(), line->count_quoted_fields());
    for (const auto& f : line->fields()) metrics.add_value(rtcsv::kind_of(f.typed_value()));

    std::string again = line->to_string(std::nullopt, enclosure, &diag);
    if (again != rec) {
      metrics.add_rebuild_mismatch();
      note_issue(line_no, "RebuildMismatch", 0, std::string(rec.substr(0, 20)),
                 "rebuilt line differs from source");
    }
    rebuilt.append(again).append(eol);
    return true;
  });
  metrics.end_stage("parse_rebuild");

  if (!read_ok) {
    std::cerr << "[check] cannot read " << filepath << ": " << std::strerror(reader.last_error()) << "\n";
    return 2;
  }
  metrics.add_bytes(reader.bytes_read());
  metrics.set_physical_lines(reader.physical_lines());

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const rtcsv::CheckStats stats = metrics.snapshot(wall_ms);

  rtcsv::RunJsonPayload p{};
  p.filename = filepath;
  std::error_code fec;
  p.file_size = std::filesystem::file_size(filepath, fec);
  p.delimiter = cfg.delimiter;
  p.enclosure = cfg.enclosure;
  p.country = std::string(rtcsv::country_code(cfg.country));
  p.header = cfg.header;
  p.records = stats.records;
  p.physical_lines = stats.physical_lines;
  p.bytes = stats.bytes;
  p.fields = stats.fields;
  p.quoted_fields = stats.quoted_fields;
  p.malformed = stats.malformed;
  p.rebuild_mismatches = stats.rebuild_mismatches;
  p.round_trip_ok = stats.malformed == 0 && stats.rebuild_mismatches == 0;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = stats.throughput_mb_s;
  for (const auto& s : stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.errors_by_kind = stats.errors_by_kind;
  p.warnings_by_code = stats.warnings_by_code;
  p.values_by_kind = stats.values_by_kind;
  p.issues = std::move(issues);

  const std::string run_json = rtcsv::RunJsonWriter::to_json(p);

  const std::string slug = make_slug_for(filepath, cli.slug_mode, cli.slug_len);
  std::string err;
  if (!rtcsv::write_report_dir(cli.artifact_root, slug, run_json, rebuilt, &err)) {
    std::cerr << "[check] write_report_dir failed: " << err << "\n";
    return 2;
  }

  std::cout << "[check] " << (p.round_trip_ok ? "ok" : "issues") << ": " << filepath
            << " records=" << stats.records
            << " malformed=" << stats.malformed
            << " mismatches=" << stats.rebuild_mismatches
            << " -> " << (std::filesystem::path(cli.artifact_root) / slug / "run.json").string() << "\n";
  return p.round_trip_ok ? 0 : 3;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) {
    print_usage(std::cerr);
    return 1;
  }
  auto country = rtcsv::country_from_code(cli.country);
  if (!country) {
    std::cerr << "[check] unknown country code: " << cli.country << "\n";
    return 1;
  }

  int rc = 0;
  for (const auto& f : cli.checks) {
    rc = std::max(rc, check_one_file(f, cli, *country));
  }
  return rc;
}
