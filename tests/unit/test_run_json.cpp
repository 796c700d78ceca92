#include "rtcsv/metrics.hpp"
#include "rtcsv/path_utils.hpp"
#include "rtcsv/run_json.hpp"
#include <iostream>
#include <string>
#include <simdjson.h>

int main(){
  rtcsv::MetricsRegistry m;
  m.add_record(3, 1);
  m.add_record(3, 0);
  m.add_value(rtcsv::ValueKind::Float);
  m.add_value(rtcsv::ValueKind::Float);
  m.add_value(rtcsv::ValueKind::Text);
  m.add_error("UnterminatedField");
  m.add_warning("enclosure-in-value");
  m.add_bytes(2 * 1024 * 1024);
  m.start_stage("parse");
  m.end_stage("parse");
  const rtcsv::CheckStats s = m.snapshot(1000.0);
  if (s.records != 2 || s.fields != 6 || s.quoted_fields != 1 || s.malformed != 1) {
    std::cerr << "[FAIL] counters\n"; return 1;
  }
  if (s.values_by_kind.at("float") != 2 || s.stages.size() != 1 || s.throughput_mb_s != 2.0) {
    std::cerr << "[FAIL] breakdowns\n"; return 1;
  }

  rtcsv::RunJsonPayload p;
  p.filename = "dir/we\"ird\tname.csv";
  p.delimiter = "\t";
  p.enclosure = "\"";
  p.country = "DE";
  p.records = s.records;
  p.malformed = s.malformed;
  p.round_trip_ok = false;
  p.errors_by_kind = s.errors_by_kind;
  p.issues.push_back(rtcsv::RunJsonIssue{7, "UnterminatedField", 4, "x,\"ab", "unterminated quoted field at index 4"});
  const std::string js = rtcsv::RunJsonWriter::to_json(p);

  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(js);
  simdjson::ondemand::document doc;
  if (parser.iterate(padded).get(doc)) { std::cerr << "[FAIL] invalid JSON: " << js << "\n"; return 1; }

  std::string_view fname, delim;
  uint64_t issue_line = 0;
  simdjson::ondemand::array issues;
  if (doc["filename"].get_string().get(fname) || doc["dialect"]["delimiter"].get_string().get(delim) ||
      doc["issues"].get_array().get(issues)) {
    std::cerr << "[FAIL] keys missing: " << js << "\n"; return 1;
  }
  for (auto issue : issues) {
    if (issue["line"].get_uint64().get(issue_line)) { std::cerr << "[FAIL] issue line missing\n"; return 1; }
    break;
  }
  if (fname != "dir/we\"ird\tname.csv" || delim != "\t" || issue_line != 7) {
    std::cerr << "[FAIL] values did not survive escaping\n"; return 1;
  }

  if (rtcsv::make_slug("/data/in/bank.csv", "basename", 64) != "bank.csv" ||
      rtcsv::make_slug("/data/in/bank.csv", "keypath", 64) != "data-in-bank.csv" ||
      rtcsv::make_slug("/data/in/bank.csv", "hashprefix", 12).size() > 12 ||
      rtcsv::make_slug("/a", "hashprefix", 12) != rtcsv::make_slug("/a", "hashprefix", 12)) {
    std::cerr << "[FAIL] slugs\n"; return 1;
  }
  if (rtcsv::default_delimiter(rtcsv::detect_format("x.TSV")) != "\t" ||
      rtcsv::default_delimiter(rtcsv::detect_format("x.txt")) != ";" ||
      rtcsv::default_delimiter(rtcsv::detect_format("x.dat")) != ",") {
    std::cerr << "[FAIL] delimiter by extension\n"; return 1;
  }

  std::cout << "[PASS] run.json " << js.size() << " bytes\n";
  return 0;
}
