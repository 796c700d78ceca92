#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "rtcsv/line.hpp"
#include "rtcsv/line_reader.hpp"
#include "rtcsv/line_tokenizer.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

// Mix of bare numbers, quoted text and doubled enclosure runs.
static std::string make_synth_csv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "rtcsv_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ";"; }
  out << "\n";
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      switch (c % 4) {
        case 0: out << (r%10) << "," << (c*37%100); break;
        case 1: out << "\"text " << r << "\""; break;
        case 2: out << "\"\"" << c << "\"\""; break;
        default: out << (r % 2 ? "yes" : "no"); break;
      }
      if (c+1<cols) out << ";";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string csv_path;        // if empty -> synth
  std::string delimiter = ";";
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--csv") a.csv_path = val;
    else if (key=="--delimiter") a.delimiter = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: tokenizer_bench [--csv=path] [--delimiter=;] [--rows=N] [--cols=M] [--iters=K]\n"
        "If the path is omitted, a synthetic file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void report(int k, std::uint64_t nrec, std::uint64_t bytes, double sec) {
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  iter " << k
            << ": records=" << nrec
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (mib/sec) << " MiB/s"
            << "  records/s=" << (nrec/sec) << "\n";
}

static rtcsv::LineReader::Config reader_config(const rtcsv::CsvConfig& cfg) {
  rtcsv::LineReader::Config rc;
  rc.delimiter = cfg.delimiter;
  rc.enclosure = cfg.enclosure;
  return rc;
}

// Split only.
static void bench_split(const std::string& path, const rtcsv::CsvConfig& cfg, int iters) {
  std::cout << "\n[split] file=" << path << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    rtcsv::QuoteRunTokenizer tok(cfg);
    rtcsv::LineReader rd(path, reader_config(cfg));
    std::vector<std::string_view> parts;
    std::uint64_t nrec=0;

    auto t0 = clk::now();
    const bool ok = rd.for_each_record([&](std::string_view s, std::uint64_t){
      if (tok.split(s, parts)) ++nrec;
      return true;
    });
    auto t1 = clk::now();
    if (!ok) { std::cerr << "[bench] cannot read " << path << "\n"; return; }
    report(k, nrec, rd.bytes_read(), std::chrono::duration<double>(t1-t0).count());
  }
}

// Split, infer every field, rebuild from typed state.
static void bench_round_trip(const std::string& path, const rtcsv::CsvConfig& cfg, int iters) {
  std::cout << "\n[round-trip] file=" << path << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    rtcsv::LineReader rd(path, reader_config(cfg));
    std::uint64_t nrec=0, mismatches=0;

    auto t0 = clk::now();
    const bool ok = rd.for_each_record([&](std::string_view s, std::uint64_t){
      auto line = rtcsv::Line::from_string(s, cfg);
      if (!line) return true;
      ++nrec;
      if (line->to_string(std::nullopt, std::string_view(cfg.enclosure)) != s) ++mismatches;
      return true;
    });
    auto t1 = clk::now();
    if (!ok) { std::cerr << "[bench] cannot read " << path << "\n"; return; }
    report(k, nrec, rd.bytes_read(), std::chrono::duration<double>(t1-t0).count());
    if (mismatches) std::cout << "  mismatches=" << mismatches << "\n";
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string csv = a.csv_path;
  if (csv.empty() || !fs::exists(csv)) csv = make_synth_csv(a.rows, a.cols);

  rtcsv::CsvConfig cfg;
  cfg.delimiter = a.delimiter;
  bench_split(csv, cfg, a.iters);
  bench_round_trip(csv, cfg, a.iters);
  return 0;
}
