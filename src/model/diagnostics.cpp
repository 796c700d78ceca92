#include "rtcsv/diagnostics.hpp"
#include <iostream>

namespace rtcsv {

std::string_view to_string(Severity s) {
  return s == Severity::Info ? "info" : "warn";
}

std::size_t DiagnosticLog::count(std::string_view code) const {
  std::size_t n = 0;
  for (const auto& d : entries_) if (d.code == code) ++n;
  return n;
}

StderrSink::StderrSink() : os_(&std::cerr) {}

void StderrSink::report(const Diagnostic& d) {
  (*os_) << "[" << to_string(d.severity) << "] " << d.code << ": " << d.message << "\n";
}

}
