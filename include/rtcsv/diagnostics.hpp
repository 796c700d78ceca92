#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtcsv {

enum class Severity { Info, Warning };

// Non-fatal findings: suspicious but representable input.
struct Diagnostic {
  Severity    severity = Severity::Warning;
  std::string code;     // "enclosure-in-value", "excel-text-prefix", "excel-exponent"
  std::string message;
};

std::string_view to_string(Severity s);

class DiagnosticSink {
public:
  virtual ~DiagnosticSink() = default;
  virtual void report(const Diagnostic& d) = 0;
};

// Collects everything it is given.
class DiagnosticLog : public DiagnosticSink {
public:
  void report(const Diagnostic& d) override { entries_.push_back(d); }

  const std::vector<Diagnostic>& entries() const noexcept { return entries_; }
  std::size_t size() const noexcept { return entries_.size(); }
  std::size_t count(std::string_view code) const;
  void clear() noexcept { entries_.clear(); }

private:
  std::vector<Diagnostic> entries_;
};

// Prints "[warn] <code>: <message>" lines, std::cerr by default.
class StderrSink : public DiagnosticSink {
public:
  StderrSink();
  explicit StderrSink(std::ostream& os) : os_(&os) {}
  void report(const Diagnostic& d) override;

private:
  std::ostream* os_;
};

// Forwards to two sinks; either may be null.
class TeeSink : public DiagnosticSink {
public:
  TeeSink(DiagnosticSink* a, DiagnosticSink* b) : a_(a), b_(b) {}
  void report(const Diagnostic& d) override {
    if (a_) a_->report(d);
    if (b_) b_->report(d);
  }

private:
  DiagnosticSink* a_;
  DiagnosticSink* b_;
};

inline void emit(DiagnosticSink* sink, Severity sev, std::string code, std::string message) {
  if (sink) sink->report(Diagnostic{sev, std::move(code), std::move(message)});
}

}
