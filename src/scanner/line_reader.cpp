#include "rtcsv/line_reader.hpp"
#include "rtcsv/logical_lines.hpp"
#include <cerrno>
#include <cstdio>
#include <string_view>
#include <vector>

namespace rtcsv {

struct LineReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};
  std::uint64_t dropped{0};
  bool crlf{false};
  bool trailing_nl{false};
  std::string_view eol;

  bool for_each_record(const RecordCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }

    LogicalLineJoiner joiner(cfg.delimiter, cfg.enclosure);
    bool stopped = false;
    auto emit_line = [&](std::string_view line, bool had_nl) {
      ++lines;
      eol = had_nl ? std::string_view("\n") : std::string_view();
      if (had_nl && cfg.strip_cr && !line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
        eol = "\r\n";
        crlf = true;
      }
      if (cfg.join_quoted) {
        if (!joiner.feed(line, cb, eol)) stopped = true;
      } else if (!cb(line, lines)) {
        stopped = true;
      }
    };
    // The line is gone: close any open record before it and keep numbering.
    auto drop_line = [&]() {
      ++lines;
      ++dropped;
      if (cfg.join_quoted) {
        if (!joiner.finish(cb)) stopped = true;
        joiner.skip_line();
      }
      if (cfg.on_oversize) cfg.on_oversize(lines);
    };

    std::vector<char> buf(cfg.chunk_bytes + 1, 0);
    std::string carry;
    carry.reserve(256);
    bool skipping_oversize = false; // rest of a dropped line

    while (!stopped) {
      std::size_t n = std::fread(buf.data(), 1, cfg.chunk_bytes, f);
      if (n == 0 && std::ferror(f)) { last_errno = errno; std::fclose(f); return false; }
      if (n == 0 && std::feof(f))   break;
      bytes += n;
      trailing_nl = buf[n - 1] == '\n';

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (!stopped && start < n) {
        const std::size_t pos = block.find('\n', start);
        const bool hit_nl = (pos != std::string_view::npos);
        std::string_view slice = hit_nl ? block.substr(start, pos - start)
                                        : block.substr(start);

        if (skipping_oversize) {
          if (!hit_nl) break;
          skipping_oversize = false;
          start = pos + 1;
          continue;
        }
        if (carry.size() + slice.size() > cfg.max_record_bytes) {
          carry.clear();
          drop_line();
          if (!hit_nl) { skipping_oversize = true; break; }
          start = pos + 1;
          continue;
        }
        if (!hit_nl) { carry.append(slice); break; }

        if (!carry.empty()) {
          carry.append(slice);
          emit_line(carry, true);
          carry.clear();
        } else {
          emit_line(slice, true);
        }
        start = pos + 1;
      }
    }

    if (!stopped && !carry.empty()) emit_line(carry, false);
    if (!stopped && cfg.join_quoted) (void)joiner.finish(cb);

    std::fclose(f);
    return true;
  }
};

LineReader::LineReader(std::string path)
  : LineReader(std::move(path), Config{}) {}

LineReader::LineReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), std::move(cfg)}) {}

LineReader::~LineReader() { delete p_; }

bool LineReader::for_each_record(const RecordCallback& cb) { return p_->for_each_record(cb); }
int  LineReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t LineReader::physical_lines() const noexcept { return p_->lines; }
std::uint64_t LineReader::oversize_dropped() const noexcept { return p_->dropped; }
bool LineReader::saw_crlf() const noexcept { return p_->crlf; }
bool LineReader::ends_with_newline() const noexcept { return p_->trailing_nl; }
std::string_view LineReader::record_terminator() const noexcept { return p_->eol; }

}
