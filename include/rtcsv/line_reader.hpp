#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rtcsv {

// Chunked file reader that yields logical records: physical lines are
// re-joined, with their own line breaks, while a quoted field is open.
class LineReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per physical line
    bool        strip_cr         = true;            // CRLF counts as one terminator
    bool        join_quoted      = true;
    std::string delimiter        = ",";
    std::string enclosure        = "\"";
    // Called with the physical line number of every line over max_record_bytes.
    std::function<void(std::uint64_t line_no)> on_oversize;
  };

  explicit LineReader(std::string path);      // uses default Config{}
  LineReader(std::string path, Config cfg);
  ~LineReader();
  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Return false from the callback to stop early.
  using RecordCallback = std::function<bool(std::string_view record, std::uint64_t first_line_no)>;

  // False on I/O failure (see last_error()).
  bool for_each_record(const RecordCallback& cb);

  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t physical_lines() const noexcept;
  std::uint64_t oversize_dropped() const noexcept;
  bool saw_crlf() const noexcept;
  bool ends_with_newline() const noexcept;
  // Line break that ended the record being delivered: "\n", "\r\n" or ""
  // at end of input. Valid inside the callback.
  std::string_view record_terminator() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
