#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rtcsv {

// True when the tokenizer would still be inside a quoted field at the end
// of `text`. Malformed text is never open.
bool has_open_enclosure(std::string_view text, std::string_view delimiter, std::string_view enclosure);

// Splits on "\r\n", "\r" or "\n" and re-joins physical lines that continue
// an open quoted field. Joined records keep their inner line breaks as found.
std::vector<std::string> split_logical_lines(std::string_view text,
                                             std::string_view delimiter,
                                             std::string_view enclosure);

// Incremental form for line-at-a-time readers.
class LogicalLineJoiner {
public:
  // Return false to stop.
  using RecordCallback = std::function<bool(std::string_view record, std::uint64_t first_line_no)>;

  LogicalLineJoiner(std::string delimiter, std::string enclosure)
    : delimiter_(std::move(delimiter)), enclosure_(std::move(enclosure)) {}

  // `terminator` is the break that ended `physical_line` ("" at end of input).
  // It goes into the record only when the next line continues it.
  bool feed(std::string_view physical_line, const RecordCallback& cb,
            std::string_view terminator = "\n");
  // Flushes a record whose quote never closed.
  bool finish(const RecordCallback& cb);
  // A physical line that was consumed without being fed.
  void skip_line() noexcept { ++line_no_; }

  bool pending() const noexcept { return open_; }
  std::uint64_t physical_lines() const noexcept { return line_no_; }
  std::uint64_t joined_records() const noexcept { return joined_; }

private:
  bool emit(const RecordCallback& cb);

  std::string delimiter_;
  std::string enclosure_;
  std::string buffer_;
  std::string pending_eol_;
  bool open_{false};
  std::uint64_t line_no_{0};
  std::uint64_t first_line_{0};
  std::uint64_t joined_{0};
};

// Feeds every physical line of `text` through a joiner; false if `cb` stopped.
bool for_each_logical_line(std::string_view text,
                           std::string_view delimiter,
                           std::string_view enclosure,
                           const LogicalLineJoiner::RecordCallback& cb);

}
