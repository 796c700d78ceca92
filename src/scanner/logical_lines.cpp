#include "rtcsv/logical_lines.hpp"
#include "rtcsv/line_tokenizer.hpp"

namespace rtcsv {

bool has_open_enclosure(std::string_view text, std::string_view delimiter, std::string_view enclosure) {
  return quote_state_at_end(text, delimiter, enclosure) == QuoteState::Open;
}

bool for_each_logical_line(std::string_view text,
                           std::string_view delimiter,
                           std::string_view enclosure,
                           const LogicalLineJoiner::RecordCallback& cb) {
  LogicalLineJoiner joiner{std::string(delimiter), std::string(enclosure)};
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t pos = text.find_first_of("\r\n", start);
    if (pos == std::string_view::npos) {
      if (!joiner.feed(text.substr(start), cb, std::string_view())) return false;
      break;
    }
    std::size_t next = pos + 1;
    if (text[pos] == '\r' && next < text.size() && text[next] == '\n') ++next;
    if (!joiner.feed(text.substr(start, pos - start), cb, text.substr(pos, next - pos))) return false;
    start = next;
  }
  return joiner.finish(cb);
}

std::vector<std::string> split_logical_lines(std::string_view text,
                                             std::string_view delimiter,
                                             std::string_view enclosure) {
  std::vector<std::string> out;
  (void)for_each_logical_line(text, delimiter, enclosure, [&](std::string_view rec, std::uint64_t) {
    out.emplace_back(rec);
    return true;
  });
  return out;
}

bool LogicalLineJoiner::feed(std::string_view physical_line, const RecordCallback& cb,
                             std::string_view terminator) {
  ++line_no_;
  if (!open_) {
    if (quote_state_at_end(physical_line, delimiter_, enclosure_) != QuoteState::Open) {
      return cb(physical_line, line_no_);
    }
    buffer_.assign(physical_line);
    pending_eol_.assign(terminator);
    first_line_ = line_no_;
    open_ = true;
    return true;
  }

  buffer_ += pending_eol_;
  buffer_.append(physical_line);
  pending_eol_.assign(terminator);
  if (quote_state_at_end(buffer_, delimiter_, enclosure_) == QuoteState::Open) return true;
  // Closed or malformed: the record ends here.
  ++joined_;
  return emit(cb);
}

bool LogicalLineJoiner::finish(const RecordCallback& cb) {
  if (!open_) return true;
  return emit(cb);
}

bool LogicalLineJoiner::emit(const RecordCallback& cb) {
  open_ = false;
  const bool keep_going = cb(buffer_, first_line_);
  buffer_.clear();
  pending_eol_.clear();
  return keep_going;
}

}
