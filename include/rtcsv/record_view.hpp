#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "rtcsv/line.hpp"

namespace rtcsv {

// Lightweight view over a data line; header_ optionally names the columns.
class RecordView {
public:
  RecordView() = default;
  RecordView(const Line* header, const Line* fields)
      : header_(header), fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->count_fields() : 0; }

  const Field* at(std::size_t i) const {
    return fields_ ? fields_->field(i) : nullptr;
  }

  // Column name for index i, empty without a header.
  std::string colname(std::size_t i) const {
    const Field* h = header_ ? header_->field(i) : nullptr;
    return h ? h->value() : std::string();
  }

  // First column whose header value equals `name`.
  const Field* find(std::string_view name) const {
    if (!header_) return nullptr;
    for (std::size_t i = 0; i < header_->count_fields(); ++i) {
      if (header_->fields()[i].value() == name) return at(i);
    }
    return nullptr;
  }

  const Line* header() const noexcept { return header_; }
  const Line* fields() const noexcept { return fields_; }

private:
  const Line* header_{nullptr};
  const Line* fields_{nullptr};
};

}
