#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rtcsv/locale.hpp"
#include "rtcsv/typed_value.hpp"

namespace rtcsv {

// Canonical rendering for date-times without a captured pattern.
inline constexpr std::string_view kCanonicalDatePattern = "%Y-%m-%d %H:%M:%S";

// Pattern tokens: %Y (4 digits), %y (2 digits), %m %d %H %M %S (2 digits),
// %s (Unix seconds), %% (literal '%'). Widths are strict.
std::optional<DateTime> parse_with_pattern(std::string_view s, std::string_view pattern);
std::string format_with_pattern(const DateTime& dt, std::string_view pattern);

int  days_in_month(int year, int month);
bool is_valid(const DateTime& dt);

std::int64_t to_epoch_seconds(const DateTime& dt);
DateTime     from_epoch_seconds(std::int64_t secs);

// Candidate patterns in the order the country's exports use them.
const std::vector<std::string>& date_patterns_for(Country c);

// First pattern that matches and reproduces `s` exactly.
std::optional<std::pair<DateTime, std::string>> detect_date(std::string_view s, Country c);

}
