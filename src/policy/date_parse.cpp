#include "rtcsv/date_parse.hpp"
#include <cstdio>
#include <ctime>
#include <string_view>

namespace rtcsv {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static void append_padded(std::string& out, long long v, int width) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%0*lld", width, v);
  out += buf;
}

bool operator==(const DateTime& a, const DateTime& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day &&
         a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}
bool operator!=(const DateTime& a, const DateTime& b) { return !(a == b); }

int days_in_month(int year, int month) {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (month < 1 || month > 12) return 0;
  if (month == 2) {
    const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    return leap ? 29 : 28;
  }
  return days[month - 1];
}

bool is_valid(const DateTime& dt) {
  if (dt.month < 1 || dt.month > 12) return false;
  if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) return false;
  if (dt.hour < 0 || dt.hour > 23) return false;
  if (dt.minute < 0 || dt.minute > 59) return false;
  if (dt.second < 0 || dt.second > 59) return false;
  return true;
}

std::int64_t to_epoch_seconds(const DateTime& dt) {
  std::tm tm{}; tm.tm_year = dt.year - 1900; tm.tm_mon = dt.month - 1; tm.tm_mday = dt.day;
  tm.tm_hour = dt.hour; tm.tm_min = dt.minute; tm.tm_sec = dt.second;
#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  return static_cast<std::int64_t>(t);
}

DateTime from_epoch_seconds(std::int64_t secs) {
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  DateTime dt;
  dt.year = tm.tm_year + 1900; dt.month = tm.tm_mon + 1; dt.day = tm.tm_mday;
  dt.hour = tm.tm_hour; dt.minute = tm.tm_min; dt.second = tm.tm_sec;
  return dt;
}

std::optional<DateTime> parse_with_pattern(std::string_view s, std::string_view pattern) {
  DateTime dt;
  std::size_t i = 0;
  auto take = [&](std::size_t width, int& out) {
    if (i + width > s.size()) return false;
    if (!parse_int(s.substr(i, width), out)) return false;
    i += width;
    return true;
  };

  for (std::size_t p = 0; p < pattern.size(); ++p) {
    const char pc = pattern[p];
    if (pc != '%' || p + 1 >= pattern.size()) {
      if (i >= s.size() || s[i] != pc) return std::nullopt;
      ++i;
      continue;
    }
    const char conv = pattern[++p];
    switch (conv) {
      case 'Y': if (!take(4, dt.year)) return std::nullopt; break;
      case 'y': {
        int yy = 0;
        if (!take(2, yy)) return std::nullopt;
        dt.year = yy < 70 ? 2000 + yy : 1900 + yy;
        break;
      }
      case 'm': if (!take(2, dt.month))  return std::nullopt; break;
      case 'd': if (!take(2, dt.day))    return std::nullopt; break;
      case 'H': if (!take(2, dt.hour))   return std::nullopt; break;
      case 'M': if (!take(2, dt.minute)) return std::nullopt; break;
      case 'S': if (!take(2, dt.second)) return std::nullopt; break;
      case 's': {
        std::size_t j = i;
        bool neg = false;
        if (j < s.size() && s[j] == '-') { neg = true; ++j; }
        const std::size_t digits_at = j;
        std::int64_t v = 0;
        while (j < s.size() && is_digit(s[j]) && (j - digits_at) < 18) { v = v*10 + (s[j] - '0'); ++j; }
        if (j == digits_at) return std::nullopt;
        i = j;
        dt = from_epoch_seconds(neg ? -v : v);
        break;
      }
      case '%':
        if (i >= s.size() || s[i] != '%') return std::nullopt;
        ++i;
        break;
      default:
        return std::nullopt;
    }
  }
  if (i != s.size()) return std::nullopt;
  if (!is_valid(dt)) return std::nullopt;
  return dt;
}

std::string format_with_pattern(const DateTime& dt, std::string_view pattern) {
  std::string out;
  out.reserve(pattern.size() + 8);
  for (std::size_t p = 0; p < pattern.size(); ++p) {
    const char pc = pattern[p];
    if (pc != '%' || p + 1 >= pattern.size()) { out += pc; continue; }
    switch (pattern[++p]) {
      case 'Y': append_padded(out, dt.year, 4); break;
      case 'y': append_padded(out, ((dt.year % 100) + 100) % 100, 2); break;
      case 'm': append_padded(out, dt.month, 2); break;
      case 'd': append_padded(out, dt.day, 2); break;
      case 'H': append_padded(out, dt.hour, 2); break;
      case 'M': append_padded(out, dt.minute, 2); break;
      case 'S': append_padded(out, dt.second, 2); break;
      case 's': out += std::to_string(to_epoch_seconds(dt)); break;
      case '%': out += '%'; break;
      default:  out += '%'; out += pattern[p]; break;
    }
  }
  return out;
}

const std::vector<std::string>& date_patterns_for(Country c) {
  static const std::vector<std::string> day_first = {
    "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%d",
    "%d.%m.%Y %H:%M:%S", "%d.%m.%Y %H:%M", "%d.%m.%Y", "%d.%m.%y",
    "%d/%m/%Y %H:%M:%S", "%d/%m/%Y", "%d-%m-%Y",
    "%m/%d/%Y %H:%M:%S", "%m/%d/%Y", "%m-%d-%Y",
  };
  static const std::vector<std::string> month_first = {
    "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%d",
    "%m/%d/%Y %H:%M:%S", "%m/%d/%Y %H:%M", "%m/%d/%Y", "%m-%d-%Y",
    "%d.%m.%Y %H:%M:%S", "%d.%m.%Y", "%d/%m/%Y", "%d-%m-%Y",
  };
  static const std::vector<std::string> year_first = {
    "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M", "%Y-%m-%d",
    "%Y/%m/%d %H:%M:%S", "%Y/%m/%d", "%Y.%m.%d",
    "%d.%m.%Y", "%m/%d/%Y",
  };
  switch (date_order(c)) {
    case DateOrder::MonthDayYear: return month_first;
    case DateOrder::YearMonthDay: return year_first;
    case DateOrder::DayMonthYear: break;
  }
  return day_first;
}

std::optional<std::pair<DateTime, std::string>> detect_date(std::string_view s, Country c) {
  // Every pattern needs at least "dd.mm.yy".
  if (s.size() < 8 || !is_digit(s.front())) return std::nullopt;
  for (const auto& pat : date_patterns_for(c)) {
    auto dt = parse_with_pattern(s, pat);
    if (!dt) continue;
    if (format_with_pattern(*dt, pat) != s) continue;
    return std::make_pair(*dt, pat);
  }
  return std::nullopt;
}

}
