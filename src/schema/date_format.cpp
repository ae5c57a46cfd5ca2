#include "tabload/date_format.h"

#include <cctype>
#include <cstring>

namespace tabload {

DateLocale DateLocale::english() {
  DateLocale loc;
  loc.month_names = {"January", "February", "March",     "April",   "May",      "June",
                     "July",    "August",   "September", "October", "November", "December"};
  loc.month_abbrev = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  loc.day_names = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
  loc.day_abbrev = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  loc.am = "AM";
  loc.pm = "PM";
  return loc;
}

static inline bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

static const int days_in_month_table[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

static inline int get_days_in_month(int year, int month) {
  if (month == 2 && is_leap_year(year))
    return 29;
  return days_in_month_table[month];
}

int32_t ParsedDateTime::to_epoch_days() const {
  return date_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)).days;
}

// Case-insensitive string prefix match. Returns length matched or 0.
static size_t match_string_ci(const char* pos, const char* end, const std::string& target) {
  size_t len = target.size();
  if (static_cast<size_t>(end - pos) < len)
    return 0;
  for (size_t i = 0; i < len; ++i) {
    if (std::tolower(static_cast<unsigned char>(pos[i])) !=
        std::tolower(static_cast<unsigned char>(target[i])))
      return 0;
  }
  return len;
}

// Longest case-insensitive match among names. Returns index or -1.
template <size_t N>
static int match_name(const char*& pos, const char* end, const std::array<std::string, N>& names) {
  int best = -1;
  size_t best_len = 0;
  for (size_t i = 0; i < N; ++i) {
    size_t len = match_string_ci(pos, end, names[i]);
    if (len > best_len) {
      best = static_cast<int>(i);
      best_len = len;
    }
  }
  pos += best_len;
  return best;
}

// Parse up to max_digits digits into result. Returns number of digits parsed.
static int parse_digits(const char*& pos, const char* end, int max_digits, int& result) {
  result = 0;
  int count = 0;
  while (count < max_digits && pos < end && *pos >= '0' && *pos <= '9') {
    result = result * 10 + (*pos - '0');
    pos++;
    count++;
  }
  return count;
}

static bool is_numeric_directive(char spec) {
  return spec != '\0' && std::strchr("YymdeHIMSDFTR", spec) != nullptr;
}

// Numeric directive directly after the current one, as in "%Y%m%d"
static bool followed_by_number(const char* fmt, const char* fmt_end) {
  return fmt_end - fmt >= 2 && fmt[0] == '%' && is_numeric_directive(fmt[1]);
}

static bool expect_char(const char*& pos, const char* end, char c) {
  if (pos >= end || *pos != c)
    return false;
  pos++;
  return true;
}

DateFormat::DateFormat(std::string_view pattern, const DateLocale& locale)
    : pattern_(pattern), locale_(locale) {}

bool DateFormat::parse(std::string_view value, ParsedDateTime& dt) const {
  dt = ParsedDateTime{};
  const char* pos = value.data();
  const char* end = value.data() + value.size();
  const char* fmt = pattern_.data();
  const char* fmt_end = pattern_.data() + pattern_.size();
  int am_pm = -1; // -1 = not set, 0 = AM, 1 = PM
  bool after_number = false;

  while (fmt < fmt_end) {
    if (std::isspace(static_cast<unsigned char>(*fmt))) {
      while (pos < end && std::isspace(static_cast<unsigned char>(*pos)))
        pos++;
      fmt++;
      after_number = false;
      continue;
    }

    if (*fmt != '%') {
      if (!expect_char(pos, end, *fmt))
        return false;
      fmt++;
      after_number = false;
      continue;
    }

    fmt++; // skip '%'
    if (fmt >= fmt_end)
      return false;

    char spec = *fmt++;
    int val = 0;
    // Packed fields need their full width or the split is ambiguous
    const int min_digits = after_number || followed_by_number(fmt, fmt_end) ? 2 : 1;
    after_number = is_numeric_directive(spec);

    switch (spec) {
    case 'Y':
      if (parse_digits(pos, end, 4, val) != 4)
        return false;
      dt.year = val;
      break;
    case 'y':
      if (parse_digits(pos, end, 2, val) != 2)
        return false;
      dt.year = val < 69 ? 2000 + val : 1900 + val;
      break;
    case 'm':
      if (parse_digits(pos, end, 2, val) < min_digits)
        return false;
      dt.month = val;
      break;
    case 'd':
      if (parse_digits(pos, end, 2, val) < min_digits)
        return false;
      dt.day = val;
      break;
    case 'e':
      if (pos < end && *pos == ' ')
        pos++;
      if (parse_digits(pos, end, 2, val) == 0)
        return false;
      dt.day = val;
      break;
    case 'H':
      if (parse_digits(pos, end, 2, val) < min_digits || val > 23)
        return false;
      dt.hour = val;
      break;
    case 'I':
      if (parse_digits(pos, end, 2, val) < min_digits || val < 1 || val > 12)
        return false;
      dt.hour = val % 12;
      break;
    case 'M':
      if (parse_digits(pos, end, 2, val) < min_digits || val > 59)
        return false;
      dt.minute = val;
      break;
    case 'S':
      if (parse_digits(pos, end, 2, val) < min_digits || val > 60)
        return false;
      dt.second = val;
      // Fractional seconds are accepted and dropped
      if (pos < end && *pos == '.') {
        pos++;
        while (pos < end && *pos >= '0' && *pos <= '9')
          pos++;
      }
      break;
    case 'p': {
      size_t len = match_string_ci(pos, end, locale_.am);
      if (len > 0) {
        am_pm = 0;
        pos += len;
        break;
      }
      len = match_string_ci(pos, end, locale_.pm);
      if (len == 0)
        return false;
      am_pm = 1;
      pos += len;
      break;
    }
    case 'b': {
      int idx = match_name(pos, end, locale_.month_abbrev);
      if (idx < 0)
        return false;
      dt.month = idx + 1;
      break;
    }
    case 'B': {
      int idx = match_name(pos, end, locale_.month_names);
      if (idx < 0)
        return false;
      dt.month = idx + 1;
      break;
    }
    case 'a':
      if (match_name(pos, end, locale_.day_abbrev) < 0)
        return false;
      break;
    case 'A':
      if (match_name(pos, end, locale_.day_names) < 0)
        return false;
      break;
    case 'z': {
      // Offset is validated but a Date carries no time zone
      if (pos < end && *pos == 'Z') {
        pos++;
        break;
      }
      if (pos >= end || (*pos != '+' && *pos != '-'))
        return false;
      pos++;
      if (parse_digits(pos, end, 2, val) != 2)
        return false;
      if (pos < end && *pos == ':')
        pos++;
      if (pos < end && *pos >= '0' && *pos <= '9') {
        if (parse_digits(pos, end, 2, val) != 2)
          return false;
      }
      break;
    }
    case 'Z':
      while (pos < end && !std::isspace(static_cast<unsigned char>(*pos)))
        pos++;
      break;
    case '%':
      if (!expect_char(pos, end, '%'))
        return false;
      break;
    case 'D': // %m/%d/%y
      if (parse_digits(pos, end, 2, dt.month) == 0 || !expect_char(pos, end, '/'))
        return false;
      if (parse_digits(pos, end, 2, dt.day) == 0 || !expect_char(pos, end, '/'))
        return false;
      if (parse_digits(pos, end, 2, val) != 2)
        return false;
      dt.year = val < 69 ? 2000 + val : 1900 + val;
      break;
    case 'F': // %Y-%m-%d
      if (parse_digits(pos, end, 4, dt.year) != 4 || !expect_char(pos, end, '-'))
        return false;
      if (parse_digits(pos, end, 2, dt.month) == 0 || !expect_char(pos, end, '-'))
        return false;
      if (parse_digits(pos, end, 2, dt.day) == 0)
        return false;
      break;
    case 'T': // %H:%M:%S
    case 'R': // %H:%M
      if (parse_digits(pos, end, 2, dt.hour) == 0 || dt.hour > 23 || !expect_char(pos, end, ':'))
        return false;
      if (parse_digits(pos, end, 2, dt.minute) == 0 || dt.minute > 59)
        return false;
      if (spec == 'T') {
        if (!expect_char(pos, end, ':'))
          return false;
        if (parse_digits(pos, end, 2, dt.second) == 0 || dt.second > 60)
          return false;
      }
      break;
    case '.':
      // Any single non-digit separator
      if (pos >= end || std::isdigit(static_cast<unsigned char>(*pos)))
        return false;
      pos++;
      break;
    default:
      return false;
    }
  }

  if (am_pm == 1) {
    if (dt.hour != 12)
      dt.hour += 12;
  } else if (am_pm == 0) {
    if (dt.hour == 12)
      dt.hour = 0;
  }

  // Must consume all input
  if (pos != end)
    return false;

  if (dt.month < 1 || dt.month > 12)
    return false;
  if (dt.day < 1 || dt.day > get_days_in_month(dt.year, dt.month))
    return false;

  return true;
}

const std::vector<std::string>& DateParser::default_patterns() {
  static const std::vector<std::string> patterns = {
      "%Y-%m-%d",          "%Y/%m/%d",          "%Y%m%d",
      "%m/%d/%Y",          "%m-%d-%Y",          "%B %d, %Y",
      "%b %d, %Y",         "%d-%b-%Y",          "%Y-%m-%d %H:%M:%S",
      "%Y-%m-%dT%H:%M:%S",
  };
  return patterns;
}

DateParser::DateParser() {
  const DateLocale locale = DateLocale::english();
  for (const auto& p : default_patterns())
    formats_.emplace_back(p, locale);
}

DateParser::DateParser(std::string_view pattern) { formats_.emplace_back(pattern); }

std::optional<Date> DateParser::parse(std::string_view value) const {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
    value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    value.remove_suffix(1);
  if (value.empty())
    return std::nullopt;

  ParsedDateTime dt;
  for (const auto& format : formats_) {
    if (format.parse(value, dt))
      return Date{dt.to_epoch_days()};
  }
  return std::nullopt;
}

} // namespace tabload
