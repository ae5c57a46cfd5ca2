#pragma once

#include "tabload/types.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabload {

// Month/day names used by %b %B %a %A
struct DateLocale {
  std::array<std::string, 12> month_names;  // Full: January..December
  std::array<std::string, 12> month_abbrev; // Abbreviated: Jan..Dec
  std::array<std::string, 7> day_names;     // Full: Sunday..Saturday
  std::array<std::string, 7> day_abbrev;    // Abbreviated: Sun..Sat
  std::string am = "AM";
  std::string pm = "PM";

  static DateLocale english();
};

// Intermediate result of pattern matching
struct ParsedDateTime {
  int year = 1970;
  int month = 1; // 1-12
  int day = 1;   // 1-31
  int hour = 0;
  int minute = 0;
  int second = 0;

  // Convert to days since Unix epoch (1970-01-01)
  int32_t to_epoch_days() const;
};

// Single strptime-style pattern. Thread-safe after construction.
class DateFormat {
public:
  // Specifiers: %Y %y %m %d %e %b %B %a %A %H %I %M %S %p %z %Z %% %D %F %T %R %.
  // Whitespace in the pattern matches any run of whitespace (including none).
  explicit DateFormat(std::string_view pattern, const DateLocale& locale = DateLocale::english());

  // Returns true on success. The whole value must be consumed and the
  // resulting calendar date must exist.
  bool parse(std::string_view value, ParsedDateTime& dt) const;

  const std::string& pattern() const { return pattern_; }

private:
  std::string pattern_;
  DateLocale locale_;
};

/// Ordered set of patterns; the first pattern that matches wins.
class DateParser {
public:
  /// Patterns tried when the caller gives none.
  static const std::vector<std::string>& default_patterns();

  /// Uses default_patterns().
  DateParser();

  /// Uses only the given pattern.
  explicit DateParser(std::string_view pattern);

  /// Leading and trailing blanks are ignored.
  std::optional<Date> parse(std::string_view value) const;

  const std::vector<DateFormat>& formats() const { return formats_; }

private:
  std::vector<DateFormat> formats_;
};

} // namespace tabload
