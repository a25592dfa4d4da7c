#include "chunk_stream/date_parse.hpp"

#include <string_view>

// Civil-date arithmetic instead of timegm(): no TZ or platform dependency.

namespace cs {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_fixed(std::string_view s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) { if (!is_digit(s[i])) return false; v = v*10 + (s[i] - '0'); }
  out = v; return true;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
static std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static int days_in_month(int y, int m) {
  static constexpr int dim[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
  return (m == 2 && leap) ? 29 : dim[m - 1];
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  int Y, M, D, h = 0, m = 0, sec = 0, ms = 0;

  if (!(parse_fixed(s, 0, 4, Y) && s.size() > 4 && s[4] == '-' && parse_fixed(s, 5, 2, M) &&
        s.size() > 7 && s[7] == '-' && parse_fixed(s, 8, 2, D)))
    return std::nullopt;
  if (M < 1 || M > 12 || D < 1 || D > days_in_month(Y, M)) return std::nullopt;

  std::size_t i = 10;
  if (i < s.size() && (s[i] == 'T' || s[i] == ' ')) {
    ++i;
    if (!(parse_fixed(s, i, 2, h) && i + 2 < s.size() && s[i+2] == ':' && parse_fixed(s, i + 3, 2, m)))
      return std::nullopt;
    i += 5;
    if (i < s.size() && s[i] == ':') {
      if (!parse_fixed(s, i + 1, 2, sec)) return std::nullopt;
      i += 3;
      if (i < s.size() && s[i] == '.') {
        std::size_t j = ++i;
        while (i < s.size() && is_digit(s[i])) ++i;
        if (i == j) return std::nullopt;
        // milliseconds from the first three fraction digits
        int scale = 100;
        for (std::size_t k = j; k < i && k < j + 3; ++k, scale /= 10) ms += (s[k] - '0') * scale;
      }
    }
    if (h > 23 || m > 59 || sec > 60) return std::nullopt;
  }

  int offset_min = 0;
  if (i < s.size()) {
    if (s[i] == 'Z' || s[i] == 'z') {
      ++i;
    } else if (s[i] == '+' || s[i] == '-') {
      const int sign = (s[i] == '-') ? -1 : 1;
      int oh = 0, om = 0;
      if (!parse_fixed(s, i + 1, 2, oh)) return std::nullopt;
      i += 3;
      if (i < s.size() && s[i] == ':') ++i;
      if (i < s.size()) {
        if (!parse_fixed(s, i, 2, om)) return std::nullopt;
        i += 2;
      }
      if (oh > 23 || om > 59) return std::nullopt;
      offset_min = sign * (oh * 60 + om);
    }
  }
  if (i != s.size()) return std::nullopt;

  const std::int64_t days = days_from_civil(Y, static_cast<unsigned>(M), static_cast<unsigned>(D));
  const std::int64_t secs = days * 86400 + h * 3600 + m * 60 + sec - offset_min * 60;
  return secs * 1000 + ms;
}

}
