#include "chunk_stream/parse_policy.hpp"
#include "chunk_stream/date_parse.hpp"

#include <charconv>
#include <cctype>
#include <string_view>
#include <system_error>

#include <fast_float/fast_float.h>

namespace cs {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ParsePolicy::parse_integer(std::string_view s) const {
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  std::int64_t out;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> ParsePolicy::parse_date(std::string_view s) const {
  if (date.mode == "iso8601") return parse_iso8601_ms(s);
  if (date.mode == "epoch_ms") return parse_integer(s);
  return std::nullopt;
}

std::optional<bool> ParsePolicy::parse_bool(std::string_view s) const {
  for (const auto& t : boolean.true_tokens) {
    if (boolean.case_sensitive ? (s == t) : ieq(s, t)) return true;
  }
  for (const auto& f : boolean.false_tokens) {
    if (boolean.case_sensitive ? (s == f) : ieq(s, f)) return false;
  }
  return std::nullopt;
}

bool ParsePolicy::is_null_token(std::string_view s) const {
  for (const auto& n : null_tokens) if (s == n) return true;
  return false;
}

}
