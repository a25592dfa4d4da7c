#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

struct DatePolicy {
  // "iso8601" (text) or "epoch_ms" (integer milliseconds)
  std::string mode = "iso8601";
};

struct BoolPolicy {
  std::vector<std::string> true_tokens  = {"true", "1", "yes", "on"};
  std::vector<std::string> false_tokens = {"false", "0", "no", "off"};
  bool case_sensitive = false;
};

// How scalar text is turned into typed values.
struct ParsePolicy {
  // Behavior when a value fails to parse:
  // strict -> DecodeError; lenient -> keep as string; null -> set null
  enum class OnError { Strict, Lenient, Null };

  OnError on_error = OnError::Null;
  DatePolicy date;
  BoolPolicy boolean;
  std::vector<std::string> null_tokens = {"", "null", "NULL", "NA", "NaN"};

  // Number parse via fast_float; the whole input must be consumed.
  std::optional<double> parse_number(std::string_view s) const;

  std::optional<std::int64_t> parse_integer(std::string_view s) const;

  // Milliseconds since epoch.
  std::optional<std::int64_t> parse_date(std::string_view s) const;

  std::optional<bool> parse_bool(std::string_view s) const;

  bool is_null_token(std::string_view s) const;
};

}
