#include "chunk_stream/scalar_decoder.hpp"
#include "chunk_stream/errors.hpp"

#include <string>
#include <string_view>

namespace cs {

static std::string_view trim_ws(std::string_view s) {
  auto ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!s.empty() && ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && ws(s.back())) s.remove_suffix(1);
  return s;
}

bool ScalarDecoder::can_decode(const TypeDescriptor& type, const MediaType& media_type) const {
  switch (type.kind) {
    case ValueKind::Integer:
    case ValueKind::Number:
    case ValueKind::Boolean:
    case ValueKind::Timestamp:
      return media_type.is_wildcard_type() || media_type.type() == "text";
    default:
      return false;
  }
}

Value ScalarDecoder::decode(ByteSource& chunk, const DecodeContext& ctx) {
  const std::string raw = read_all(chunk);
  const std::string_view s = trim_ws(raw);

  if (policy_.on_error != ParsePolicy::OnError::Strict && policy_.is_null_token(s)) {
    return std::monostate{};
  }

  Value out;
  bool ok = false;
  switch (ctx.type.kind) {
    case ValueKind::Integer:
      if (auto v = policy_.parse_integer(s)) { out = *v; ok = true; }
      break;
    case ValueKind::Number:
      if (auto v = policy_.parse_number(s)) { out = *v; ok = true; }
      break;
    case ValueKind::Boolean:
      if (auto v = policy_.parse_bool(s)) { out = *v; ok = true; }
      break;
    case ValueKind::Timestamp:
      if (auto v = policy_.parse_date(s)) { out = *v; ok = true; }
      break;
    default:
      throw DecodeError("scalar decoder cannot produce " + std::string(ctx.type.type_name()));
  }
  if (ok) return out;

  switch (policy_.on_error) {
    case ParsePolicy::OnError::Null:    return std::monostate{};
    case ParsePolicy::OnError::Lenient: return std::string(s);
    case ParsePolicy::OnError::Strict:  break;
  }
  throw DecodeError("cannot decode '" + std::string(s) + "' as " + std::string(ctx.type.type_name()));
}

}
