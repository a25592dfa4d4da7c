#include "chunk_stream/json_decoder.hpp"
#include "chunk_stream/date_parse.hpp"
#include "chunk_stream/errors.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

static std::string_view trim_ws(std::string_view s) {
  auto ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!s.empty() && ws(s.front())) s.remove_prefix(1);
  while (!s.empty() && ws(s.back())) s.remove_suffix(1);
  return s;
}

static std::string copy_capped(std::string_view s, size_t cap) {
  if (s.size() <= cap) return std::string(s);
  if (cap <= 3) return std::string(s.substr(0, cap));
  std::string out; out.reserve(cap);
  out.append(s.substr(0, cap - 3));
  out.append("...");
  return out;
}

static std::string json_type_name(simdjson::ondemand::json_type t) {
  switch (t) {
    case simdjson::ondemand::json_type::array:   return "array";
    case simdjson::ondemand::json_type::object:  return "object";
    case simdjson::ondemand::json_type::number:  return "number";
    case simdjson::ondemand::json_type::string:  return "string";
    case simdjson::ondemand::json_type::boolean: return "boolean";
    case simdjson::ondemand::json_type::null:    return "null";
    default:                                     return "unknown";
  }
}

bool JsonDecoder::can_decode(const TypeDescriptor& type, const MediaType& media_type) const {
  if (type.kind == ValueKind::Bytes) return false;
  return media_type.matches("application", "json") ||
         media_type.matches("application", "x-ndjson") ||
         media_type.has_suffix("json");
}

// Object members become Record fields: strings unescaped, numbers as their
// source text, booleans as true/false, null as "", arrays and objects as
// raw JSON capped at cap_nested_value_bytes.
static Record decode_object(simdjson::ondemand::object obj, const JsonConfig& cfg) {
  Record rec;
  for (auto field : obj) {
    std::string_view k = field.unescaped_key();
    simdjson::ondemand::value v = field.value();
    std::string val;
    switch (v.type().value()) {
      case simdjson::ondemand::json_type::number:
        val.assign(trim_ws(v.raw_json_token()));
        break;
      case simdjson::ondemand::json_type::string: {
        std::string_view s = v.get_string();
        val.assign(s);
        break;
      }
      case simdjson::ondemand::json_type::boolean:
        val = bool(v.get_bool()) ? "true" : "false";
        break;
      case simdjson::ondemand::json_type::null:
        break;
      case simdjson::ondemand::json_type::array: {
        std::string_view raw = v.get_array().raw_json();
        val = copy_capped(trim_ws(raw), cfg.cap_nested_value_bytes);
        break;
      }
      default: {
        std::string_view raw = v.get_object().raw_json();
        val = copy_capped(trim_ws(raw), cfg.cap_nested_value_bytes);
        break;
      }
    }
    rec.add(std::string(k), std::move(val));
  }
  return rec;
}

Value JsonDecoder::decode(ByteSource& chunk, const DecodeContext& ctx) {
  const std::string text = read_all(chunk);

  // thread-local parser, reused across chunks
  thread_local simdjson::ondemand::parser parser;
  simdjson::padded_string padded(text);

  try {
    auto doc = parser.iterate(padded);
    const auto t = doc.type().value();
    const ValueKind want = ctx.type.kind;

    Value out;
    if (t == simdjson::ondemand::json_type::null) {
      out = std::monostate{};
      (void)doc.is_null().value();
    } else if (want == ValueKind::Record) {
      if (t != simdjson::ondemand::json_type::object)
        throw DecodeError("expected JSON object, got " + json_type_name(t));
      out = decode_object(doc.get_object(), cfg_);
    } else if (want == ValueKind::Text && t == simdjson::ondemand::json_type::string) {
      std::string_view s = doc.get_string();
      out = std::string(s);
    } else if (want == ValueKind::Integer && t == simdjson::ondemand::json_type::number) {
      out = std::int64_t(doc.get_int64());
    } else if (want == ValueKind::Number && t == simdjson::ondemand::json_type::number) {
      out = double(doc.get_double());
    } else if (want == ValueKind::Boolean && t == simdjson::ondemand::json_type::boolean) {
      out = bool(doc.get_bool());
    } else if (want == ValueKind::Timestamp && t == simdjson::ondemand::json_type::number) {
      out = std::int64_t(doc.get_int64());
    } else if (want == ValueKind::Timestamp && t == simdjson::ondemand::json_type::string) {
      std::string_view s = doc.get_string();
      auto ms = parse_iso8601_ms(s);
      if (!ms) throw DecodeError("invalid timestamp: '" + std::string(s) + "'");
      out = *ms;
    } else {
      throw DecodeError("cannot decode JSON " + json_type_name(t) + " as " +
                        std::string(ctx.type.type_name()));
    }

    if (!doc.at_end()) throw DecodeError("trailing content after JSON value");
    return out;
  } catch (const simdjson::simdjson_error& e) {
    throw DecodeError(std::string("invalid JSON chunk: ") + e.what());
  }
}

}
