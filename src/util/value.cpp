#include "chunk_stream/value.hpp"

#include <cctype>
#include <cstdio>

namespace cs {

std::string_view kind_name(ValueKind k) noexcept {
  switch (k) {
    case ValueKind::Bytes:     return "bytes";
    case ValueKind::Text:      return "text";
    case ValueKind::Integer:   return "integer";
    case ValueKind::Number:    return "number";
    case ValueKind::Boolean:   return "boolean";
    case ValueKind::Timestamp: return "timestamp";
    case ValueKind::Record:    return "record";
  }
  return "bytes";
}

std::optional<ValueKind> parse_kind(std::string_view s) {
  std::string l(s);
  for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l == "bytes")     return ValueKind::Bytes;
  if (l == "text")      return ValueKind::Text;
  if (l == "integer" || l == "int") return ValueKind::Integer;
  if (l == "number")    return ValueKind::Number;
  if (l == "boolean" || l == "bool") return ValueKind::Boolean;
  if (l == "timestamp") return ValueKind::Timestamp;
  if (l == "record")    return ValueKind::Record;
  return std::nullopt;
}

const std::string* Record::find(std::string_view key) const noexcept {
  for (size_t i = 0; i < keys_.size() && i < values_.size(); ++i) {
    if (keys_[i] == key) return &values_[i];
  }
  return nullptr;
}

void Record::add(std::string key, std::string value) {
  // keep keys_ aligned with values_ when earlier fields had no key
  if (keys_.size() < values_.size()) keys_.resize(values_.size());
  keys_.push_back(std::move(key));
  values_.push_back(std::move(value));
}

namespace {

struct DisplayVisitor {
  std::string operator()(std::monostate) const { return "null"; }
  std::string operator()(bool b) const { return b ? "true" : "false"; }
  std::string operator()(std::int64_t i) const { return std::to_string(i); }
  std::string operator()(double d) const {
    char tmp[64];
    int n = std::snprintf(tmp, sizeof(tmp), "%.17g", d);
    return std::string(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
  }
  std::string operator()(const std::string& s) const { return s; }
  std::string operator()(const Record& r) const {
    std::string out;
    for (size_t i = 0; i < r.size(); ++i) {
      if (i) out.push_back('\t');
      auto k = r.colname(i);
      if (!k.empty()) { out.append(k); out.push_back('='); }
      out.append(r.at(i));
    }
    return out;
  }
};

}

std::string to_display(const Value& v) { return std::visit(DisplayVisitor{}, v); }

}
