#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cs {

enum class ValueKind { Bytes, Text, Integer, Number, Boolean, Timestamp, Record };

std::string_view kind_name(ValueKind k) noexcept;
std::optional<ValueKind> parse_kind(std::string_view s);

// Target type of a decode. `kind` is the raw type; `name` optionally carries
// the full type name (e.g. "record<event>").
struct TypeDescriptor {
  ValueKind kind = ValueKind::Bytes;
  std::string name;

  std::string_view raw_name() const noexcept { return kind_name(kind); }
  std::string_view type_name() const noexcept {
    return name.empty() ? kind_name(kind) : std::string_view(name);
  }
};

// Decoded row: CSV fields or JSON object members, in source order.
// keys_ is empty for headerless CSV rows.
class Record {
public:
  Record() = default;
  Record(std::vector<std::string> keys, std::vector<std::string> values)
      : keys_(std::move(keys)), values_(std::move(values)) {}

  std::size_t size() const noexcept { return values_.size(); }
  bool empty() const noexcept { return values_.empty(); }

  const std::string& at(std::size_t i) const { return values_.at(i); }

  // Column name for index i, or "" when there is none.
  std::string_view colname(std::size_t i) const noexcept {
    return i < keys_.size() ? std::string_view(keys_[i]) : std::string_view{};
  }

  // First value whose key equals `key`.
  const std::string* find(std::string_view key) const noexcept;

  void add(std::string key, std::string value);

  const std::vector<std::string>& keys() const noexcept { return keys_; }
  const std::vector<std::string>& values() const noexcept { return values_; }

  bool operator==(const Record& o) const { return keys_ == o.keys_ && values_ == o.values_; }
  bool operator!=(const Record& o) const { return !(*this == o); }

private:
  std::vector<std::string> keys_;
  std::vector<std::string> values_;
};

// monostate is a decoded null. Timestamps are epoch milliseconds.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string, Record>;

// One-line rendering used by the CLI: text as-is, records as k=v joined by tabs.
std::string to_display(const Value& v);

}
