#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

// type/subtype with optional ;name=value parameters. Type, subtype and
// parameter names are stored lower-case; parameter values keep their case.
class MediaType {
public:
  using Params = std::vector<std::pair<std::string, std::string>>;

  MediaType();  // */*
  MediaType(std::string type, std::string subtype, Params params = {});

  // Returns nullopt for empty or malformed input.
  static std::optional<MediaType> parse(std::string_view s);
  // Like parse() but throws std::invalid_argument.
  static MediaType value_of(std::string_view s);

  static MediaType octet_stream();

  const std::string& type() const noexcept { return type_; }
  const std::string& subtype() const noexcept { return subtype_; }
  const Params& params() const noexcept { return params_; }
  std::optional<std::string> param(std::string_view name) const;

  bool is_wildcard_type() const noexcept { return type_ == "*"; }
  bool is_wildcard_subtype() const noexcept { return subtype_ == "*"; }

  // Structured syntax suffix check, e.g. has_suffix("json") for
  // application/ld+json.
  bool has_suffix(std::string_view suffix) const noexcept;

  // True when either side's wildcards cover the other (parameters ignored).
  bool is_compatible(const MediaType& other) const noexcept;

  // Same type and subtype, parameters ignored.
  bool matches(std::string_view type, std::string_view subtype) const noexcept;

  std::string to_string() const;

  bool operator==(const MediaType& o) const {
    return type_ == o.type_ && subtype_ == o.subtype_ && params_ == o.params_;
  }
  bool operator!=(const MediaType& o) const { return !(*this == o); }

private:
  std::string type_;
  std::string subtype_;
  Params params_;
};

}
