#include "chunk_stream/media_type.hpp"

#include <cctype>
#include <stdexcept>

namespace cs {

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// RFC 7230 tchar
static bool is_token(std::string_view s) {
  if (s.empty()) return false;
  static constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
  for (char c : s) {
    if (std::isalnum(static_cast<unsigned char>(c))) continue;
    if (extra.find(c) == std::string_view::npos) return false;
  }
  return true;
}

MediaType::MediaType() : type_("*"), subtype_("*") {}

MediaType::MediaType(std::string type, std::string subtype, Params params)
  : type_(lower(type)), subtype_(lower(subtype)), params_(std::move(params)) {
  for (auto& p : params_) p.first = lower(p.first);
}

MediaType MediaType::octet_stream() { return MediaType("application", "octet-stream"); }

std::optional<MediaType> MediaType::parse(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;

  std::size_t semi = s.find(';');
  std::string_view full = trim(s.substr(0, semi));
  std::size_t slash = full.find('/');
  if (slash == std::string_view::npos) return std::nullopt;
  std::string_view type = trim(full.substr(0, slash));
  std::string_view sub  = trim(full.substr(slash + 1));
  if (!is_token(type) || !is_token(sub)) return std::nullopt;
  if (type == "*" && sub != "*") return std::nullopt;

  Params params;
  while (semi != std::string_view::npos) {
    s.remove_prefix(semi + 1);
    std::size_t eq = s.find('=');
    if (eq == std::string_view::npos) {
      if (trim(s).empty()) break; // tolerate a trailing ';'
      return std::nullopt;
    }
    std::string_view name = trim(s.substr(0, eq));
    if (!is_token(name)) return std::nullopt;
    s.remove_prefix(eq + 1);
    s = trim(s);

    std::string value;
    if (!s.empty() && s.front() == '"') {
      std::size_t i = 1;
      bool closed = false;
      for (; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) { value.push_back(s[++i]); continue; }
        if (s[i] == '"') { closed = true; ++i; break; }
        value.push_back(s[i]);
      }
      if (!closed) return std::nullopt;
      s.remove_prefix(i);
      semi = s.find(';');
      if (!trim(s.substr(0, semi)).empty()) return std::nullopt;
    } else {
      semi = s.find(';');
      std::string_view raw = trim(s.substr(0, semi));
      if (!is_token(raw)) return std::nullopt;
      value.assign(raw);
    }
    params.emplace_back(lower(name), std::move(value));
  }

  return MediaType(std::string(type), std::string(sub), std::move(params));
}

MediaType MediaType::value_of(std::string_view s) {
  auto mt = parse(s);
  if (!mt) throw std::invalid_argument("invalid media type: '" + std::string(s) + "'");
  return *mt;
}

std::optional<std::string> MediaType::param(std::string_view name) const {
  const std::string key = lower(name);
  for (const auto& p : params_) if (p.first == key) return p.second;
  return std::nullopt;
}

bool MediaType::has_suffix(std::string_view suffix) const noexcept {
  std::size_t plus = subtype_.rfind('+');
  if (plus == std::string::npos) return false;
  return std::string_view(subtype_).substr(plus + 1) == suffix;
}

bool MediaType::is_compatible(const MediaType& other) const noexcept {
  if (is_wildcard_type() || other.is_wildcard_type()) return true;
  if (type_ != other.type_) return false;
  return is_wildcard_subtype() || other.is_wildcard_subtype() || subtype_ == other.subtype_;
}

bool MediaType::matches(std::string_view type, std::string_view subtype) const noexcept {
  return type_ == type && subtype_ == subtype;
}

std::string MediaType::to_string() const {
  std::string out = type_ + "/" + subtype_;
  for (const auto& [k, v] : params_) {
    out += "; " + k + "=";
    if (is_token(v)) { out += v; continue; }
    out.push_back('"');
    for (char c : v) { if (c == '"' || c == '\\') out.push_back('\\'); out.push_back(c); }
    out.push_back('"');
  }
  return out;
}

}
