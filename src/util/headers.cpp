#include "chunk_stream/headers.hpp"

#include <cctype>
#include <utility>

namespace cs {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<std::string> header_value(const HeaderMap& headers, std::string_view name) {
  for (const auto& [k, vals] : headers) {
    if (ieq(k, name) && !vals.empty()) return vals.front();
  }
  return std::nullopt;
}

void add_header(HeaderMap& headers, std::string name, std::string value) {
  headers[std::move(name)].push_back(std::move(value));
}

}
