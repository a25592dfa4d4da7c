#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

// Header multimap as delivered by the transport; names keep their case.
using HeaderMap = std::map<std::string, std::vector<std::string>>;

// Request-scoped properties handed to decoders untouched.
using PropertyMap = std::map<std::string, std::string>;

// First value of `name` (case-insensitive), if any.
std::optional<std::string> header_value(const HeaderMap& headers, std::string_view name);

void add_header(HeaderMap& headers, std::string name, std::string value);

}
