#pragma once
#include <string>
#include <string_view>

namespace cs {

// Media type guessed from a file extension (.json, .jsonl/.ndjson, .csv,
// .txt/.log); "" when unknown.
std::string content_type_for_path(std::string_view path);

}
