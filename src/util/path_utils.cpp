#include "chunk_stream/path_utils.hpp"

#include <cctype>
#include <filesystem>

namespace cs {

std::string content_type_for_path(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".json") return "application/json";
  if (ext == ".jsonl" || ext == ".ndjson") return "application/x-ndjson";
  if (ext == ".csv") return "text/csv";
  if (ext == ".txt" || ext == ".log") return "text/plain";
  return {};
}

}
