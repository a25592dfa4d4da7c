#include "chunk_stream/chunk_parser.hpp"
#include "chunk_stream/byte_source.hpp"

#include <stdexcept>
#include <utility>

namespace cs {

FixedBoundaryParser::FixedBoundaryParser(std::string delimiter)
  : delimiter_(std::move(delimiter)) {
  if (delimiter_.empty()) throw std::invalid_argument("chunk delimiter must not be empty");

  fallback_.assign(delimiter_.size(), 0);
  std::size_t k = 0;
  for (std::size_t i = 1; i < delimiter_.size(); ++i) {
    while (k > 0 && delimiter_[i] != delimiter_[k]) k = fallback_[k - 1];
    if (delimiter_[i] == delimiter_[k]) ++k;
    fallback_[i] = k;
  }
}

std::optional<std::string> FixedBoundaryParser::read_chunk(ByteSource& in) {
  const std::size_t dlen = delimiter_.size();
  std::string chunk;
  // Bytes of a match in progress are always delimiter_[0, matched), so the
  // delimiter itself serves as the pending-match buffer.
  std::size_t matched = 0;
  int data = kEndOfStream;

  do {
    matched = 0;
    while ((data = in.read()) != kEndOfStream) {
      const char b = static_cast<char>(data);
      // Partial match broken: flush the bytes that can no longer start a
      // delimiter, keep the longest prefix that still can, re-check b.
      while (matched > 0 && b != delimiter_[matched]) {
        const std::size_t keep = fallback_[matched - 1];
        chunk.append(delimiter_, 0, matched - keep);
        matched = keep;
      }
      if (b == delimiter_[matched]) {
        if (++matched == dlen) break;
      } else {
        chunk.push_back(b);
      }
    }
  } while (data != kEndOfStream && chunk.empty());

  // stream ended inside a partial match: those bytes are content
  if (data == kEndOfStream && matched > 0) chunk.append(delimiter_, 0, matched);

  if (chunk.empty()) return std::nullopt;
  return chunk;
}

std::shared_ptr<ChunkParser> make_parser(std::string_view boundary) {
  return std::make_shared<FixedBoundaryParser>(std::string(boundary));
}

std::shared_ptr<ChunkParser> make_parser(const std::vector<std::uint8_t>& boundary) {
  return std::make_shared<FixedBoundaryParser>(std::string(boundary.begin(), boundary.end()));
}

}
