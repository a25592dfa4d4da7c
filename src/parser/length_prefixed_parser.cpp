#include "chunk_stream/chunk_parser.hpp"
#include "chunk_stream/byte_source.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/log.hpp"

#include <string>

namespace cs {

LengthPrefixedParser::LengthPrefixedParser() : LengthPrefixedParser(Config{}) {}

LengthPrefixedParser::LengthPrefixedParser(Config cfg) : cfg_(cfg) {}

std::optional<std::string> LengthPrefixedParser::read_chunk(ByteSource& in) {
  while (true) {
    int c = in.read();
    if (c == kEndOfStream) return std::nullopt;

    std::uint32_t len = static_cast<std::uint32_t>(c);
    for (int i = 1; i < 4; ++i) {
      c = in.read();
      if (c == kEndOfStream) throw FramingError("truncated chunk length header");
      len = (len << 8) | static_cast<std::uint32_t>(c);
    }

    if (len > cfg_.max_chunk_bytes) {
      log_error("framing", "Chunk size ", len, " exceeds limit of ", cfg_.max_chunk_bytes);
      // drop the payload so the next read starts at a frame boundary
      for (std::uint32_t i = 0; i < len; ++i) {
        if (in.read() == kEndOfStream) {
          throw FramingError("truncated oversize chunk: expected " + std::to_string(len) +
                             " bytes, got " + std::to_string(i));
        }
      }
      throw FramingError("chunk size " + std::to_string(len) + " exceeds limit of " +
                         std::to_string(cfg_.max_chunk_bytes));
    }

    std::string payload;
    payload.reserve(len);
    for (std::uint32_t i = 0; i < len; ++i) {
      c = in.read();
      if (c == kEndOfStream) {
        throw FramingError("truncated chunk: expected " + std::to_string(len) +
                           " bytes, got " + std::to_string(i));
      }
      payload.push_back(static_cast<char>(c));
    }

    if (!payload.empty()) return payload;
  }
}

}
