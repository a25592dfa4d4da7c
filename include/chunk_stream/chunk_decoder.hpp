#pragma once
#include "chunk_stream/headers.hpp"
#include "chunk_stream/media_type.hpp"
#include "chunk_stream/value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cs {

class ByteSource;

// Everything a decoder may look at besides the chunk bytes.
struct DecodeContext {
  const TypeDescriptor& type;
  const std::vector<std::string>& annotations;
  const MediaType& media_type;
  const HeaderMap& headers;
  const PropertyMap& properties;
  bool top_level = false; // false: the source is one chunk, not the whole entity
  std::uint64_t stream_id = 0; // distinct per ChunkedReader; 0 outside a reader
};

// Converts one chunk into a Value. Failures throw DecodeError.
class ChunkDecoder {
public:
  virtual ~ChunkDecoder() = default;

  virtual bool can_decode(const TypeDescriptor& type, const MediaType& media_type) const;
  virtual Value decode(ByteSource& chunk, const DecodeContext& ctx) = 0;
};

// Drains `src` into a string.
std::string read_all(ByteSource& src);

}
