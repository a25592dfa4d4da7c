#pragma once
#include "chunk_stream/chunk_decoder.hpp"

#include <cstddef>

namespace cs {

struct JsonConfig {
  std::size_t cap_nested_value_bytes = 32 * 1024; // raw text kept for arrays/objects
};

// application/json, application/x-ndjson and +json chunks, parsed with
// simdjson on-demand. Objects decode to Record; scalars to the requested
// kind; null to monostate.
class JsonDecoder final : public ChunkDecoder {
public:
  JsonDecoder() = default;
  explicit JsonDecoder(JsonConfig cfg) : cfg_(cfg) {}

  bool can_decode(const TypeDescriptor& type, const MediaType& media_type) const override;
  Value decode(ByteSource& chunk, const DecodeContext& ctx) override;

private:
  JsonConfig cfg_;
};

}
