#pragma once
#include "chunk_stream/chunk_decoder.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace cs {

// Ordered decoder list; decode() dispatches to the first decoder that
// accepts the (type, media type) pair.
class DecoderRegistry final : public ChunkDecoder {
public:
  // Throws std::invalid_argument for a null decoder.
  void add(std::shared_ptr<ChunkDecoder> decoder);
  std::size_t size() const noexcept { return decoders_.size(); }

  ChunkDecoder* find(const TypeDescriptor& type, const MediaType& media_type) const;

  bool can_decode(const TypeDescriptor& type, const MediaType& media_type) const override;
  // Throws DecodeError when no decoder accepts the pair.
  Value decode(ByteSource& chunk, const DecodeContext& ctx) override;

private:
  std::vector<std::shared_ptr<ChunkDecoder>> decoders_;
};

// JSON, CSV, scalar (strict) and text decoders, in that order. Each call
// returns fresh decoder instances.
std::shared_ptr<DecoderRegistry> make_default_registry();

}
