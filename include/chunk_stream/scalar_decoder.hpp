#pragma once
#include "chunk_stream/chunk_decoder.hpp"
#include "chunk_stream/parse_policy.hpp"

#include <utility>

namespace cs {

// Integer, Number, Boolean and Timestamp kinds from text/* chunks.
// Surrounding whitespace is ignored.
class ScalarDecoder final : public ChunkDecoder {
public:
  ScalarDecoder() = default;
  explicit ScalarDecoder(ParsePolicy policy) : policy_(std::move(policy)) {}

  bool can_decode(const TypeDescriptor& type, const MediaType& media_type) const override;
  Value decode(ByteSource& chunk, const DecodeContext& ctx) override;

  const ParsePolicy& policy() const noexcept { return policy_; }

private:
  ParsePolicy policy_;
};

}
