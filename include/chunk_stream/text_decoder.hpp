#pragma once
#include "chunk_stream/chunk_decoder.hpp"

namespace cs {

// Bytes and Text kinds, any media type. Text with charset=utf-8 is
// validated.
class TextDecoder final : public ChunkDecoder {
public:
  struct Config {
    bool strip_cr = false; // trim one trailing '\r' (CRLF framing on "\n")
  };

  TextDecoder() = default;
  explicit TextDecoder(Config cfg) : cfg_(cfg) {}

  bool can_decode(const TypeDescriptor& type, const MediaType& media_type) const override;
  Value decode(ByteSource& chunk, const DecodeContext& ctx) override;

private:
  Config cfg_;
};

}
