#include "chunk_stream/decoder_registry.hpp"
#include "chunk_stream/csv_decoder.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/json_decoder.hpp"
#include "chunk_stream/scalar_decoder.hpp"
#include "chunk_stream/text_decoder.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cs {

void DecoderRegistry::add(std::shared_ptr<ChunkDecoder> decoder) {
  if (!decoder) throw std::invalid_argument("decoder must not be null");
  decoders_.push_back(std::move(decoder));
}

ChunkDecoder* DecoderRegistry::find(const TypeDescriptor& type, const MediaType& media_type) const {
  for (const auto& d : decoders_) {
    if (d->can_decode(type, media_type)) return d.get();
  }
  return nullptr;
}

bool DecoderRegistry::can_decode(const TypeDescriptor& type, const MediaType& media_type) const {
  return find(type, media_type) != nullptr;
}

Value DecoderRegistry::decode(ByteSource& chunk, const DecodeContext& ctx) {
  ChunkDecoder* d = find(ctx.type, ctx.media_type);
  if (!d) {
    throw DecodeError("no decoder for " + std::string(ctx.type.type_name()) + " as " +
                      ctx.media_type.to_string());
  }
  return d->decode(chunk, ctx);
}

std::shared_ptr<DecoderRegistry> make_default_registry() {
  auto reg = std::make_shared<DecoderRegistry>();
  reg->add(std::make_shared<JsonDecoder>());
  reg->add(std::make_shared<CsvDecoder>());
  ParsePolicy strict;
  strict.on_error = ParsePolicy::OnError::Strict;
  reg->add(std::make_shared<ScalarDecoder>(strict));
  reg->add(std::make_shared<TextDecoder>());
  return reg;
}

}
