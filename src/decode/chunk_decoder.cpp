#include "chunk_stream/chunk_decoder.hpp"
#include "chunk_stream/byte_source.hpp"

namespace cs {

bool ChunkDecoder::can_decode(const TypeDescriptor&, const MediaType&) const { return true; }

std::string read_all(ByteSource& src) {
  std::string out;
  int c;
  while ((c = src.read()) != kEndOfStream) out.push_back(static_cast<char>(c));
  return out;
}

}
