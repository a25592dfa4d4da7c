#include "chunk_stream/byte_source.hpp"

#include <utility>

namespace cs {

MemorySource::MemorySource(std::string bytes, std::string content_type)
  : bytes_(std::move(bytes)), content_type_(std::move(content_type)) {}

int MemorySource::read() {
  if (closed_ || pos_ >= bytes_.size()) return kEndOfStream;
  return static_cast<unsigned char>(bytes_[pos_++]);
}

void MemorySource::close() { closed_ = true; }

std::size_t MemorySource::remaining() const noexcept {
  return closed_ ? 0 : bytes_.size() - pos_;
}

}
