#pragma once
#include "chunk_stream/chunk_decoder.hpp"
#include "chunk_stream/chunk_parser.hpp"
#include "chunk_stream/headers.hpp"
#include "chunk_stream/media_type.hpp"
#include "chunk_stream/value.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cs {

class ByteSource;

// Pulls delimiter-separated chunks from a ByteSource and decodes each one on
// read(). Open until close() or until the source is exhausted or fails.
//
// One consumer at a time: read(), set_parser() and set_chunk_type() need
// external synchronization. close() and is_closed() may be called from any
// thread.
class ChunkedReader {
public:
  struct Context {
    TypeDescriptor type;
    std::vector<std::string> annotations;
    std::optional<MediaType> media_type; // default: Content-Type header, then the source
    HeaderMap headers;
    PropertyMap properties;
  };

  using ValueCallback = std::function<void(const Value&)>;

  // Throws std::invalid_argument when source or decoder is null.
  ChunkedReader(std::unique_ptr<ByteSource> source,
                std::shared_ptr<ChunkDecoder> decoder,
                Context ctx);
  ~ChunkedReader();

  ChunkedReader(const ChunkedReader&) = delete;
  ChunkedReader& operator=(const ChunkedReader&) = delete;

  // Next decoded chunk; nullopt once the stream ended or an I/O error
  // occurred (the reader is closed in both cases). Throws IllegalState when
  // already closed. Decoder exceptions propagate and leave the reader open.
  std::optional<Value> read();

  // Calls cb for every remaining chunk; returns how many were read.
  std::size_t for_each(const ValueCallback& cb);

  // Releases the source exactly once, however many threads call it.
  void close();
  bool is_closed() const noexcept { return closed_.load(); }

  const MediaType& chunk_type() const noexcept { return media_type_; }
  void set_chunk_type(MediaType media_type);
  // Throws std::invalid_argument for an empty or malformed value.
  void set_chunk_type(std::string_view media_type);

  const std::shared_ptr<ChunkParser>& parser() const noexcept { return parser_; }
  // Throws std::invalid_argument for a null parser.
  void set_parser(std::shared_ptr<ChunkParser> parser);

  const TypeDescriptor& type() const noexcept { return type_; }
  const HeaderMap& headers() const noexcept { return headers_; }

  // Error that closed the reader; empty after a clean end-of-stream.
  std::error_code last_error() const noexcept { return last_error_; }

  // Passed to decoders as DecodeContext::stream_id.
  std::uint64_t stream_id() const noexcept { return stream_id_; }

private:
  std::unique_ptr<ByteSource> source_;
  std::shared_ptr<ChunkDecoder> decoder_;
  std::shared_ptr<ChunkParser> parser_;

  TypeDescriptor type_;
  std::vector<std::string> annotations_;
  MediaType media_type_;
  HeaderMap headers_;
  PropertyMap properties_;

  const std::uint64_t stream_id_;
  std::atomic<bool> closed_{false};
  std::error_code last_error_;
};

}
