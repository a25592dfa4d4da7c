#include "chunk_stream/chunked_reader.hpp"
#include "chunk_stream/byte_source.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/log.hpp"

#include <atomic>
#include <exception>
#include <stdexcept>
#include <utility>

namespace cs {

static MediaType default_chunk_type(const std::optional<MediaType>& given,
                                    const HeaderMap& headers,
                                    const ByteSource& source) {
  if (given) return *given;
  if (auto h = header_value(headers, "Content-Type")) {
    if (auto mt = MediaType::parse(*h)) return *mt;
    log_warn("reader", "ignoring malformed Content-Type header: '", *h, "'");
  }
  const std::string declared = source.content_type();
  if (!declared.empty()) {
    if (auto mt = MediaType::parse(declared)) return *mt;
    log_warn("reader", "ignoring malformed source content type: '", declared, "'");
  }
  return MediaType::octet_stream();
}

static std::uint64_t next_stream_id() {
  static std::atomic<std::uint64_t> next{1};
  return next.fetch_add(1);
}

ChunkedReader::ChunkedReader(std::unique_ptr<ByteSource> source,
                             std::shared_ptr<ChunkDecoder> decoder,
                             Context ctx)
  : source_(std::move(source)),
    decoder_(std::move(decoder)),
    parser_(make_parser("\r\n")),
    type_(std::move(ctx.type)),
    annotations_(std::move(ctx.annotations)),
    headers_(std::move(ctx.headers)),
    properties_(std::move(ctx.properties)),
    stream_id_(next_stream_id()) {
  if (!source_) throw std::invalid_argument("chunked reader needs a byte source");
  if (!decoder_) throw std::invalid_argument("chunked reader needs a decoder");
  media_type_ = default_chunk_type(ctx.media_type, headers_, *source_);
}

ChunkedReader::~ChunkedReader() { close(); }

std::optional<Value> ChunkedReader::read() {
  if (closed_.load()) throw IllegalState("chunked reader is closed");

  std::optional<std::string> chunk;
  try {
    chunk = parser_->read_chunk(*source_);
  } catch (const IoError& e) {
    log_debug("reader", "I/O failure while reading chunk: ", e.what());
    last_error_ = e.code();
  }

  if (!chunk) {
    close();
    return std::nullopt;
  }

  MemorySource chunk_source(std::move(*chunk));
  const DecodeContext ctx{type_, annotations_, media_type_, headers_, properties_, false, stream_id_};
  return decoder_->decode(chunk_source, ctx);
}

std::size_t ChunkedReader::for_each(const ValueCallback& cb) {
  std::size_t n = 0;
  while (auto v = read()) {
    cb(*v);
    ++n;
  }
  return n;
}

void ChunkedReader::close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true)) return;
  try {
    source_->close();
  } catch (const std::exception& e) {
    log_debug("reader", "error closing chunk source: ", e.what());
  }
}

void ChunkedReader::set_chunk_type(MediaType media_type) { media_type_ = std::move(media_type); }

void ChunkedReader::set_chunk_type(std::string_view media_type) {
  if (media_type.empty()) throw std::invalid_argument("chunk media type must not be empty");
  media_type_ = MediaType::value_of(media_type);
}

void ChunkedReader::set_parser(std::shared_ptr<ChunkParser> parser) {
  if (!parser) throw std::invalid_argument("chunk parser must not be null");
  parser_ = std::move(parser);
}

}
