#pragma once
#include "chunk_stream/byte_source.hpp"
#include "chunk_stream/headers.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace cs {

// Body of an HTTP GET, streamed through cpp-httplib on a producer thread.
// read() blocks until a byte arrives. A transport failure or a non-2xx
// status surfaces as IoError from read(). close() aborts the transfer and
// wakes blocked readers, which then see end-of-stream.
class HttpSource final : public ByteSource {
public:
  struct Config {
    std::size_t queue_bytes   = 256 * 1024; // producer waits above this
    int connect_timeout_sec   = 10;
    int read_timeout_sec      = 30;
    HeaderMap request_headers;
  };

  // url: http://host[:port][/path]. Throws std::invalid_argument otherwise.
  explicit HttpSource(std::string url);
  HttpSource(std::string url, Config cfg);
  ~HttpSource() override;

  HttpSource(const HttpSource&) = delete;
  HttpSource& operator=(const HttpSource&) = delete;

  int read() override;
  void close() override;

  // These wait until the response headers arrived (or the transfer failed).
  std::string content_type() const override;
  HeaderMap headers() const;
  int status() const;

  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
