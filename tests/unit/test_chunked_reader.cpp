#include "chunk_stream/byte_source.hpp"
#include "chunk_stream/chunk_decoder.hpp"
#include "chunk_stream/chunk_parser.hpp"
#include "chunk_stream/chunked_reader.hpp"
#include "chunk_stream/errors.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

namespace {

// In-memory source that counts reads and closes, and can fail after
// `fail_after` bytes.
struct ProbeSource : cs::ByteSource {
  std::string data;
  std::size_t pos = 0;
  long fail_after = -1;
  bool close_throws = false;
  std::string declared;
  std::atomic<int>* reads;
  std::atomic<int>* closes;

  ProbeSource(std::string d, std::atomic<int>* r, std::atomic<int>* c)
    : data(std::move(d)), reads(r), closes(c) {}

  int read() override {
    ++*reads;
    if (fail_after >= 0 && pos >= static_cast<std::size_t>(fail_after))
      throw cs::IoError(std::error_code(ECONNRESET, std::generic_category()), "connection reset");
    if (pos >= data.size()) return cs::kEndOfStream;
    return static_cast<unsigned char>(data[pos++]);
  }
  void close() override {
    ++*closes;
    if (close_throws) throw std::system_error(std::make_error_code(std::errc::resource_deadlock_would_occur),
                                              "join failed");
  }
  std::string content_type() const override { return declared; }
};

struct Seen {
  std::string type_name;
  std::vector<std::string> annotations;
  std::string media_type;
  std::string header;
  std::string property;
  bool top_level = true;
};

// Returns the chunk text; throws DecodeError for the chunk "bad".
struct EchoDecoder : cs::ChunkDecoder {
  Seen last;
  cs::Value decode(cs::ByteSource& chunk, const cs::DecodeContext& ctx) override {
    std::string s = cs::read_all(chunk);
    last.type_name = std::string(ctx.type.type_name());
    last.annotations = ctx.annotations;
    last.media_type = ctx.media_type.to_string();
    last.header = cs::header_value(ctx.headers, "x-trace").value_or("");
    auto it = ctx.properties.find("tenant");
    last.property = it == ctx.properties.end() ? "" : it->second;
    last.top_level = ctx.top_level;
    if (s == "bad") throw cs::DecodeError("bad chunk");
    return s;
  }
};

struct Fixture {
  std::atomic<int> reads{0};
  std::atomic<int> closes{0};
  std::shared_ptr<EchoDecoder> decoder = std::make_shared<EchoDecoder>();

  std::unique_ptr<cs::ChunkedReader> make(const std::string& input,
                                          cs::ChunkedReader::Context ctx = {},
                                          long fail_after = -1,
                                          std::string declared = {}) {
    auto src = std::make_unique<ProbeSource>(input, &reads, &closes);
    src->fail_after = fail_after;
    src->declared = std::move(declared);
    return std::make_unique<cs::ChunkedReader>(std::move(src), decoder, std::move(ctx));
  }
};

std::string text(const std::optional<cs::Value>& v) {
  if (!v) return "<none>";
  const auto* s = std::get_if<std::string>(&*v);
  return s ? *s : "<not text>";
}

}

static void test_reads_until_exhaustion() {
  Fixture f;
  auto r = f.make("abc\r\ndef\r\n");
  expect(text(r->read()) == "abc", "first chunk");
  expect(text(r->read()) == "def", "second chunk");
  expect(!r->is_closed(), "open while chunks remain");
  expect(!r->read(), "exhaustion yields no value");
  expect(r->is_closed(), "closed after exhaustion");
  expect(f.closes == 1, "source released once on exhaustion");
  expect(!r->last_error(), "clean end leaves no error");
}

static void test_read_after_close() {
  Fixture f;
  auto r = f.make("abc\r\n");
  r->close();
  const int reads_before = f.reads;
  bool threw = false;
  try { (void)r->read(); } catch (const cs::IllegalState&) { threw = true; }
  expect(threw, "read after close throws IllegalState");
  expect(f.reads == reads_before, "read after close does not touch the source");

  threw = false;
  try { (void)r->read(); } catch (const cs::IllegalState&) { threw = true; }
  expect(threw, "every read after close throws");
}

static void test_idempotent_close() {
  Fixture f;
  auto r = f.make("abc");
  for (int i = 0; i < 5; ++i) r->close();
  expect(r->is_closed(), "closed after close()");
  expect(f.closes == 1, "repeated close releases once");
  r.reset();
  expect(f.closes == 1, "destructor does not release again");
}

static void test_concurrent_close() {
  for (int round = 0; round < 50; ++round) {
    Fixture f;
    auto r = f.make("abc");
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) threads.emplace_back([&] { r->close(); });
    for (auto& t : threads) t.join();
    if (f.closes != 1) { expect(false, "concurrent close releases exactly once"); return; }
  }
}

static void test_destructor_closes() {
  Fixture f;
  { auto r = f.make("abc"); }
  expect(f.closes == 1, "destructor releases the source");
}

static void test_decode_fault_keeps_reader_open() {
  Fixture f;
  auto r = f.make("one\r\nbad\r\nthree");
  expect(text(r->read()) == "one", "chunk before the fault");
  bool threw = false;
  try { (void)r->read(); } catch (const cs::DecodeError&) { threw = true; }
  expect(threw, "decode fault propagates");
  expect(!r->is_closed(), "decode fault leaves the reader open");
  expect(text(r->read()) == "three", "read after a decode fault succeeds");
}

static void test_io_fault_closes() {
  Fixture f;
  auto r = f.make("abc\r\ndef\r\n", {}, 7);
  expect(text(r->read()) == "abc", "chunk before the I/O fault");
  expect(!r->read(), "I/O fault reads as no value");
  expect(r->is_closed(), "I/O fault closes the reader");
  expect(f.closes == 1, "I/O fault releases the source");
  expect(r->last_error() == std::error_code(ECONNRESET, std::generic_category()),
         "last_error reports the I/O fault");
}

static void test_oversize_frame_does_not_resync_on_payload() {
  Fixture f;
  // a 9-byte frame whose payload looks like a frame, then a valid frame
  const std::string input = std::string("\0\0\0\x09", 4) + std::string("\0\0\0\x03", 4) + "EVIL" +
                            std::string("\0\0\0\x02", 4) + "ok";
  auto r = f.make(input);
  cs::LengthPrefixedParser::Config cfg;
  cfg.max_chunk_bytes = 8;
  r->set_parser(std::make_shared<cs::LengthPrefixedParser>(cfg));

  bool framing = false;
  try { (void)r->read(); } catch (const cs::FramingError&) { framing = true; }
  expect(framing, "oversize frame reported");
  expect(!r->is_closed(), "reader open after a framing fault");
  expect(text(r->read()) == "ok", "next read returns the following frame");
  expect(!r->read(), "then end of stream");
}

static void test_close_error_contained() {
  std::atomic<int> reads{0}, closes{0};
  {
    auto src = std::make_unique<ProbeSource>("abc", &reads, &closes);
    src->close_throws = true;
    cs::ChunkedReader r(std::move(src), std::make_shared<EchoDecoder>(), {});
    bool threw = false;
    try { r.close(); } catch (const std::exception&) { threw = true; }
    expect(!threw, "source close failure is not rethrown");
    expect(r.is_closed() && closes == 1, "reader closed despite the failure");
  }
  {
    auto src = std::make_unique<ProbeSource>("abc", &reads, &closes);
    src->close_throws = true;
    cs::ChunkedReader r(std::move(src), std::make_shared<EchoDecoder>(), {});
  }
  expect(closes == 2, "destructor survives a failing source close");
}

static void test_stream_ids() {
  Fixture f;
  auto a = f.make("x");
  auto b = f.make("y");
  expect(a->stream_id() != 0 && b->stream_id() != 0 && a->stream_id() != b->stream_id(),
         "each reader has its own stream id");
}

static void test_chunk_type_defaults() {
  {
    Fixture f;
    auto r = f.make("x");
    expect(r->chunk_type() == cs::MediaType::octet_stream(), "default octet-stream");
  }
  {
    Fixture f;
    auto r = f.make("x", {}, -1, "application/json");
    expect(r->chunk_type().matches("application", "json"), "source declared type");
  }
  {
    Fixture f;
    cs::ChunkedReader::Context ctx;
    cs::add_header(ctx.headers, "Content-Type", "text/csv; charset=utf-8");
    auto r = f.make("x", std::move(ctx), -1, "application/json");
    expect(r->chunk_type().matches("text", "csv"), "Content-Type header wins over the source");
  }
  {
    Fixture f;
    cs::ChunkedReader::Context ctx;
    ctx.media_type = cs::MediaType("text", "plain");
    cs::add_header(ctx.headers, "content-type", "text/csv");
    auto r = f.make("x", std::move(ctx));
    expect(r->chunk_type().matches("text", "plain"), "explicit media type wins");
  }
}

static void test_set_chunk_type() {
  Fixture f;
  auto r = f.make("a\r\nb\r\n");
  r->set_chunk_type("application/x-ndjson");
  expect(r->chunk_type().matches("application", "x-ndjson"), "string override applied");

  bool threw = false;
  try { r->set_chunk_type(""); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "empty media type rejected");
  threw = false;
  try { r->set_chunk_type("nonsense"); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "unparseable media type rejected");
  expect(r->chunk_type().matches("application", "x-ndjson"), "rejected override changes nothing");

  (void)r->read();
  expect(f.decoder->last.media_type == "application/x-ndjson", "decoder sees the override");
  r->set_chunk_type(cs::MediaType("text", "plain"));
  (void)r->read();
  expect(f.decoder->last.media_type == "text/plain", "override applies to later reads");
}

static void test_set_parser_between_reads() {
  Fixture f;
  auto r = f.make("a|b\r\nc|d\r\n");
  expect(std::dynamic_pointer_cast<cs::FixedBoundaryParser>(r->parser())->delimiter() == "\r\n",
         "default parser splits on CRLF");
  expect(text(r->read()) == "a|b", "CRLF framing");
  r->set_parser(cs::make_parser("|"));
  expect(text(r->read()) == "c", "new parser applies to the rest of the stream");
  expect(text(r->read()) == "d\r\n", "remaining bytes framed by the new parser");

  bool threw = false;
  try { r->set_parser(nullptr); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "null parser rejected");
}

static void test_decode_context() {
  Fixture f;
  cs::ChunkedReader::Context ctx;
  ctx.type.kind = cs::ValueKind::Record;
  ctx.type.name = "record<event>";
  ctx.annotations = {"lenient"};
  ctx.media_type = cs::MediaType("application", "json");
  cs::add_header(ctx.headers, "X-Trace", "t-1");
  ctx.properties["tenant"] = "acme";
  auto r = f.make("{}\r\n", std::move(ctx));
  (void)r->read();
  const auto& s = f.decoder->last;
  expect(s.type_name == "record<event>", "type descriptor passed");
  expect(s.annotations == std::vector<std::string>{"lenient"}, "annotations passed");
  expect(s.media_type == "application/json", "media type passed");
  expect(s.header == "t-1", "headers passed");
  expect(s.property == "acme", "properties passed");
  expect(!s.top_level, "chunk is not the top-level entity");
}

static void test_for_each() {
  Fixture f;
  auto r = f.make("1\r\n2\r\n3");
  std::vector<std::string> seen;
  std::size_t n = r->for_each([&](const cs::Value& v) { seen.push_back(std::get<std::string>(v)); });
  expect(n == 3 && seen == std::vector<std::string>{"1", "2", "3"}, "for_each visits every chunk");
  expect(r->is_closed(), "for_each ends closed");
}

static void test_constructor_rejects_nulls() {
  std::atomic<int> reads{0}, closes{0};
  bool threw = false;
  try {
    cs::ChunkedReader r(std::make_unique<ProbeSource>("x", &reads, &closes), nullptr, {});
  } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "null decoder rejected");
  threw = false;
  try {
    cs::ChunkedReader r(nullptr, std::make_shared<EchoDecoder>(), {});
  } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "null source rejected");
}

int main() {
  test_reads_until_exhaustion();
  test_read_after_close();
  test_idempotent_close();
  test_concurrent_close();
  test_destructor_closes();
  test_decode_fault_keeps_reader_open();
  test_io_fault_closes();
  test_oversize_frame_does_not_resync_on_payload();
  test_close_error_contained();
  test_stream_ids();
  test_chunk_type_defaults();
  test_set_chunk_type();
  test_set_parser_between_reads();
  test_decode_context();
  test_for_each();
  test_constructor_rejects_nulls();

  if (failures) { std::cerr << "[FAIL] chunked reader: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] chunked reader\n";
  return 0;
}
