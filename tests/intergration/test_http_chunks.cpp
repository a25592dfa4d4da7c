#include "chunk_stream/chunked_reader.hpp"
#include "chunk_stream/decoder_registry.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/http_source.hpp"

#include <httplib.h>

#include <cstdint>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Body pieces deliberately split inside records and inside the delimiter.
static const std::vector<std::string> kPieces = {
  "{\"id\": 1, \"ev\": \"a\"}\r", "\n{\"id\": 2,", " \"ev\": \"b\"}\r\n",
  "\r\n", "{\"id\": 3, \"ev\": \"c\"}"
};

int main() {
  httplib::Server svr;
  svr.Get("/events", [](const httplib::Request&, httplib::Response& res) {
    res.set_header("X-Stream", "events");
    res.set_chunked_content_provider("application/x-ndjson",
      [](size_t offset, httplib::DataSink& sink) {
        (void)offset;
        for (const auto& p : kPieces) sink.write(p.data(), p.size());
        sink.done();
        return true;
      });
  });
  svr.Get("/numbers", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("1\n2\n3\n", "text/plain");
  });

  const int port = svr.bind_to_any_port("127.0.0.1");
  if (port <= 0) { std::cerr << "[ERR] could not bind test server\n"; return 2; }
  std::thread server([&] { svr.listen_after_bind(); });
  svr.wait_until_ready();
  const std::string base = "http://127.0.0.1:" + std::to_string(port);

  // Chunk type defaults to the response Content-Type
  {
    auto http = std::make_unique<cs::HttpSource>(base + "/events");
    cs::ChunkedReader::Context ctx;
    ctx.type.kind = cs::ValueKind::Record;
    ctx.headers = http->headers();
    expect(http->status() == 200, "status 200");
    cs::ChunkedReader r(std::move(http), cs::make_default_registry(), std::move(ctx));
    expect(r.chunk_type().matches("application", "x-ndjson"), "chunk type from Content-Type");
    expect(cs::header_value(r.headers(), "x-stream").value_or("") == "events", "response headers kept");

    std::vector<std::string> ids;
    r.for_each([&](const cs::Value& v) { ids.push_back(*std::get<cs::Record>(v).find("id")); });
    expect(ids == std::vector<std::string>{"1", "2", "3"}, "three records across split writes");
    expect(r.is_closed() && !r.last_error(), "clean end of body");
  }

  // Explicit chunk type wins over the declared one
  {
    cs::ChunkedReader::Context ctx;
    ctx.type.kind = cs::ValueKind::Integer;
    ctx.media_type = cs::MediaType::value_of("text/plain");
    cs::ChunkedReader r(std::make_unique<cs::HttpSource>(base + "/numbers"),
                        cs::make_default_registry(), std::move(ctx));
    r.set_parser(cs::make_parser("\n"));
    std::int64_t sum = 0;
    r.for_each([&](const cs::Value& v) { sum += std::get<std::int64_t>(v); });
    expect(sum == 6, "integers over http");
  }

  // Non-2xx status ends the stream and is reported through last_error
  {
    cs::ChunkedReader::Context ctx;
    ctx.type.kind = cs::ValueKind::Text;
    auto http = std::make_unique<cs::HttpSource>(base + "/missing");
    expect(http->status() == 404, "status 404");
    cs::ChunkedReader r(std::move(http), cs::make_default_registry(), std::move(ctx));
    auto v = r.read();
    expect(!v, "no chunk from a 404");
    expect(r.is_closed(), "reader closed after failed request");
    expect(r.last_error() == std::errc::protocol_error, "protocol_error recorded");
  }

  // Close before consuming anything
  {
    cs::HttpSource src(base + "/events");
    src.close();
    expect(src.read() == cs::kEndOfStream, "closed http source reads end-of-stream");
    src.close();
  }

  // Bad urls are rejected up front
  {
    bool threw = false;
    try { cs::HttpSource src("ftp://example.com/x"); } catch (const std::invalid_argument&) { threw = true; }
    expect(threw, "non-http url rejected");
  }

  svr.stop();
  server.join();

  if (failures) { std::cerr << "[FAIL] http chunks: " << failures << " failure(s)\n"; return 1; }
  std::cout << "[PASS] http chunks\n";
  return 0;
}
