#include "chunk_stream/byte_source.hpp"
#include "chunk_stream/chunk_parser.hpp"
#include "chunk_stream/chunked_reader.hpp"
#include "chunk_stream/decoder_registry.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/http_source.hpp"
#include "chunk_stream/log.hpp"
#include "chunk_stream/media_type.hpp"
#include "chunk_stream/value.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string delimiter = "\r\n";
  bool length_prefixed = false;
  std::string type = "text";
  std::string media_type;
  std::string url;
  std::string log_level;
  long max_chunks = -1;
  std::string input = "-";
};

void usage(std::ostream& os) {
  os <<
    "Usage: chunk-stream [--delimiter=STR] [--length-prefixed] [--type=KIND]\n"
    "                    [--media-type=TYPE] [--url=URL] [--log-level=LEVEL]\n"
    "                    [--max-chunks=N] [FILE|-]\n"
    "  KIND:  bytes|text|integer|number|boolean|timestamp|record (default text)\n"
    "  STR accepts \\r \\n \\t \\0 \\\\ \\xHH escapes (default \\r\\n)\n";
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Expands backslash escapes in a --delimiter value.
std::optional<std::string> unescape(const std::string& s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\') { out.push_back(s[i]); continue; }
    if (++i >= s.size()) return std::nullopt;
    switch (s[i]) {
      case 'r':  out.push_back('\r'); break;
      case 'n':  out.push_back('\n'); break;
      case 't':  out.push_back('\t'); break;
      case '0':  out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      case 'x': {
        if (i + 2 >= s.size()) return std::nullopt;
        int hi = hex_digit(s[i + 1]), lo = hex_digit(s[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        break;
      }
      default: return std::nullopt;
    }
  }
  return out;
}

std::optional<Cli> parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--delimiter=", &v)) {
      auto d = unescape(v);
      if (!d || d->empty()) { std::cerr << "[chunk-stream] invalid --delimiter: " << v << "\n"; return std::nullopt; }
      c.delimiter = *d;
      continue;
    }
    if (a == "--length-prefixed") { c.length_prefixed = true; continue; }
    if (eat("--type=", &c.type)) continue;
    if (eat("--media-type=", &c.media_type)) continue;
    if (eat("--url=", &c.url)) continue;
    if (eat("--log-level=", &c.log_level)) continue;
    if (eat("--max-chunks=", &v)) {
      try { c.max_chunks = std::stol(v); }
      catch (const std::logic_error&) { std::cerr << "[chunk-stream] invalid --max-chunks: " << v << "\n"; return std::nullopt; }
      continue;
    }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[chunk-stream] unknown option: " << a << "\n"; return std::nullopt; }
    c.input = a;
  }
  return c;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (!cli) { usage(std::cerr); return 1; }

  if (!cli->log_level.empty()) {
    auto lvl = cs::parse_log_level(cli->log_level);
    if (!lvl) { std::cerr << "[chunk-stream] invalid --log-level: " << cli->log_level << "\n"; return 1; }
    cs::set_log_level(*lvl);
  }

  cs::ChunkedReader::Context ctx;
  auto kind = cs::parse_kind(cli->type);
  if (!kind) { std::cerr << "[chunk-stream] invalid --type: " << cli->type << "\n"; usage(std::cerr); return 1; }
  ctx.type.kind = *kind;
  if (!cli->media_type.empty()) {
    ctx.media_type = cs::MediaType::parse(cli->media_type);
    if (!ctx.media_type) { std::cerr << "[chunk-stream] invalid --media-type: " << cli->media_type << "\n"; return 1; }
  }

  // --- source
  std::unique_ptr<cs::ByteSource> source;
  try {
    if (!cli->url.empty()) {
      auto http = std::make_unique<cs::HttpSource>(cli->url);
      ctx.headers = http->headers();
      source = std::move(http);
    } else {
      source = std::make_unique<cs::FileSource>(cli->input);
    }
  } catch (const cs::IoError& e) {
    std::cerr << "[chunk-stream] cannot open input: " << e.what() << "\n";
    return 2;
  } catch (const std::invalid_argument& e) {
    std::cerr << "[chunk-stream] " << e.what() << "\n";
    return 1;
  }

  // --- reader
  cs::ChunkedReader reader(std::move(source), cs::make_default_registry(), std::move(ctx));
  if (cli->length_prefixed) reader.set_parser(std::make_shared<cs::LengthPrefixedParser>());
  else reader.set_parser(cs::make_parser(cli->delimiter));

  cs::log_info("chunk-stream", "decoding ", reader.type().type_name(),
               " chunks as ", reader.chunk_type().to_string());

  long n = 0;
  long failed = 0;
  while (cli->max_chunks < 0 || n < cli->max_chunks) {
    std::optional<cs::Value> v;
    try {
      v = reader.read();
    } catch (const cs::DecodeError& e) {
      ++failed;
      cs::log_warn("chunk-stream", "chunk ", n + failed, " skipped: ", e.what());
      continue;
    }
    if (!v) break;
    std::cout << cs::to_display(*v) << "\n";
    ++n;
  }
  std::cout.flush();

  const std::error_code err = reader.last_error();
  reader.close();

  cs::log_info("chunk-stream", "chunks=", n, " failed=", failed);
  if (err) {
    std::cerr << "[chunk-stream] input failed: " << err.message() << "\n";
    return 4;
  }
  return failed ? 3 : 0;
}
