#include "chunk_stream/text_decoder.hpp"
#include "chunk_stream/errors.hpp"

#include <cctype>
#include <string>
#include <string_view>

namespace cs {

static bool valid_utf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t n;
    if (c < 0x80) n = 0;
    else if ((c >> 5) == 0x6 && c >= 0xC2) n = 1;
    else if ((c >> 4) == 0xE) n = 2;
    else if ((c >> 3) == 0x1E && c <= 0xF4) n = 3;
    else return false;
    if (n > 0 && i + n >= s.size()) return false;
    for (std::size_t k = 1; k <= n; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) >> 6) != 0x2) return false;
    }
    i += n + 1;
  }
  return true;
}

bool TextDecoder::can_decode(const TypeDescriptor& type, const MediaType&) const {
  return type.kind == ValueKind::Bytes || type.kind == ValueKind::Text;
}

Value TextDecoder::decode(ByteSource& chunk, const DecodeContext& ctx) {
  std::string s = read_all(chunk);
  if (ctx.type.kind == ValueKind::Bytes) return s;

  if (cfg_.strip_cr && !s.empty() && s.back() == '\r') s.pop_back();

  if (auto charset = ctx.media_type.param("charset")) {
    std::string l = *charset;
    for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if ((l == "utf-8" || l == "utf8") && !valid_utf8(s)) {
      throw DecodeError("chunk is not valid UTF-8");
    }
  }
  return s;
}

}
