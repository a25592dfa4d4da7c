#pragma once
#include "chunk_stream/chunk_decoder.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool header    = true;  // overridden by the media type's header=present|absent
  bool strip_cr  = true;
};

// text/csv chunks, one row per chunk, decoded to Record. In header mode the
// first row of each stream is remembered as column names and decodes to null.
// Header state belongs to the stream of the last decoded chunk
// (DecodeContext::stream_id): a registry can serve readers one after another,
// but not two CSV streams interleaved.
class CsvDecoder final : public ChunkDecoder {
public:
  CsvDecoder() = default;
  explicit CsvDecoder(CsvConfig cfg) : cfg_(cfg) {}

  bool can_decode(const TypeDescriptor& type, const MediaType& media_type) const override;
  Value decode(ByteSource& chunk, const DecodeContext& ctx) override;

  const std::vector<std::string>& header() const noexcept { return header_; }

  // Splits one row. Returns false on a malformed quoted field.
  static bool split_row(std::string_view line, const CsvConfig& cfg,
                        std::vector<std::string>& out);

private:
  CsvConfig cfg_;
  std::vector<std::string> header_;
  bool has_header_{false};
  std::uint64_t header_stream_{0};
};

}
