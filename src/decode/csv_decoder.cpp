#include "chunk_stream/csv_decoder.hpp"
#include "chunk_stream/errors.hpp"

#include <utility>

namespace cs {

bool CsvDecoder::split_row(std::string_view line, const CsvConfig& cfg,
                           std::vector<std::string>& out) {
  out.clear();
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;
  std::string field;

  for (std::size_t i = 0; i <= line.size(); ++i) {
    const bool at_end = (i == line.size());
    const char c = at_end ? cfg.delimiter : line[i]; // sentinel delimiter at end
    switch (mode) {
      case Mode::FieldStart:
        if (!at_end && c == cfg.quote) { mode = Mode::Quoted; break; }
        mode = Mode::Unquoted;
        [[fallthrough]];
      case Mode::Unquoted:
        if (c == cfg.delimiter) {
          out.push_back(std::move(field));
          field.clear();
          mode = Mode::FieldStart;
        } else {
          field.push_back(c);
        }
        break;
      case Mode::Quoted:
        if (at_end) return false;          // unterminated quote
        if (c == cfg.quote) mode = Mode::QuoteEscape;
        else field.push_back(c);
        break;
      case Mode::QuoteEscape:
        if (!at_end && c == cfg.quote) {
          field.push_back(c);              // escaped quote
          mode = Mode::Quoted;
        } else if (c == cfg.delimiter) {
          out.push_back(std::move(field));
          field.clear();
          mode = Mode::FieldStart;
        } else {
          return false; // malformed
        }
        break;
    }
  }
  return true;
}

bool CsvDecoder::can_decode(const TypeDescriptor& type, const MediaType& media_type) const {
  return type.kind == ValueKind::Record && media_type.matches("text", "csv");
}

Value CsvDecoder::decode(ByteSource& chunk, const DecodeContext& ctx) {
  std::string line = read_all(chunk);
  if (cfg_.strip_cr && !line.empty() && line.back() == '\r') line.pop_back();

  bool header_mode = cfg_.header;
  if (auto h = ctx.media_type.param("header")) {
    if (*h == "absent") header_mode = false;
    else if (*h == "present") header_mode = true;
  }

  if (ctx.stream_id != header_stream_) {
    header_.clear();
    has_header_ = false;
    header_stream_ = ctx.stream_id;
  }

  std::vector<std::string> fields;
  if (!split_row(line, cfg_, fields)) throw DecodeError("CSV parse error (quoted field mismatch)");

  if (header_mode && !has_header_) {
    header_ = std::move(fields);
    has_header_ = true;
    return std::monostate{};
  }

  if (!header_mode) return Record({}, std::move(fields));

  if (fields.size() != header_.size()) {
    throw DecodeError("CSV row has " + std::to_string(fields.size()) + " fields, header has " +
                      std::to_string(header_.size()));
  }
  return Record(header_, std::move(fields));
}

}
