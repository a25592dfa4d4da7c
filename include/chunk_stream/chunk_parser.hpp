#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

class ByteSource;

// Boundary-detection strategy. read_chunk() consumes bytes from `in` and
// returns the next non-empty chunk, or nullopt once the source is exhausted.
// Implementations are not thread-safe.
class ChunkParser {
public:
  virtual ~ChunkParser() = default;
  virtual std::optional<std::string> read_chunk(ByteSource& in) = 0;
};

// Splits on a fixed delimiter byte sequence. Trailing bytes without a
// delimiter form the last chunk; empty chunks are skipped.
class FixedBoundaryParser final : public ChunkParser {
public:
  // Throws std::invalid_argument for an empty delimiter.
  explicit FixedBoundaryParser(std::string delimiter);

  std::optional<std::string> read_chunk(ByteSource& in) override;

  const std::string& delimiter() const noexcept { return delimiter_; }

private:
  std::string delimiter_;
  // fallback_[i]: length of the longest proper prefix of delimiter_[0..i]
  // that is also its suffix.
  std::vector<std::size_t> fallback_;
};

// Frames of a 4-byte big-endian length followed by the payload.
class LengthPrefixedParser final : public ChunkParser {
public:
  struct Config {
    std::uint32_t max_chunk_bytes = 1u << 20; // 1 MiB
  };

  LengthPrefixedParser();
  explicit LengthPrefixedParser(Config cfg);

  // Throws FramingError on truncated or oversize frames. An oversize
  // frame's payload is consumed first, so the next call reads the next frame.
  std::optional<std::string> read_chunk(ByteSource& in) override;

private:
  Config cfg_;
};

std::shared_ptr<ChunkParser> make_parser(std::string_view boundary);
std::shared_ptr<ChunkParser> make_parser(const std::vector<std::uint8_t>& boundary);

}
