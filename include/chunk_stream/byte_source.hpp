#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace cs {

inline constexpr int kEndOfStream = -1;

// Byte-at-a-time input. read() returns 0..255, or kEndOfStream once the
// source is exhausted, and throws IoError when the underlying read fails.
// close() releases the source; it may throw IoError.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual int read() = 0;
  virtual void close() = 0;

  // Content type the source declares for its bytes ("" when unknown).
  virtual std::string content_type() const { return {}; }
};

// Owns a byte string. Used for detached chunks handed to decoders.
class MemorySource final : public ByteSource {
public:
  explicit MemorySource(std::string bytes, std::string content_type = {});

  int read() override;
  void close() override;
  std::string content_type() const override { return content_type_; }

  std::size_t remaining() const noexcept;
  bool closed() const noexcept { return closed_; }

private:
  std::string bytes_;
  std::size_t pos_{0};
  bool closed_{false};
  std::string content_type_;
};

// File (or stdin for "-") read through a fixed-size block buffer.
// close() may run on another thread while read() is in progress; it waits
// for an in-flight fread, and read() returns kEndOfStream from then on.
class FileSource final : public ByteSource {
public:
  struct Config {
    std::size_t block_bytes = 64 * 1024; // 64 KiB
    std::string content_type;            // overrides the extension guess
  };

  // Throws IoError when the file cannot be opened.
  explicit FileSource(std::string path);
  FileSource(std::string path, Config cfg);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  int read() override;
  void close() override;
  std::string content_type() const override;

  const std::string& path() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
