#include "chunk_stream/byte_source.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/log.hpp"
#include "chunk_stream/path_utils.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace cs {

static std::error_code errno_code(int e) {
  return std::error_code(e ? e : EIO, std::generic_category());
}

struct FileSource::Impl {
  std::string path;
  Config cfg;
  bool owns{false};   // false for stdin
  bool eof{false};

  // Consumer side: only read() touches these. buf lives until the destructor.
  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};

  std::mutex mu;                  // guards f; held across fread and fclose
  FILE* f{nullptr};
  std::atomic<bool> closing{false};
  std::atomic<std::uint64_t> bytes{0};

  void open() {
    if (cfg.block_bytes == 0) cfg.block_bytes = 1;
    if (path == "-") {
      f = stdin;
      owns = false;
    } else {
      f = std::fopen(path.c_str(), "rb");
      if (!f) throw IoError(errno_code(errno), "cannot open " + path);
      owns = true;
    }
    buf.resize(cfg.block_bytes);
  }

  bool refill() {
    std::lock_guard<std::mutex> lk(mu);
    if (!f) return false;
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) throw IoError(errno_code(errno), "read failed: " + path);
      eof = true;
      return false;
    }
    pos = 0;
    len = n;
    bytes += n;
    return true;
  }
};

FileSource::FileSource(std::string path)
  : FileSource(std::move(path), Config{}) {}

FileSource::FileSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), std::move(cfg)}) {
  try {
    p_->open();
  } catch (...) {
    delete p_;
    throw;
  }
}

FileSource::~FileSource() {
  try {
    close();
  } catch (const IoError& e) {
    log_debug("file", "close failed: ", e.what());
  }
  delete p_;
}

int FileSource::read() {
  if (p_->closing.load()) return kEndOfStream;
  if (p_->pos >= p_->len) {
    if (p_->eof || !p_->refill()) return kEndOfStream;
  }
  return static_cast<unsigned char>(p_->buf[p_->pos++]);
}

void FileSource::close() {
  p_->closing.store(true);
  std::lock_guard<std::mutex> lk(p_->mu);
  FILE* f = p_->f;
  if (!f) return;
  p_->f = nullptr;
  if (p_->owns && std::fclose(f) != 0) {
    throw IoError(errno_code(errno), "close failed: " + p_->path);
  }
}

std::string FileSource::content_type() const {
  if (!p_->cfg.content_type.empty()) return p_->cfg.content_type;
  return content_type_for_path(p_->path);
}

const std::string& FileSource::path() const noexcept { return p_->path; }
std::uint64_t FileSource::bytes_read() const noexcept { return p_->bytes; }

}
