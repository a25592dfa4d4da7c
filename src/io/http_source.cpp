#include "chunk_stream/http_source.hpp"
#include "chunk_stream/errors.hpp"
#include "chunk_stream/log.hpp"

#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace cs {

struct HttpSource::Impl {
  std::string url;
  Config cfg;
  std::string host;
  int port{80};
  std::string target{"/"};
  std::unique_ptr<httplib::Client> cli;

  mutable std::mutex mu;
  mutable std::condition_variable cv;
  std::string queue;            // filled by the producer
  bool producer_waiting{false};
  bool headers_ready{false};
  bool done{false};
  bool closed{false};
  int status{0};
  HeaderMap resp_headers;
  std::error_code fault;
  std::string fault_msg;

  // Consumer-side copy of the queue; read() serves from here without locking.
  std::string local;
  std::size_t local_pos{0};
  std::atomic<std::uint64_t> bytes{0};

  std::thread worker;
  std::once_flag close_once;

  void parse_url() {
    static constexpr std::string_view scheme = "http://";
    std::string_view u(url);
    if (u.substr(0, scheme.size()) != scheme)
      throw std::invalid_argument("unsupported url (expected http://): " + url);
    u.remove_prefix(scheme.size());

    std::size_t slash = u.find('/');
    std::string_view authority = u.substr(0, slash);
    if (slash != std::string_view::npos) target.assign(u.substr(slash));
    std::size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      std::string p(authority.substr(colon + 1));
      try {
        std::size_t used = 0;
        port = std::stoi(p, &used);
        if (used != p.size() || port <= 0 || port > 65535) throw std::out_of_range(p);
      } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid port in url: " + url);
      }
      authority = authority.substr(0, colon);
    }
    if (authority.empty()) throw std::invalid_argument("missing host in url: " + url);
    host.assign(authority);
  }

  void run() {
    httplib::Headers req_headers;
    for (const auto& [name, values] : cfg.request_headers)
      for (const auto& v : values) req_headers.emplace(name, v);

    auto res = cli->Get(
        target, req_headers,
        [this](const httplib::Response& r) {
          std::lock_guard<std::mutex> lk(mu);
          status = r.status;
          for (const auto& [k, v] : r.headers) resp_headers[k].push_back(v);
          headers_ready = true;
          cv.notify_all();
          return !closed && r.status >= 200 && r.status < 300;
        },
        [this](const char* data, size_t n) {
          std::unique_lock<std::mutex> lk(mu);
          producer_waiting = true;
          cv.wait(lk, [this] { return closed || queue.size() < cfg.queue_bytes; });
          producer_waiting = false;
          if (closed) return false;
          queue.append(data, n);
          cv.notify_all();
          return true;
        });

    std::lock_guard<std::mutex> lk(mu);
    if (!closed) {
      if (headers_ready && (status < 200 || status >= 300)) {
        fault = std::make_error_code(std::errc::protocol_error);
        fault_msg = "GET " + url + " returned status " + std::to_string(status);
      } else if (!res) {
        fault = std::make_error_code(std::errc::io_error);
        fault_msg = "GET " + url + " failed: " + httplib::to_string(res.error());
      }
      if (fault) log_debug("http", fault_msg);
    }
    done = true;
    headers_ready = true;
    cv.notify_all();
  }

  void wait_headers() const {
    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [this] { return headers_ready || closed; });
  }
};

HttpSource::HttpSource(std::string url)
  : HttpSource(std::move(url), Config{}) {}

HttpSource::HttpSource(std::string url, Config cfg) : p_(new Impl) {
  p_->url = std::move(url);
  p_->cfg = std::move(cfg);
  if (p_->cfg.queue_bytes == 0) p_->cfg.queue_bytes = 1;
  try {
    p_->parse_url();
    p_->cli = std::make_unique<httplib::Client>(p_->host, p_->port);
    p_->cli->set_connection_timeout(p_->cfg.connect_timeout_sec, 0);
    p_->cli->set_read_timeout(p_->cfg.read_timeout_sec, 0);
    p_->worker = std::thread([impl = p_] { impl->run(); });
  } catch (...) {
    delete p_;
    throw;
  }
}

HttpSource::~HttpSource() {
  try {
    close();
  } catch (const std::system_error& e) {
    log_debug("http", "close failed: ", e.what());
  }
  delete p_;
}

int HttpSource::read() {
  if (p_->local_pos < p_->local.size()) {
    ++p_->bytes;
    return static_cast<unsigned char>(p_->local[p_->local_pos++]);
  }

  std::unique_lock<std::mutex> lk(p_->mu);
  p_->cv.wait(lk, [this] { return !p_->queue.empty() || p_->done || p_->closed; });
  if (p_->closed) return kEndOfStream;
  if (!p_->queue.empty()) {
    p_->local.clear();
    p_->local.swap(p_->queue);
    p_->local_pos = 0;
    if (p_->producer_waiting) p_->cv.notify_all();
    ++p_->bytes;
    return static_cast<unsigned char>(p_->local[p_->local_pos++]);
  }
  if (p_->fault) throw IoError(p_->fault, p_->fault_msg);
  return kEndOfStream;
}

void HttpSource::close() {
  std::call_once(p_->close_once, [this] {
    {
      std::lock_guard<std::mutex> lk(p_->mu);
      p_->closed = true;
    }
    p_->cv.notify_all();
    if (p_->cli) p_->cli->stop();
    if (p_->worker.joinable()) p_->worker.join();
  });
}

std::string HttpSource::content_type() const {
  p_->wait_headers();
  std::lock_guard<std::mutex> lk(p_->mu);
  return header_value(p_->resp_headers, "Content-Type").value_or("");
}

HeaderMap HttpSource::headers() const {
  p_->wait_headers();
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->resp_headers;
}

int HttpSource::status() const {
  p_->wait_headers();
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->status;
}

std::uint64_t HttpSource::bytes_read() const noexcept { return p_->bytes.load(); }

}
