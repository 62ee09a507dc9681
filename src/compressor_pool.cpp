#include "tscompress/compressor_pool.hpp"
#include "tscompress/log.hpp"
#include "tscompress/metrics.hpp"

#include <cstdio>
#include <exception>

namespace tscompress {

CompressorPool::CompressorPool(const Compressor &compressor,
                               PayloadQueue &queue,
                               std::ostream &out)
    : compressor_(compressor), queue_(queue), out_(out) {}

CompressorPool::~CompressorPool() { stop(); }

void CompressorPool::start() {
  if (running_.exchange(true))
    return;

  const int n = compressor_.config().workers > 0 ? compressor_.config().workers
                                                 : 1;
  workers_.reserve(static_cast<std::size_t>(n));

  for (int i = 0; i < n; ++i) {
    workers_.emplace_back(std::make_unique<boost::thread>([this] {
      try {
        worker_loop();
      } catch (const std::exception &e) {
        log_err("ERR", std::string("compressor worker fatal: ") + e.what());
      }
    }));
  }
}

void CompressorPool::stop() {
  if (!running_.exchange(false))
    return;

  queue_.close();

  for (auto &w : workers_) {
    if (w && w->joinable())
      w->join();
  }
  workers_.clear();
}

void CompressorPool::worker_loop() {
  while (auto item = queue_.pop()) {
    handle(*item);
  }
}

void CompressorPool::handle(const std::string &payload) {
  std::string compressed;
  try {
    compressed = compressor_.compress_json(payload);
  } catch (const std::exception &e) {
    g_messages_failed.fetch_add(1ULL, std::memory_order_relaxed);
    log_err("COMPRESS", std::string("failed to compress message: ") + e.what());
    return;
  }

  char buf[128];
  std::snprintf(buf, sizeof(buf),
                "Compressed %zu bytes to %zu bytes (%.2f%% reduction)",
                payload.size(), compressed.size(),
                compression_ratio(payload, compressed) * 100.0);
  log_info("COMPRESS", buf);

  {
    boost::lock_guard<boost::mutex> lk(out_mutex_);
    out_ << compressed << '\n';
    out_.flush();
  }
  g_messages_out.fetch_add(1ULL, std::memory_order_relaxed);
  g_bytes_out.fetch_add(compressed.size(), std::memory_order_relaxed);
}

} // namespace tscompress
