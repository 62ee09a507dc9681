#pragma once
#include "compressor.hpp"
#include "payload_queue.hpp"

#include <atomic>
#include <boost/thread.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace tscompress {

// Пул воркеров stream-режима: берут сообщения из очереди, сжимают и пишут
// по одному JSON-массиву на строку в out. Порядок строк не гарантируется.
class CompressorPool {
public:
  CompressorPool(const Compressor &compressor,
                 PayloadQueue &queue, std::ostream &out);
  ~CompressorPool();

  void start();
  // закрывает очередь, дожидается разбора оставшихся сообщений
  void stop();

private:
  void worker_loop();
  void handle(const std::string &payload);

  const Compressor &compressor_;
  PayloadQueue &queue_;
  std::ostream &out_;
  boost::mutex out_mutex_;
  std::vector<std::unique_ptr<boost::thread>> workers_;
  std::atomic<bool> running_{false};
};

} // namespace tscompress
