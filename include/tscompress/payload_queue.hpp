#pragma once
#include <boost/thread.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace tscompress {

struct QueueStats {
  std::uint64_t accepted = 0;       // принято сообщений за всё время
  std::uint64_t accepted_bytes = 0;
  std::size_t pending = 0;          // лежит в очереди сейчас
  std::size_t pending_bytes = 0;
};

// Очередь входящих payload'ов stream-режима. Ограничена и числом
// сообщений, и суммарным размером в байтах; payload больше max_bytes
// принимается только в пустую очередь.
class PayloadQueue {
public:
  PayloadQueue(std::size_t max_messages, std::size_t max_bytes)
      : max_messages_(max_messages ? max_messages : 1),
        max_bytes_(max_bytes ? max_bytes : 1) {}

  PayloadQueue(const PayloadQueue &) = delete;
  PayloadQueue &operator=(const PayloadQueue &) = delete;

  // блокирует, пока не освободится место; false после close()
  bool push(std::string payload) {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_not_full_.wait(lk, [&] { return closed_ || fits(payload.size()); });
    if (closed_)
      return false;
    pending_bytes_ += payload.size();
    ++accepted_;
    accepted_bytes_ += payload.size();
    q_.push_back(std::move(payload));
    cv_not_empty_.notify_one();
    return true;
  }

  // После close() отдаёт оставшиеся payload'ы, затем nullopt.
  std::optional<std::string> pop() {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
    if (q_.empty())
      return std::nullopt;
    std::string payload = std::move(q_.front());
    q_.pop_front();
    pending_bytes_ -= payload.size();
    // освободилось место — может пролезть и крупный, и несколько мелких
    cv_not_full_.notify_all();
    return payload;
  }

  void close() {
    {
      boost::lock_guard<boost::mutex> lk(m_);
      closed_ = true;
    }
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
  }

  QueueStats stats() const {
    boost::lock_guard<boost::mutex> lk(m_);
    QueueStats s;
    s.accepted = accepted_;
    s.accepted_bytes = accepted_bytes_;
    s.pending = q_.size();
    s.pending_bytes = pending_bytes_;
    return s;
  }

private:
  bool fits(std::size_t size) const {
    if (q_.empty())
      return true;
    return q_.size() < max_messages_ && pending_bytes_ + size <= max_bytes_;
  }

  std::deque<std::string> q_;
  const std::size_t max_messages_;
  const std::size_t max_bytes_;
  std::size_t pending_bytes_ = 0;
  std::uint64_t accepted_ = 0;
  std::uint64_t accepted_bytes_ = 0;
  bool closed_{false};
  mutable boost::mutex m_;
  boost::condition_variable_any cv_not_empty_;
  boost::condition_variable_any cv_not_full_;
};

} // namespace tscompress
