#pragma once
#include <boost/thread.hpp>
#include <cstddef>

namespace tscompress {

// Счётный семафор: не больше capacity одновременных владельцев разрешения.
class PermitPool {
public:
  explicit PermitPool(std::size_t capacity)
      : available_(capacity ? capacity : 1) {}

  PermitPool(const PermitPool &) = delete;
  PermitPool &operator=(const PermitPool &) = delete;

  // блокирует, пока нет свободного разрешения
  void acquire() {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_.wait(lk, [&] { return available_ > 0; });
    --available_;
  }

  void release() {
    {
      boost::lock_guard<boost::mutex> lk(m_);
      ++available_;
    }
    cv_.notify_one();
  }

  std::size_t available() const {
    boost::lock_guard<boost::mutex> lk(m_);
    return available_;
  }

private:
  std::size_t available_;
  mutable boost::mutex m_;
  boost::condition_variable_any cv_;
};

// Возвращает уже полученное разрешение при выходе из области видимости.
class PermitGuard {
public:
  explicit PermitGuard(PermitPool &pool) : pool_(pool) {}
  ~PermitGuard() { pool_.release(); }

  PermitGuard(const PermitGuard &) = delete;
  PermitGuard &operator=(const PermitGuard &) = delete;

private:
  PermitPool &pool_;
};

// Вызывает fn(0..n-1), каждый вызов в своём потоке, не больше max_parallel
// одновременно. Возвращается, когда завершились все вызовы.
// fn не должна бросать исключений.
template <class Fn>
void run_bounded(std::size_t n, std::size_t max_parallel, Fn fn) {
  PermitPool permits(max_parallel);
  boost::thread_group workers;

  for (std::size_t i = 0; i < n; ++i) {
    permits.acquire();
    try {
      workers.create_thread([&permits, &fn, i] {
        PermitGuard permit(permits);
        fn(i);
      });
    } catch (...) {
      // поток не создан — разрешение не будет возвращено воркером
      permits.release();
      workers.join_all();
      throw;
    }
  }

  workers.join_all();
}

} // namespace tscompress
