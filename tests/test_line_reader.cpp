#include <gtest/gtest.h>
#include <tscompress/line_reader.hpp>
#include <tscompress/payload_queue.hpp>

#include <boost/thread.hpp>
#include <string>

#include <unistd.h>

using tscompress::PayloadQueue;
using tscompress::read_lines;
using tscompress::WakePipe;

namespace {

// пишет всё в fd и закрывает его
void write_all(int fd, const std::string &data) {
  std::size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    ASSERT_GT(n, 0);
    off += static_cast<std::size_t>(n);
  }
}

} // namespace

TEST(LineReader, SplitsLinesAndKeepsTailAtEof) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  write_all(fds[1], "[1]\n\n[2]\n[3]");
  ::close(fds[1]);

  WakePipe wake;
  PayloadQueue q(16, 1 << 20);
  read_lines(fds[0], wake.read_end(), q);
  ::close(fds[0]);
  q.close();

  EXPECT_EQ(q.pop().value_or(""), "[1]");
  EXPECT_EQ(q.pop().value_or(""), "[2]");
  EXPECT_EQ(q.pop().value_or(""), "[3]");
  EXPECT_FALSE(q.pop().has_value());
}

TEST(LineReader, WakeStopsBlockedReader) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  write_all(fds[1], "[1]\n[2");

  WakePipe wake;
  PayloadQueue q(16, 1 << 20);
  boost::thread reader([&] { read_lines(fds[0], wake.read_end(), q); });

  // writer остаётся открытым: без пробуждения read_lines ждал бы вечно
  auto first = q.pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, "[1]");

  wake.wake();
  reader.join();
  ::close(fds[0]);
  ::close(fds[1]);

  q.close();
  EXPECT_FALSE(q.pop().has_value()); // недописанная строка отброшена
}

TEST(LineReader, StopsWhenQueueClosed) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  write_all(fds[1], "[1]\n[2]\n");

  WakePipe wake;
  PayloadQueue q(16, 1 << 20);
  q.close();
  read_lines(fds[0], wake.read_end(), q); // возвращается на первой строке
  ::close(fds[0]);
  ::close(fds[1]);

  EXPECT_EQ(q.stats().accepted, 0u);
}
