#pragma once
#include "payload_queue.hpp"

namespace tscompress {

// self-pipe: обработчик сигнала будит читателя, висящего в poll()
class WakePipe {
public:
  WakePipe();
  ~WakePipe();

  WakePipe(const WakePipe &) = delete;
  WakePipe &operator=(const WakePipe &) = delete;

  int read_end() const { return fds_[0]; }
  void wake() const;

private:
  int fds_[2] = {-1, -1};
};

// Построчно читает fd в очередь (пустые строки пропускаются) до EOF,
// сигнала в wake_fd или закрытия очереди. Последняя строка без '\n'
// отправляется на EOF и отбрасывается при пробуждении.
void read_lines(int fd, int wake_fd, PayloadQueue &queue);

} // namespace tscompress
