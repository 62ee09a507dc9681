#include "tscompress/line_reader.hpp"
#include "tscompress/log.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <poll.h>
#include <unistd.h>

namespace tscompress {

WakePipe::WakePipe() {
  if (::pipe(fds_) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");
}

WakePipe::~WakePipe() {
  ::close(fds_[0]);
  ::close(fds_[1]);
}

void WakePipe::wake() const {
  const char b = 1;
  if (::write(fds_[1], &b, 1) < 0)
    log_err("SIG", std::string("wake pipe: ") + std::strerror(errno));
}

void read_lines(int fd, int wake_fd, PayloadQueue &queue) {
  std::string pending;
  char buf[64 * 1024];
  pollfd fds[2] = {{fd, POLLIN, 0}, {wake_fd, POLLIN, 0}};

  for (;;) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR)
        continue;
      log_err("IO", std::string("poll: ") + std::strerror(errno));
      return;
    }
    if (fds[1].revents != 0)
      return;
    if (fds[0].revents == 0)
      continue;

    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      log_err("IO", std::string("read: ") + std::strerror(errno));
      return;
    }
    if (n == 0) {
      if (!pending.empty() && !queue.push(std::move(pending)))
        log_info("IO", "queue closed, last line dropped");
      return; // EOF
    }

    pending.append(buf, static_cast<std::size_t>(n));
    std::size_t begin = 0;
    std::size_t nl;
    while ((nl = pending.find('\n', begin)) != std::string::npos) {
      std::string line = pending.substr(begin, nl - begin);
      begin = nl + 1;
      if (!line.empty() && !queue.push(std::move(line)))
        return; // очередь закрыта
    }
    pending.erase(0, begin);
  }
}

} // namespace tscompress
