#include "tscompress/metrics.hpp"

#include <sstream>

namespace tscompress {

std::atomic<unsigned long long> g_messages_out{0};
std::atomic<unsigned long long> g_messages_failed{0};
std::atomic<unsigned long long> g_bytes_out{0};

std::string metrics_summary(const QueueStats &in) {
  std::ostringstream ss;
  ss << "in=" << in.accepted << " out=" << g_messages_out.load()
     << " failed=" << g_messages_failed.load()
     << " bytes_in=" << in.accepted_bytes
     << " bytes_out=" << g_bytes_out.load();
  return ss.str();
}

} // namespace tscompress
