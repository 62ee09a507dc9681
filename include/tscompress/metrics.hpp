#pragma once
#include "payload_queue.hpp"

#include <atomic>
#include <string>

namespace tscompress {
// сжатых сообщений отдано в stdout (counter)
extern std::atomic<unsigned long long> g_messages_out;
extern std::atomic<unsigned long long> g_messages_failed;
extern std::atomic<unsigned long long> g_bytes_out;

// "in=.. out=.. failed=.. bytes_in=.. bytes_out=.."; входящие берутся
// из статистики очереди
std::string metrics_summary(const QueueStats &in);
} // namespace tscompress
