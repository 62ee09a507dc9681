#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tscompress {

// Настройки ядра компрессора. После resolve_config() — неизменяемые,
// разделяются между потоками только на чтение.
struct CompressorConfig {
  std::string timestamp_field;          // поле с unix-временем (секунды)
  std::vector<std::string> value_fields; // поля со значениями для агрегации
  std::vector<std::string> group_by_fields;
  // если значения unique-полей различаются — НЕ агрегируем,
  // даже если group_by совпадает (например, customer_id)
  std::vector<std::string> unique_fields;
  std::string aggregation_method; // sum|avg|mean|min|max|count|first|last
  std::chrono::milliseconds time_window{0};
  int workers = 0;
};

struct Config {
  CompressorConfig compressor;
  // ограничения очереди stream-режима: сообщений и суммарных байт
  std::size_t queue_capacity = 10000;
  std::size_t queue_max_bytes = 64u << 20;
};

} // namespace tscompress
