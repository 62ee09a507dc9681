#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace tscompress {

// Разбор длительности в формате "90s", "1m", "1h30m", "500ms", "1.5h".
// Число без единицы — секунды. Бросает std::invalid_argument.
std::chrono::milliseconds parse_duration(const std::string &text);

// Начало окна: floor(ts / window) * window, в т.ч. для отрицательных ts.
// nullopt, если начало окна не помещается в int64 (ts около INT64_MIN).
inline std::optional<std::int64_t> window_start(std::int64_t ts,
                                                std::int64_t window_sec) {
  std::int64_t q = ts / window_sec;
  if (ts % window_sec != 0 && ts < 0) {
    if (q < std::numeric_limits<std::int64_t>::min() / window_sec + 1)
      return std::nullopt;
    --q;
  }
  return q * window_sec;
}

// (first + last) / 2 с отбрасыванием дробной части, без переполнения.
// Требует first <= last.
inline std::int64_t midpoint_truncated(std::int64_t first, std::int64_t last) {
  if ((first < 0) != (last < 0))
    return (first + last) / 2;
  if (first >= 0)
    return first + (last - first) / 2;
  return last - (last - first) / 2;
}

} // namespace tscompress
