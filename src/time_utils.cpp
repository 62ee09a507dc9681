#include "tscompress/time_utils.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tscompress {

namespace {

// длительность единицы в наносекундах, 0 — неизвестная единица
double unit_nanos(const std::string &unit) {
  if (unit == "ns")
    return 1.0;
  if (unit == "us" || unit == "\xC2\xB5s") // µs
    return 1e3;
  if (unit == "ms")
    return 1e6;
  if (unit == "s")
    return 1e9;
  if (unit == "m")
    return 60e9;
  if (unit == "h")
    return 3600e9;
  return 0.0;
}

[[noreturn]] void bad_duration(const std::string &text) {
  throw std::invalid_argument("invalid duration: \"" + text + "\"");
}

} // namespace

std::chrono::milliseconds parse_duration(const std::string &text) {
  std::size_t i = 0;
  const std::size_t n = text.size();
  bool negative = false;
  if (i < n && (text[i] == '-' || text[i] == '+')) {
    negative = text[i] == '-';
    ++i;
  }
  if (i == n)
    bad_duration(text);

  double total_ns = 0.0;
  bool any_unit = false;
  while (i < n) {
    const std::size_t num_begin = i;
    while (i < n && (std::isdigit(static_cast<unsigned char>(text[i])) ||
                     text[i] == '.'))
      ++i;
    if (i == num_begin)
      bad_duration(text);

    double number = 0.0;
    try {
      std::size_t used = 0;
      number = std::stod(text.substr(num_begin, i - num_begin), &used);
      if (used != i - num_begin)
        bad_duration(text);
    } catch (const std::logic_error &) {
      bad_duration(text);
    }

    const std::size_t unit_begin = i;
    while (i < n && !std::isdigit(static_cast<unsigned char>(text[i])) &&
           text[i] != '.')
      ++i;

    if (unit_begin == i) {
      // "60" — голое число считаем секундами, но только целиком
      if (any_unit || num_begin != (negative || text[0] == '+' ? 1u : 0u))
        bad_duration(text);
      total_ns = number * 1e9;
      break;
    }

    const double scale = unit_nanos(text.substr(unit_begin, i - unit_begin));
    if (scale == 0.0)
      bad_duration(text);
    total_ns += number * scale;
    any_unit = true;
  }

  const double total_ms = std::trunc(total_ns / 1e6);
  if (!std::isfinite(total_ms) ||
      total_ms > static_cast<double>(std::numeric_limits<std::int64_t>::max()))
    bad_duration(text);

  const auto ms = static_cast<std::int64_t>(total_ms);
  return std::chrono::milliseconds(negative ? -ms : ms);
}

} // namespace tscompress
