#pragma once
#include "aggregator.hpp"
#include "errors.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tscompress {

// Сжимает JSON-массив записей: группирует по окну времени и полям
// group_by/unique и сворачивает значения в одно на группу.
// Конфигурация неизменяема, compress_json можно звать из разных потоков.
class Compressor {
public:
  explicit Compressor(CompressorConfig cfg);

  // Бросает InputFormatError, если вход не JSON-массив.
  std::string compress_json(const std::string &data) const;

  // Результат выровнен по индексам входа; пустой optional — элемент
  // не удалось сжать. Одновременно работает не больше cfg.workers задач.
  std::vector<std::optional<std::string>>
  compress_batch(const std::vector<std::string> &batches) const;

  const CompressorConfig &config() const noexcept { return cfg_; }

private:
  std::int64_t window_seconds() const;

  CompressorConfig cfg_;
  AggregationMethod method_;
};

// 1 - compressed/raw; 0 для пустого входа. Может быть отрицательным.
double compression_ratio(std::size_t raw_len, std::size_t compressed_len);

inline double compression_ratio(const std::string &raw,
                                const std::string &compressed) {
  return compression_ratio(raw.size(), compressed.size());
}

} // namespace tscompress
