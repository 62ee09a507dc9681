#include "tscompress/compressor.hpp"
#include "tscompress/config.hpp"
#include "tscompress/group.hpp"
#include "tscompress/json_fields.hpp"
#include "tscompress/log.hpp"
#include "tscompress/permit_pool.hpp"
#include "tscompress/time_utils.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace tscompress {

using json = nlohmann::json;

Compressor::Compressor(CompressorConfig cfg)
    : cfg_(resolve_config(std::move(cfg))),
      method_(parse_method(cfg_.aggregation_method)) {}

std::int64_t Compressor::window_seconds() const {
  const auto sec =
      std::chrono::duration_cast<std::chrono::seconds>(cfg_.time_window)
          .count();
  // окно меньше секунды (или отрицательное) — минута
  return sec > 0 ? sec : 60;
}

std::string Compressor::compress_json(const std::string &data) const {
  json root = json::parse(data, nullptr, /*allow_exceptions=*/false);
  if (!root.is_array())
    throw InputFormatError("expected JSON array");

  const std::int64_t window_sec = window_seconds();
  std::unordered_map<GroupKey, Group, GroupKeyHash> groups;

  for (const auto &record : root) {
    if (!record.is_object())
      continue;

    const json *ts_field = find_field(record, cfg_.timestamp_field);
    const std::int64_t ts = ts_field ? field_as_int(*ts_field) : 0;
    if (ts == 0)
      continue; // нет времени — пропускаем

    const auto window = window_start(ts, window_sec);
    if (!window)
      continue; // окно вне диапазона int64

    GroupKey key;
    key.window = *window;
    key.group_by.reserve(cfg_.group_by_fields.size());
    for (const auto &field : cfg_.group_by_fields) {
      const json *v = find_field(record, field);
      key.group_by.push_back(v ? std::optional<std::string>(field_as_string(*v))
                               : std::nullopt);
    }
    key.unique.reserve(cfg_.unique_fields.size());
    for (const auto &field : cfg_.unique_fields) {
      const json *v = find_field(record, field);
      key.unique.push_back(v ? std::optional<std::string>(field_as_string(*v))
                             : std::nullopt);
    }

    auto it = groups.find(key);
    if (it == groups.end()) {
      Group g;
      g.window = key.window;
      g.first_time = ts;
      g.last_time = ts;
      for (std::size_t i = 0; i < cfg_.group_by_fields.size(); ++i) {
        if (key.group_by[i])
          g.tags[cfg_.group_by_fields[i]] = *key.group_by[i];
      }
      for (std::size_t i = 0; i < cfg_.unique_fields.size(); ++i) {
        if (key.unique[i])
          g.tags[cfg_.unique_fields[i]] = *key.unique[i];
      }
      it = groups.emplace(std::move(key), std::move(g)).first;
    }

    Group &group = it->second;
    if (ts < group.first_time)
      group.first_time = ts;
    if (ts > group.last_time)
      group.last_time = ts;

    for (const auto &field : cfg_.value_fields) {
      if (const json *v = find_field(record, field))
        group.values.push_back(field_as_double(*v));
    }
    ++group.count;
  }

  const std::string &value_name =
      cfg_.value_fields.size() == 1 ? cfg_.value_fields.front() : "value";

  json output = json::array();
  for (const auto &entry : groups) {
    const Group &group = entry.second;
    json obj = json::object();

    switch (method_) {
    case AggregationMethod::First:
      obj[cfg_.timestamp_field] = group.first_time;
      break;
    case AggregationMethod::Last:
      obj[cfg_.timestamp_field] = group.last_time;
      break;
    default:
      obj[cfg_.timestamp_field] =
          midpoint_truncated(group.first_time, group.last_time);
      break;
    }
    const double value = aggregate(group.values, method_);
    // nlohmann пишет inf/nan как null, а значение должно быть числом
    if (!std::isfinite(value))
      throw SerializationError("aggregate of " + value_name +
                               " is not a finite number");
    obj[value_name] = value;

    for (const auto &[k, v] : group.tags)
      obj[k] = v;

    output.push_back(std::move(obj));
  }

  try {
    return output.dump();
  } catch (const json::exception &e) {
    throw SerializationError(std::string("failed to serialize output: ") +
                             e.what());
  }
}

std::vector<std::optional<std::string>>
Compressor::compress_batch(const std::vector<std::string> &batches) const {
  std::vector<std::optional<std::string>> results(batches.size());
  run_bounded(batches.size(), static_cast<std::size_t>(cfg_.workers),
              [this, &batches, &results](std::size_t i) {
                try {
                  results[i] = compress_json(batches[i]);
                } catch (const std::exception &e) {
                  log_err("BATCH",
                          "item " + std::to_string(i) + ": " + e.what());
                }
              });
  return results;
}

double compression_ratio(std::size_t raw_len, std::size_t compressed_len) {
  if (raw_len == 0)
    return 0.0;
  return 1.0 - static_cast<double>(compressed_len) /
                   static_cast<double>(raw_len);
}

} // namespace tscompress
