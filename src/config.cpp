#include "tscompress/config.hpp"
#include "tscompress/log.hpp"
#include "tscompress/time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace tscompress {

using json = nlohmann::json;

CompressorConfig resolve_config(CompressorConfig cfg) {
  if (cfg.timestamp_field.empty())
    cfg.timestamp_field = "timestamp";
  if (cfg.value_fields.empty())
    cfg.value_fields = {"value"};
  if (cfg.aggregation_method.empty())
    cfg.aggregation_method = "sum";
  if (cfg.time_window.count() == 0)
    cfg.time_window = std::chrono::seconds(60);
  if (cfg.workers <= 0)
    cfg.workers = 4;
  return cfg;
}

Config config_from_json(const json &j) {
  Config c;
  auto get = [&](auto key, auto def) {
    return j.contains(key)
               ? j[key].template get<std::decay_t<decltype(def)>>()
               : def;
  };

  auto &cc = c.compressor;
  cc.timestamp_field = get("timestamp", cc.timestamp_field);
  cc.value_fields = get("values", cc.value_fields);
  cc.group_by_fields = get("groupby", cc.group_by_fields);
  cc.unique_fields = get("unique", cc.unique_fields);
  cc.aggregation_method = get("method", cc.aggregation_method);
  cc.workers = get("workers", cc.workers);
  c.queue_capacity = get("queue_capacity", c.queue_capacity);
  c.queue_max_bytes = get("queue_max_bytes", c.queue_max_bytes);

  if (j.contains("window")) {
    const auto &w = j["window"];
    if (w.is_string()) {
      cc.time_window = parse_duration(w.get<std::string>());
    } else {
      // число — секунды
      const double ms = std::trunc(w.get<double>() * 1000.0);
      if (!std::isfinite(ms) || std::fabs(ms) >= 9223372036854775808.0)
        throw std::invalid_argument("window out of range: " + w.dump());
      cc.time_window = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
    }
  }

  c.compressor = resolve_config(std::move(c.compressor));
  return c;
}

Config load_config(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    log_info("CFG", "config " + path + " not found, using defaults");
    return config_from_json(json::object());
  }
  json j;
  f >> j;
  log_info("CFG", "loaded " + path);
  return config_from_json(j);
}

} // namespace tscompress
