#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/container_hash/hash.hpp>

namespace tscompress {

// Составной ключ группы: окно + значения group_by и unique полей в порядке
// конфигурации. Отсутствующее в записи поле — пустой optional, поэтому
// "нет поля" не совпадает ни с одним значением.
struct GroupKey {
  std::int64_t window = 0;
  std::vector<std::optional<std::string>> group_by;
  std::vector<std::optional<std::string>> unique;

  bool operator==(const GroupKey &other) const {
    return window == other.window && group_by == other.group_by &&
           unique == other.unique;
  }
};

struct GroupKeyHash {
  std::size_t operator()(const GroupKey &key) const {
    std::size_t h = 0;
    boost::hash_combine(h, key.window);
    auto combine = [&h](const std::optional<std::string> &v) {
      boost::hash_combine(h, v.has_value());
      if (v)
        boost::hash_combine(h, std::hash<std::string>{}(*v));
    };
    for (const auto &v : key.group_by)
      combine(v);
    for (const auto &v : key.unique)
      combine(v);
    return h;
  }
};

struct Group {
  std::int64_t window = 0;
  std::map<std::string, std::string> tags;
  std::vector<double> values;
  std::int64_t count = 0;
  std::int64_t first_time = 0;
  std::int64_t last_time = 0;
};

} // namespace tscompress
