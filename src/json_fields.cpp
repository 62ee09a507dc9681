#include "tscompress/json_fields.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tscompress {

using json = nlohmann::json;

namespace {

// строка целиком — конечное число с плавающей точкой
bool parse_finite_double(const std::string &s, double &out) {
  if (s.empty())
    return false;
  const char *begin = s.c_str();
  char *end = nullptr;
  const double d = std::strtod(begin, &end);
  if (end != begin + s.size() || !std::isfinite(d))
    return false;
  out = d;
  return true;
}

std::int64_t truncate_to_int(double d) {
  // вне диапазона int64 приведение — UB, считаем такое значение нулём
  if (!std::isfinite(d) || d >= 9223372036854775808.0 ||
      d < -9223372036854775808.0)
    return 0;
  return static_cast<std::int64_t>(d);
}

} // namespace

const json *find_field(const json &record, const std::string &path) {
  if (!record.is_object())
    return nullptr;

  auto it = record.find(path);
  if (it != record.end())
    return &*it;
  if (path.find('.') == std::string::npos)
    return nullptr;

  const json *cur = &record;
  std::size_t begin = 0;
  while (begin <= path.size()) {
    std::size_t dot = path.find('.', begin);
    if (dot == std::string::npos)
      dot = path.size();
    if (!cur->is_object())
      return nullptr;
    auto child = cur->find(path.substr(begin, dot - begin));
    if (child == cur->end())
      return nullptr;
    cur = &*child;
    begin = dot + 1;
  }
  return cur;
}

std::int64_t field_as_int(const json &v) {
  switch (v.type()) {
  case json::value_t::number_integer:
    return v.get<std::int64_t>();
  case json::value_t::number_unsigned: {
    const auto u = v.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      return 0;
    return static_cast<std::int64_t>(u);
  }
  case json::value_t::number_float:
    return truncate_to_int(v.get<double>());
  case json::value_t::string: {
    const auto &s = v.get_ref<const std::string &>();
    std::int64_t out = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    if (res.ec == std::errc() && res.ptr == s.data() + s.size())
      return out;
    double d = 0.0;
    return parse_finite_double(s, d) ? truncate_to_int(d) : 0;
  }
  case json::value_t::boolean:
    return v.get<bool>() ? 1 : 0;
  default:
    return 0;
  }
}

double field_as_double(const json &v) {
  switch (v.type()) {
  case json::value_t::number_integer:
  case json::value_t::number_unsigned:
  case json::value_t::number_float:
    return v.get<double>();
  case json::value_t::string: {
    double d = 0.0;
    return parse_finite_double(v.get_ref<const std::string &>(), d) ? d : 0.0;
  }
  case json::value_t::boolean:
    return v.get<bool>() ? 1.0 : 0.0;
  default:
    return 0.0;
  }
}

std::string field_as_string(const json &v) {
  switch (v.type()) {
  case json::value_t::string:
    return v.get<std::string>();
  case json::value_t::null:
    return std::string();
  case json::value_t::boolean:
    return v.get<bool>() ? "true" : "false";
  default:
    // числа и вложенные объекты/массивы — компактный JSON-текст
    return v.dump();
  }
}

} // namespace tscompress
