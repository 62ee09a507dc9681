#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace tscompress {

// Поиск поля в объекте записи. Точное совпадение ключа имеет приоритет,
// иначе имя с точками — путь по вложенным объектам ("host.name").
// nullptr, если поля нет. JSON null считается присутствующим полем.
const nlohmann::json *find_field(const nlohmann::json &record,
                                 const std::string &path);

// Нестрогие преобразования значения поля (строки с числами, bool и т.п.).
std::int64_t field_as_int(const nlohmann::json &v);
double field_as_double(const nlohmann::json &v);
std::string field_as_string(const nlohmann::json &v);

} // namespace tscompress
