#pragma once
#include "types.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace tscompress {

// Заполняет незаданные поля значениями по умолчанию:
// timestamp, ["value"], sum, 60s, 4 воркера (для workers <= 0).
// Повторный вызов ничего не меняет.
CompressorConfig resolve_config(CompressorConfig cfg);

Config config_from_json(const nlohmann::json &j);

// Нет файла — конфигурация по умолчанию. Битый JSON или длительность —
// исключение.
Config load_config(const std::string &path);

} // namespace tscompress
