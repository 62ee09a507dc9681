#pragma once
#include <stdexcept>
#include <string>

namespace tscompress {

// Вход не JSON или верхний уровень не массив.
class InputFormatError : public std::runtime_error {
public:
  explicit InputFormatError(const std::string &msg) : std::runtime_error(msg) {}
};

// Не удалось сериализовать результат агрегации.
class SerializationError : public std::runtime_error {
public:
  explicit SerializationError(const std::string &msg)
      : std::runtime_error(msg) {}
};

} // namespace tscompress
