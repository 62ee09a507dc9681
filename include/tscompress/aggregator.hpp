#pragma once
#include <string>
#include <vector>

namespace tscompress {

enum class AggregationMethod { Sum, Avg, Min, Max, Count, First, Last };

// Неизвестное имя метода трактуется как sum.
AggregationMethod parse_method(const std::string &name);

// Свёртка значений группы. Пустой вход всегда даёт 0.
double aggregate(const std::vector<double> &values, AggregationMethod method);
double aggregate(const std::vector<double> &values, const std::string &method);

} // namespace tscompress
