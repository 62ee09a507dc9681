#include "tscompress/aggregator.hpp"

#include <algorithm>
#include <numeric>

namespace tscompress {

AggregationMethod parse_method(const std::string &name) {
  if (name == "avg" || name == "mean")
    return AggregationMethod::Avg;
  if (name == "min")
    return AggregationMethod::Min;
  if (name == "max")
    return AggregationMethod::Max;
  if (name == "count")
    return AggregationMethod::Count;
  if (name == "first")
    return AggregationMethod::First;
  if (name == "last")
    return AggregationMethod::Last;
  return AggregationMethod::Sum;
}

double aggregate(const std::vector<double> &values, AggregationMethod method) {
  if (values.empty())
    return 0.0;

  switch (method) {
  case AggregationMethod::Avg:
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
  case AggregationMethod::Min:
    return *std::min_element(values.begin(), values.end());
  case AggregationMethod::Max:
    return *std::max_element(values.begin(), values.end());
  case AggregationMethod::Count:
    return static_cast<double>(values.size());
  case AggregationMethod::First:
    return values.front();
  case AggregationMethod::Last:
    return values.back();
  case AggregationMethod::Sum:
    break;
  }
  return std::accumulate(values.begin(), values.end(), 0.0);
}

double aggregate(const std::vector<double> &values, const std::string &method) {
  return aggregate(values, parse_method(method));
}

} // namespace tscompress
