#include <gtest/gtest.h>
#include <tscompress/config.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
using namespace std::chrono_literals;
using tscompress::CompressorConfig;
using tscompress::config_from_json;
using tscompress::load_config;
using tscompress::resolve_config;

TEST(ResolveConfig, EmptyGetsDefaults) {
  auto c = resolve_config(CompressorConfig{});
  EXPECT_EQ(c.timestamp_field, "timestamp");
  EXPECT_EQ(c.value_fields, std::vector<std::string>{"value"});
  EXPECT_TRUE(c.group_by_fields.empty());
  EXPECT_TRUE(c.unique_fields.empty());
  EXPECT_EQ(c.aggregation_method, "sum");
  EXPECT_EQ(c.time_window, std::chrono::milliseconds(60s));
  EXPECT_EQ(c.workers, 4);
}

TEST(ResolveConfig, NegativeWorkersReplaced) {
  CompressorConfig in;
  in.workers = -1;
  EXPECT_EQ(resolve_config(in).workers, 4);
}

TEST(ResolveConfig, OnlyZeroFieldsReplaced) {
  CompressorConfig in;
  in.timestamp_field = "ts";
  in.time_window = 5min;
  auto c = resolve_config(in);
  EXPECT_EQ(c.timestamp_field, "ts");
  EXPECT_EQ(c.time_window, std::chrono::milliseconds(5min));
  EXPECT_EQ(c.value_fields, std::vector<std::string>{"value"});
  EXPECT_EQ(c.aggregation_method, "sum");
}

TEST(ResolveConfig, FullConfigUnchanged) {
  CompressorConfig in;
  in.timestamp_field = "ts";
  in.value_fields = {"cpu", "mem"};
  in.group_by_fields = {"host"};
  in.unique_fields = {"customer_id"};
  in.aggregation_method = "max";
  in.time_window = 2min;
  in.workers = 7;

  auto c = resolve_config(in);
  EXPECT_EQ(c.timestamp_field, in.timestamp_field);
  EXPECT_EQ(c.value_fields, in.value_fields);
  EXPECT_EQ(c.group_by_fields, in.group_by_fields);
  EXPECT_EQ(c.unique_fields, in.unique_fields);
  EXPECT_EQ(c.aggregation_method, in.aggregation_method);
  EXPECT_EQ(c.time_window, in.time_window);
  EXPECT_EQ(c.workers, in.workers);

  // идемпотентность
  auto again = resolve_config(c);
  EXPECT_EQ(again.value_fields, c.value_fields);
  EXPECT_EQ(again.workers, c.workers);
}

TEST(ConfigFromJson, ReadsAllKeys) {
  auto j = json::parse(R"({
    "timestamp": "ts",
    "values": ["bytes"],
    "groupby": ["server"],
    "unique": ["customer_id"],
    "method": "avg",
    "window": "2m",
    "workers": 8,
    "queue_capacity": 16
  })");
  auto cfg = config_from_json(j);
  EXPECT_EQ(cfg.compressor.timestamp_field, "ts");
  EXPECT_EQ(cfg.compressor.value_fields, std::vector<std::string>{"bytes"});
  EXPECT_EQ(cfg.compressor.group_by_fields, std::vector<std::string>{"server"});
  EXPECT_EQ(cfg.compressor.unique_fields,
            std::vector<std::string>{"customer_id"});
  EXPECT_EQ(cfg.compressor.aggregation_method, "avg");
  EXPECT_EQ(cfg.compressor.time_window, std::chrono::milliseconds(2min));
  EXPECT_EQ(cfg.compressor.workers, 8);
  EXPECT_EQ(cfg.queue_capacity, 16u);
}

TEST(ConfigFromJson, NumericWindowIsSeconds) {
  auto cfg = config_from_json(json::parse(R"({"window": 30})"));
  EXPECT_EQ(cfg.compressor.time_window, std::chrono::milliseconds(30s));
}

TEST(ConfigFromJson, MissingKeysResolvedToDefaults) {
  auto cfg = config_from_json(json::object());
  EXPECT_EQ(cfg.compressor.timestamp_field, "timestamp");
  EXPECT_EQ(cfg.compressor.workers, 4);
  EXPECT_EQ(cfg.queue_capacity, 10000u);
}

TEST(ConfigFromJson, BadWindowThrows) {
  EXPECT_THROW(config_from_json(json::parse(R"({"window": "soon"})")),
               std::invalid_argument);
}

TEST(ConfigFromJson, HugeNumericWindowThrows) {
  EXPECT_THROW(config_from_json(json::parse(R"({"window": 1e300})")),
               std::invalid_argument);
  EXPECT_THROW(config_from_json(json::parse(R"({"window": -1e300})")),
               std::invalid_argument);
}

TEST(ConfigFromJson, QueueLimits) {
  auto cfg = config_from_json(
      json::parse(R"({"queue_capacity": 3, "queue_max_bytes": 1024})"));
  EXPECT_EQ(cfg.queue_capacity, 3u);
  EXPECT_EQ(cfg.queue_max_bytes, 1024u);
}

TEST(LoadConfig, MissingFileGivesDefaults) {
  auto cfg = load_config("/nonexistent/tscompress-test.json");
  EXPECT_EQ(cfg.compressor.aggregation_method, "sum");
  EXPECT_EQ(cfg.compressor.time_window, std::chrono::milliseconds(60s));
}

TEST(LoadConfig, ReadsFileAndMalformedThrows) {
  const std::string path = ::testing::TempDir() + "tscompress_cfg_test.json";
  {
    std::ofstream f(path);
    f << R"({"method": "last", "workers": 2})";
  }
  auto cfg = load_config(path);
  EXPECT_EQ(cfg.compressor.aggregation_method, "last");
  EXPECT_EQ(cfg.compressor.workers, 2);

  {
    std::ofstream f(path, std::ios::trunc);
    f << "{ not json";
  }
  EXPECT_THROW(load_config(path), nlohmann::json::parse_error);
  std::remove(path.c_str());
}
