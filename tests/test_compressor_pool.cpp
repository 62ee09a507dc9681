#include <gtest/gtest.h>
#include <tscompress/compressor_pool.hpp>
#include <tscompress/metrics.hpp>

#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using tscompress::Compressor;
using tscompress::CompressorConfig;
using tscompress::CompressorPool;
using tscompress::PayloadQueue;

TEST(CompressorPool, WritesOneLinePerGoodMessage) {
  CompressorConfig cfg;
  cfg.workers = 3;
  Compressor compressor(cfg);
  PayloadQueue queue(8, 1 << 20);
  std::ostringstream out;

  const auto failed_before = tscompress::g_messages_failed.load();
  const auto out_before = tscompress::g_messages_out.load();

  CompressorPool pool(compressor, queue, out);
  pool.start();
  for (int i = 1; i <= 10; ++i) {
    ASSERT_TRUE(queue.push("[{\"timestamp\": " + std::to_string(i * 1000) +
                           ", \"value\": " + std::to_string(i) + "}]"));
  }
  ASSERT_TRUE(queue.push("not json"));
  pool.stop();

  std::istringstream lines(out.str());
  std::string line;
  std::set<double> values;
  while (std::getline(lines, line)) {
    auto arr = json::parse(line);
    ASSERT_EQ(arr.size(), 1u);
    values.insert(arr[0]["value"].get<double>());
  }
  EXPECT_EQ(values.size(), 10u);
  EXPECT_EQ(*values.begin(), 1.0);
  EXPECT_EQ(*values.rbegin(), 10.0);
  EXPECT_EQ(tscompress::g_messages_failed.load() - failed_before, 1u);
  EXPECT_EQ(tscompress::g_messages_out.load() - out_before, 10u);
  EXPECT_EQ(queue.stats().accepted, 11u);
  EXPECT_EQ(queue.stats().pending, 0u);
}
