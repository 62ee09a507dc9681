#include "tscompress/compressor.hpp"
#include "tscompress/compressor_pool.hpp"
#include "tscompress/config.hpp"
#include "tscompress/line_reader.hpp"
#include "tscompress/log.hpp"
#include "tscompress/metrics.hpp"
#include "tscompress/payload_queue.hpp"

#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace tscompress;

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

static void print_usage(const char *argv0) {
  std::fprintf(stderr,
               "Usage: %s [--config PATH] [--output-dir DIR] [FILE...]\n"
               "  FILE...  compress each file (JSON array) into "
               "FILE.compressed.json\n"
               "  no files: read one JSON array per stdin line, write "
               "compressed lines to stdout\n",
               argv0);
}

static std::string describe(const CompressorConfig &c) {
  std::ostringstream ss;
  auto list = [&ss](const std::vector<std::string> &v) {
    ss << '[';
    for (std::size_t i = 0; i < v.size(); ++i)
      ss << (i ? "," : "") << v[i];
    ss << ']';
  };
  ss << "timestamp=" << c.timestamp_field << " values=";
  list(c.value_fields);
  ss << " groupby=";
  list(c.group_by_fields);
  ss << " unique=";
  list(c.unique_fields);
  ss << " method=" << c.aggregation_method
     << " window=" << c.time_window.count() << "ms"
     << " workers=" << c.workers;
  return ss.str();
}

static fs::path output_path(const std::string &input,
                            const std::string &output_dir) {
  fs::path in(input);
  fs::path name = in.filename();
  name += ".compressed.json";
  if (output_dir.empty())
    return in.parent_path() / name;
  return fs::path(output_dir) / name;
}

static int run_batch(const Compressor &compressor,
                     const std::vector<std::string> &files,
                     const std::string &output_dir) {
  std::vector<std::string> payloads;
  std::vector<std::size_t> payload_file; // индекс файла для каждого payload
  int failed = 0;

  for (std::size_t i = 0; i < files.size(); ++i) {
    std::ifstream f(files[i], std::ios::binary);
    if (!f) {
      log_err("IO", "cannot read " + files[i]);
      ++failed;
      continue;
    }
    payloads.emplace_back(std::istreambuf_iterator<char>(f),
                          std::istreambuf_iterator<char>());
    payload_file.push_back(i);
  }

  auto results = compressor.compress_batch(payloads);

  for (std::size_t k = 0; k < results.size(); ++k) {
    const std::string &src = files[payload_file[k]];
    if (!results[k]) {
      log_err("BATCH", "failed to compress " + src);
      ++failed;
      continue;
    }

    const fs::path dst = output_path(src, output_dir);
    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    out << *results[k];
    if (!out) {
      log_err("IO", "cannot write " + dst.string());
      ++failed;
      continue;
    }

    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "%s: %zu bytes -> %zu bytes (%.2f%% reduction)",
                  src.c_str(), payloads[k].size(), results[k]->size(),
                  compression_ratio(payloads[k], *results[k]) * 100.0);
    log_info("BATCH", buf);
  }

  return failed ? 1 : 0;
}

static int run_stream(const Compressor &compressor, const Config &cfg) {
  WakePipe wake;
  PayloadQueue queue(cfg.queue_capacity, cfg.queue_max_bytes);

  CompressorPool pool(compressor, queue, std::cout);
  pool.start();

  boost::asio::io_context ioc;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int) {
    if (ec)
      return; // вход закончился раньше сигнала
    log_info("SIG", "stopping...");
    wake.wake();
    queue.close();
  });

  boost::thread reader([&] {
    read_lines(STDIN_FILENO, wake.read_end(), queue);
    queue.close();
    boost::asio::post(ioc, [&signals] { signals.cancel(); });
  });

  log_info("MAIN", "reading JSON arrays from stdin, one per line");
  ioc.run();

  reader.join();
  pool.stop(); // дожидаемся разбора оставшихся в очереди сообщений

  log_info("MAIN", "done: " + metrics_summary(queue.stats()));
  return 0;
}

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  std::string cfg_path = "tscompress.json";
  std::string output_dir;
  std::vector<std::string> files;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      cfg_path = argv[++i];
    else if (a == "--output-dir" && i + 1 < argc)
      output_dir = argv[++i];
    else if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      return 0;
    } else
      files.push_back(a);
  }

  Config cfg;
  try {
    cfg = load_config(cfg_path);
  } catch (const std::exception &e) {
    std::cerr << "[FATAL] config error: " << e.what() << std::endl;
    return 1;
  }

  Compressor compressor(cfg.compressor);
  log_info("CFG", describe(compressor.config()));

  if (!files.empty())
    return run_batch(compressor, files, output_dir);
  return run_stream(compressor, cfg);
}
