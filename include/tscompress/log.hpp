#pragma once
#include <cstdio>
#include <string>

namespace tscompress {

// stdout занят данными stream-режима, поэтому всё пишем в stderr.
inline void log_err(const char *tag, const std::string &msg) {
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
  std::fflush(stderr);
}

inline void log_info(const char *tag, const std::string &msg) {
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
  std::fflush(stderr);
}

} // namespace tscompress
