// src/log.cpp
#include "primes/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace primes {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> log = [] {
    if (auto existing = spdlog::get("primes"))
      return existing;
    return spdlog::stderr_color_mt("primes");
  }();
  return log;
}

} // namespace primes
