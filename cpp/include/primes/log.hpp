// include/primes/log.hpp
#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace primes {

// Shared "primes" logger (stderr, colored). Created on first call; safe to
// call from any thread.
std::shared_ptr<spdlog::logger> logger();

} // namespace primes
