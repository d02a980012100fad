// src/generator.cpp
#include "primes/generator.hpp"

#include <stdexcept>
#include <string>

namespace primes {

mpz_class Generator23::succ() {
  if (step_) {
    prime_ += step_;
    step_ = 6 - step_;
  } else if (prime_ == 1) {
    prime_ = 2;
  } else if (prime_ == 2) {
    prime_ = 3;
  } else {
    prime_ = 5;
    step_ = 2;
  }
  return prime_;
}

void Generator23::rewind() {
  prime_ = 1;
  step_ = 0;
}

std::unique_ptr<PrimeGenerator> make_generator(std::string_view name) {
  if (name == "eratosthenes")
    return std::make_unique<EratosthenesGenerator>();
  if (name == "trial")
    return std::make_unique<TrialDivisionGenerator>();
  if (name == "23")
    return std::make_unique<Generator23>();
  throw std::invalid_argument("unknown generator '" + std::string(name) +
                              "' (expected eratosthenes, trial or 23)");
}

} // namespace primes
