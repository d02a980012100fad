// include/primes/primes.hpp
#pragma once
#include <optional>
#include <string>
#include <utility>

#include <gmpxx.h>

#include "factorize.hpp"
#include "generator.hpp"
#include "prime.hpp"

namespace primes {

// Bump on any change to the public API.
inline constexpr const char *PRIMES_VERSION = "0.2.0";

// e.g. "gmp:6.3.0; gcc:13.2.0"
std::string engine_info();

// Parses a decimal integer with optional sign and surrounding blanks.
// Throws std::invalid_argument on anything else.
mpz_class parse_integer(const std::string &text);

// All primes <= ubound (every prime if unset), from the shared sieve cache.
// The returned generator is a lazy sequence: iterate it with range-for.
inline EratosthenesGenerator each(std::optional<mpz_class> ubound = {}) {
  EratosthenesGenerator gen;
  gen.set_upper_bound(std::move(ubound));
  return gen;
}

// Calls fn for every value of generator up to ubound. fn may return false to
// stop early.
template <class F>
void each(std::optional<mpz_class> ubound, PrimeGenerator &generator,
          F &&fn) {
  generator.set_upper_bound(std::move(ubound));
  generator.each(std::forward<F>(fn));
}

} // namespace primes
