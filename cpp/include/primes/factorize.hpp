// include/primes/factorize.hpp
#pragma once
#include <gmpxx.h>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace primes {

class PrimeGenerator;

// One prime power of a factorization. prime is -1 for the sign of a negative
// input.
struct Factor {
  mpz_class prime;
  unsigned long exponent = 0;

  friend bool operator==(const Factor &a, const Factor &b) {
    return a.prime == b.prime && a.exponent == b.exponent;
  }
  friend bool operator!=(const Factor &a, const Factor &b) { return !(a == b); }
};

using PrimeDivision = std::vector<Factor>;

// Thrown when factoring zero.
class division_by_zero : public std::domain_error {
public:
  division_by_zero() : std::domain_error("divided by 0") {}
};

// Factorization of value as ascending (prime, exponent) pairs, prefixed with
// (-1, 1) when value < 0. generator must yield every prime in ascending order
// and may yield composites as well; it is consumed from its current position.
// Throws division_by_zero if value == 0. prime_division(1) is empty.
PrimeDivision prime_division(const mpz_class &value, PrimeGenerator &generator);

// Same, with a fresh Generator23.
PrimeDivision prime_division(const mpz_class &value);

// Builds a Factor from arbitrary-precision values. Throws std::invalid_argument
// if exponent is negative or does not fit an unsigned long.
Factor make_factor(const mpz_class &prime, const mpz_class &exponent);

// Product of prime^exponent over pd; 1 for an empty pd.
mpz_class int_from_prime_division(const PrimeDivision &pd);

// "-1 * 3^2 * 5"; "1" for an empty factorization.
std::string to_string(const PrimeDivision &pd);

std::ostream &operator<<(std::ostream &os, const Factor &f);

} // namespace primes
