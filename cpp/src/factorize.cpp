// src/factorize.cpp
#include "primes/factorize.hpp"
#include "primes/generator.hpp"

#include <gmp.h>
#include <sstream>
#include <stdexcept>

namespace primes {

PrimeDivision prime_division(const mpz_class &value,
                             PrimeGenerator &generator) {
  if (value == 0)
    throw division_by_zero();

  PrimeDivision pv;
  mpz_class rest = value;
  if (rest < 0) {
    rest = -rest;
    pv.push_back({mpz_class(-1), 1});
  }

  mpz_class q, r;
  generator.each([&](const mpz_class &prime) {
    unsigned long count = 0;
    for (;;) {
      mpz_tdiv_qr(q.get_mpz_t(), r.get_mpz_t(), rest.get_mpz_t(),
                  prime.get_mpz_t());
      if (r != 0)
        break;
      rest = q;
      ++count;
    }
    if (count != 0)
      pv.push_back({prime, count});
    // rest < prime^2 now, so it is 1 or a prime.
    return q > prime;
  });

  if (rest > 1)
    pv.push_back({rest, 1});
  return pv;
}

PrimeDivision prime_division(const mpz_class &value) {
  Generator23 generator;
  return prime_division(value, generator);
}

Factor make_factor(const mpz_class &prime, const mpz_class &exponent) {
  if (exponent < 0 || !exponent.fits_ulong_p())
    throw std::invalid_argument("exponent must be a natural number, got " +
                                exponent.get_str());
  return {prime, exponent.get_ui()};
}

mpz_class int_from_prime_division(const PrimeDivision &pd) {
  mpz_class value = 1;
  mpz_class power;
  for (const Factor &f : pd) {
    mpz_pow_ui(power.get_mpz_t(), f.prime.get_mpz_t(), f.exponent);
    value *= power;
  }
  return value;
}

std::string to_string(const PrimeDivision &pd) {
  if (pd.empty())
    return "1";
  std::ostringstream os;
  for (std::size_t i = 0; i < pd.size(); ++i) {
    if (i)
      os << " * ";
    os << pd[i];
  }
  return os.str();
}

std::ostream &operator<<(std::ostream &os, const Factor &f) {
  os << f.prime.get_str();
  if (f.exponent != 1)
    os << '^' << f.exponent;
  return os;
}

} // namespace primes
