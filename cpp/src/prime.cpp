// src/prime.cpp
#include "primes/prime.hpp"
#include "primes/generator.hpp"

#include <gmp.h>
#include <gmpxx.h>
#include <vector>

namespace primes {
namespace {

struct BasisSet {
  mpz_class limit; // set applies to n < limit
  std::vector<unsigned long> bases;
};

// Thresholds and witnesses from the deterministic Miller-Rabin literature.
// Below 0xffff trial division is faster, so the table starts there.
const std::vector<BasisSet> &basis_table() {
  static const std::vector<BasisSet> table = {
      {mpz_class("1373653"), {2, 3}},
      {mpz_class("9080191"), {31, 73}},
      {mpz_class("25326001"), {2, 3, 5}},
      {mpz_class("3215031751"), {2, 3, 5, 7}},
      {mpz_class("4759123141"), {2, 7, 61}},
      {mpz_class("1122004669633"), {2, 13, 23, 1662803}},
      {mpz_class("2152302898747"), {2, 3, 5, 7, 11}},
      {mpz_class("3474749660383"), {2, 3, 5, 7, 11, 13}},
      {mpz_class("341550071728321"), {2, 3, 5, 7, 11, 13, 17}},
      {mpz_class("3825123056546413051"), {2, 3, 5, 7, 11, 13, 17, 19, 23}},
      {mpz_class("318665857834031151167461"),
       {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37}},
      {mpz_class("3317044064679887385961981"),
       {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37, 41}},
  };
  return table;
}

constexpr unsigned long kSmallLimit = 0xffff;

// nullptr outside the table's domain.
const std::vector<unsigned long> *miller_rabin_bases(const mpz_class &n) {
  if (n < kSmallLimit)
    return nullptr;
  for (const BasisSet &set : basis_table()) {
    if (n < set.limit)
      return &set.bases;
  }
  return nullptr;
}

bool miller_rabin_test(const mpz_class &n,
                       const std::vector<unsigned long> &bases) {
  if (mpz_even_p(n.get_mpz_t()))
    return false;

  // n-1 = d * 2^(r+1) with d odd; r is the number of extra squarings.
  mpz_class d = n >> 1;
  unsigned long r = 0;
  while (mpz_even_p(d.get_mpz_t())) {
    d >>= 1;
    ++r;
  }

  const mpz_class n_minus_1 = n - 1;
  mpz_class x;
  for (unsigned long a : bases) {
    const mpz_class base = a;
    mpz_powm(x.get_mpz_t(), base.get_mpz_t(), d.get_mpz_t(), n.get_mpz_t());
    if (x == 1 || x == n_minus_1 || base == n)
      continue;

    bool reached = false;
    for (unsigned long i = 0; i < r; ++i) {
      mpz_powm_ui(x.get_mpz_t(), x.get_mpz_t(), 2, n.get_mpz_t());
      if (x == n_minus_1) {
        reached = true;
        break;
      }
    }
    if (!reached)
      return false; // a witnesses compositeness
  }
  return true;
}

// Trial division by every integer coprime to 30 up to isqrt(n).
bool wheel_trial_division(const mpz_class &n) {
  if (n == 5)
    return true;
  if (mpz_gcd_ui(nullptr, n.get_mpz_t(), 30) != 1)
    return false;

  mpz_class root;
  mpz_sqrt(root.get_mpz_t(), n.get_mpz_t());

  static constexpr unsigned long offsets[] = {0, 4, 6, 10, 12, 16, 22, 24};
  mpz_class q;
  for (mpz_class p = 7; p <= root; p += 30) {
    for (unsigned long off : offsets) {
      q = p + off;
      if (mpz_divisible_p(n.get_mpz_t(), q.get_mpz_t()))
        return false;
    }
  }
  return true;
}

} // namespace

bool is_prime(const mpz_class &n) {
  if (n <= 3)
    return n >= 2;

  if (const std::vector<unsigned long> *bases = miller_rabin_bases(n))
    return miller_rabin_test(n, *bases);

  return wheel_trial_division(n);
}

bool is_prime(const mpz_class &value, PrimeGenerator &generator) {
  if (value < 2)
    return false;

  mpz_class q, r;
  bool result = false;
  generator.each([&](const mpz_class &num) {
    mpz_tdiv_qr(q.get_mpz_t(), r.get_mpz_t(), value.get_mpz_t(),
                num.get_mpz_t());
    if (q < num) {
      result = true;
      return false;
    }
    if (r == 0) {
      result = false;
      return false;
    }
    return true;
  });
  return result;
}

} // namespace primes
