// include/primes/prime.hpp
#pragma once
#include <gmpxx.h>

namespace primes {

class PrimeGenerator;

// Exact primality for any integer; n < 2 is never prime.
// Uses Miller-Rabin with a witness set that is deterministic for
// 0xffff <= n < 3317044064679887385961981, and mod-30 wheel trial division
// outside that range (slow for large primes beyond it).
bool is_prime(const mpz_class &n);

// Brute-force primality by dividing value by each candidate of generator
// until the quotient drops below the candidate. generator must yield every
// prime in ascending order; it is consumed from its current position.
bool is_prime(const mpz_class &value, PrimeGenerator &generator);

// Membership test for the set of primes.
inline bool includes(const mpz_class &n) { return is_prime(n); }

} // namespace primes
