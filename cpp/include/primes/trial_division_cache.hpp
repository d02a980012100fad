// include/primes/trial_division_cache.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <gmpxx.h>
#include <mutex>
#include <vector>

namespace primes {

// Prime table extended by trial division of 6k+1 / 6k+5 candidates against
// the primes already cached. Independent of SegmentedSieveCache.
class TrialDivisionCache {
public:
  TrialDivisionCache();

  TrialDivisionCache(const TrialDivisionCache &) = delete;
  TrialDivisionCache &operator=(const TrialDivisionCache &) = delete;

  static TrialDivisionCache &instance();

  // 0-based index into the table, extending it as needed.
  mpz_class at(std::size_t index);
  mpz_class operator[](std::size_t index) { return at(index); }

  std::size_t size() const;

private:
  bool has_cached_divisor(std::uint64_t candidate) const;

  mutable std::mutex mu_;
  std::vector<std::uint64_t> primes_;
  // No primes lie between primes_.back() and next_to_check_ (which is 1 mod 6).
  std::uint64_t next_to_check_;
  // Largest index whose prime is checked as a divisor, and the square of the
  // prime after it; moved forward as candidates grow, never recomputed.
  std::size_t ulticheck_index_;
  std::uint64_t ulticheck_next_squared_;
};

} // namespace primes
