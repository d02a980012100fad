// src/trial_division_cache.cpp
#include "primes/trial_division_cache.hpp"
#include "primes/log.hpp"

namespace primes {

// Cached primes are handed to mpz_class as unsigned long.
static_assert(sizeof(unsigned long) >= sizeof(std::uint64_t),
              "unsigned long must hold a 64-bit cache entry");

TrialDivisionCache::TrialDivisionCache()
    : primes_{2,  3,  5,  7,  11, 13, 17, 19, 23, 29, 31, 37, 41,
              43, 47, 53, 59, 61, 67, 71, 73, 79, 83, 89, 97, 101},
      next_to_check_(103),      // primes_.back() - primes_.back() % 6 + 7
      ulticheck_index_(3),      // 7 is the largest prime below sqrt(103)
      ulticheck_next_squared_(121) {}

TrialDivisionCache &TrialDivisionCache::instance() {
  static TrialDivisionCache cache;
  return cache;
}

bool TrialDivisionCache::has_cached_divisor(std::uint64_t candidate) const {
  // Candidates are 1 or 5 mod 6, so 2 and 3 never divide them.
  for (std::size_t i = 2; i <= ulticheck_index_; ++i) {
    if (candidate % primes_[i] == 0)
      return true;
  }
  return false;
}

mpz_class TrialDivisionCache::at(std::size_t index) {
  std::lock_guard<std::mutex> lock(mu_);
  if (index >= primes_.size()) {
    const std::size_t before = primes_.size();
    while (index >= primes_.size()) {
      if (next_to_check_ + 4 > ulticheck_next_squared_) {
        ++ulticheck_index_;
        const std::uint64_t p = primes_[ulticheck_index_ + 1];
        ulticheck_next_squared_ = p * p;
      }
      if (!has_cached_divisor(next_to_check_))
        primes_.push_back(next_to_check_);
      next_to_check_ += 4;
      if (!has_cached_divisor(next_to_check_))
        primes_.push_back(next_to_check_);
      next_to_check_ += 2;
    }
    logger()->debug("trial division: +{} primes up to {}, {} cached",
                    primes_.size() - before, primes_.back(), primes_.size());
  }
  return mpz_class(static_cast<unsigned long>(primes_[index]));
}

std::size_t TrialDivisionCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return primes_.size();
}

} // namespace primes
