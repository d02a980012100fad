// src/sieve_cache.cpp
#include "primes/sieve_cache.hpp"
#include "primes/log.hpp"

#include <algorithm> // std::min, std::max
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace primes {

// Cached primes are handed to mpz_class as unsigned long.
static_assert(sizeof(unsigned long) >= sizeof(std::uint64_t),
              "unsigned long must hold a 64-bit cache entry");

namespace {

// Seed table; both caches start from the primes below 102.
constexpr std::uint64_t kSeedPrimes[] = {2,  3,  5,  7,  11, 13, 17, 19, 23,
                                         29, 31, 37, 41, 43, 47, 53, 59, 61,
                                         67, 71, 73, 79, 83, 89, 97, 101};

std::uint64_t isqrt(std::uint64_t n) {
  auto r = static_cast<std::uint64_t>(std::sqrt(static_cast<double>(n)));
  while (r * r > n)
    --r;
  while ((r + 1) * (r + 1) <= n)
    ++r;
  return r;
}

} // namespace

SegmentedSieveCache::SegmentedSieveCache(const SieveConfig &cfg)
    : segment_size_(cfg.segment_size),
      primes_(std::begin(kSeedPrimes), std::end(kSeedPrimes)),
      max_checked_(primes_.back() + 1) {
  if (segment_size_ == 0 || segment_size_ % 2 != 0)
    throw std::invalid_argument("sieve segment size must be a positive even "
                                "number");
}

SegmentedSieveCache &SegmentedSieveCache::instance() {
  static SegmentedSieveCache cache;
  return cache;
}

mpz_class SegmentedSieveCache::get_nth_prime(std::size_t n) {
  std::lock_guard<std::mutex> lock(mu_);
  while (primes_.size() <= n)
    compute_primes();
  return mpz_class(static_cast<unsigned long>(primes_[n]));
}

std::size_t SegmentedSieveCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return primes_.size();
}

std::uint64_t SegmentedSieveCache::max_checked() const {
  std::lock_guard<std::mutex> lock(mu_);
  return max_checked_;
}

void SegmentedSieveCache::compute_primes() {
  const std::uint64_t max_cached_prime = primes_.back();
  if (max_cached_prime > max_checked_)
    max_checked_ = max_cached_prime + 1;

  const std::uint64_t segment_min = max_checked_;
  const std::uint64_t segment_max =
      std::min(segment_min + segment_size_, max_cached_prime * 2);
  const std::uint64_t root = isqrt(segment_max);

  // composite[i] stands for segment_min + 1 + 2*i.
  const std::uint64_t first = segment_min + 1;
  const std::size_t count = static_cast<std::size_t>((segment_max - first) / 2 + 1);
  std::vector<char> composite(count, 0);

  // Skip 2: the segment holds odd numbers only.
  for (std::size_t i = 1; i < primes_.size(); ++i) {
    const std::uint64_t prime = primes_[i];
    if (prime > root)
      break;
    // First odd multiple of prime inside the segment.
    std::uint64_t m = std::max((first + prime - 1) / prime * prime, prime * prime);
    if (m % 2 == 0)
      m += prime;
    for (std::uint64_t j = (m - first) / 2; j < count; j += prime)
      composite[j] = 1;
  }

  const std::size_t before = primes_.size();
  for (std::size_t j = 0; j < count; ++j) {
    if (!composite[j])
      primes_.push_back(first + 2 * j);
  }
  max_checked_ = segment_max;

  logger()->debug("sieve segment ({}, {}]: +{} primes, {} cached", segment_min,
                  segment_max, primes_.size() - before, primes_.size());
}

} // namespace primes
