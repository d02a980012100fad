// include/primes/sieve_cache.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <gmpxx.h>
#include <mutex>
#include <vector>

namespace primes {

struct SieveConfig {
  std::uint64_t segment_size = 1000000; // must be even and > 0
};

// Append-only table of primes, grown one sieve segment at a time.
//
// Every cached value is prime and no prime below the last cached value is
// missing. A segment never reaches past twice the largest cached prime, so the
// cache always holds every prime up to the square root of the segment end.
class SegmentedSieveCache {
public:
  // Throws std::invalid_argument if cfg.segment_size is zero or odd.
  explicit SegmentedSieveCache(const SieveConfig &cfg = {});

  SegmentedSieveCache(const SegmentedSieveCache &) = delete;
  SegmentedSieveCache &operator=(const SegmentedSieveCache &) = delete;

  // Process-wide instance, created on first use with the default config.
  static SegmentedSieveCache &instance();

  // 0-based: get_nth_prime(0) == 2.
  mpz_class get_nth_prime(std::size_t n);

  std::size_t size() const;
  std::uint64_t max_checked() const;
  std::uint64_t segment_size() const { return segment_size_; }

private:
  void compute_primes(); // caller holds mu_

  const std::uint64_t segment_size_;
  mutable std::mutex mu_;
  std::vector<std::uint64_t> primes_;
  std::uint64_t max_checked_; // always even
};

} // namespace primes
