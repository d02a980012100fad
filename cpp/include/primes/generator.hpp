// include/primes/generator.hpp
#pragma once
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <gmpxx.h>

#include "sieve_cache.hpp"
#include "trial_division_cache.hpp"

namespace primes {

// External iterator over an ascending sequence of pseudo-primes: every prime
// appears, composites may too (Generator23). Concrete generators supply succ()
// and rewind(); bounded iteration is shared and lives here.
//
// A generator is a private cursor. Do not share one between threads.
class PrimeGenerator {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = mpz_class;
    using difference_type = std::ptrdiff_t;
    using pointer = const mpz_class *;
    using reference = const mpz_class &;

    iterator() = default; // end
    explicit iterator(PrimeGenerator *gen) : gen_(gen) { advance(); }

    reference operator*() const { return value_; }
    pointer operator->() const { return &value_; }
    iterator &operator++() {
      advance();
      return *this;
    }
    bool operator==(const iterator &o) const { return gen_ == o.gen_; }
    bool operator!=(const iterator &o) const { return gen_ != o.gen_; }

  private:
    void advance() {
      value_ = gen_->succ();
      if (gen_->beyond_bound(value_))
        gen_ = nullptr;
    }

    PrimeGenerator *gen_ = nullptr;
    mpz_class value_;
  };

  virtual ~PrimeGenerator() = default;

  // Advance and return the next candidate.
  virtual mpz_class succ() = 0;
  mpz_class next() { return succ(); }

  // Back to the first candidate. The upper bound is kept.
  virtual void rewind() = 0;

  const std::optional<mpz_class> &upper_bound() const { return ubound_; }
  void set_upper_bound(std::optional<mpz_class> ubound) {
    ubound_ = std::move(ubound);
  }

  // Pulls succ() from the current position; stops at the first value above
  // the upper bound, or never if there is none.
  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  // fn(value) may return bool; false stops the iteration.
  template <class F> void each(F &&fn) {
    for (iterator it = begin(); it != end(); ++it) {
      if constexpr (std::is_same_v<std::invoke_result_t<F &, const mpz_class &>,
                                   bool>) {
        if (!fn(*it))
          return;
      } else {
        fn(*it);
      }
    }
  }

  // fn(value, index) with index counting up from offset.
  template <class F> void each_with_index(F &&fn, std::size_t offset = 0) {
    each([&](const mpz_class &value) { return fn(value, offset++); });
  }

protected:
  PrimeGenerator() = default;
  PrimeGenerator(const PrimeGenerator &) = default;
  PrimeGenerator &operator=(const PrimeGenerator &) = default;

private:
  bool beyond_bound(const mpz_class &value) const {
    return ubound_ && value > *ubound_;
  }

  std::optional<mpz_class> ubound_;
};

// Primes from SegmentedSieveCache.
class EratosthenesGenerator : public PrimeGenerator {
public:
  explicit EratosthenesGenerator(
      SegmentedSieveCache &cache = SegmentedSieveCache::instance())
      : cache_(&cache) {}

  mpz_class succ() override { return cache_->get_nth_prime(next_index_++); }
  void rewind() override { next_index_ = 0; }

private:
  SegmentedSieveCache *cache_;
  std::size_t next_index_ = 0;
};

// Primes from TrialDivisionCache.
class TrialDivisionGenerator : public PrimeGenerator {
public:
  explicit TrialDivisionGenerator(
      TrialDivisionCache &cache = TrialDivisionCache::instance())
      : cache_(&cache) {}

  mpz_class succ() override { return cache_->at(next_index_++); }
  void rewind() override { next_index_ = 0; }

private:
  TrialDivisionCache *cache_;
  std::size_t next_index_ = 0;
};

// 2, 3, then every integer > 3 not divisible by 2 or 3: 5, 7, 11, 13, 17, 19,
// 23, 25, ... Composites included; needs no table, so it is the cheapest
// source for factoring numbers with many small factors.
class Generator23 : public PrimeGenerator {
public:
  Generator23() = default;

  mpz_class succ() override;
  void rewind() override;

private:
  mpz_class prime_ = 1;
  unsigned long step_ = 0; // 0 until 5 is reached, then 2 / 4
};

// "eratosthenes", "trial" or "23". Throws std::invalid_argument otherwise.
std::unique_ptr<PrimeGenerator> make_generator(std::string_view name);

} // namespace primes
