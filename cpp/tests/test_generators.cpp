#include "primes/primes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {
std::vector<mpz_class> take(primes::PrimeGenerator &gen, std::size_t n) {
  std::vector<mpz_class> out;
  for (std::size_t i = 0; i < n; ++i)
    out.push_back(gen.succ());
  return out;
}

std::vector<mpz_class> as_mpz(std::initializer_list<unsigned long> xs) {
  return std::vector<mpz_class>(xs.begin(), xs.end());
}
} // namespace

TEST_CASE("Primes up to 100") {
  std::vector<mpz_class> got;
  for (const mpz_class &p : primes::each(100))
    got.push_back(p);
  REQUIRE(got.size() == 25);
  REQUIRE(got == as_mpz({2,  3,  5,  7,  11, 13, 17, 19, 23, 29, 31, 37, 41,
                         43, 47, 53, 59, 61, 67, 71, 73, 79, 83, 89, 97}));
}

TEST_CASE("Unbounded enumeration is lazy") {
  std::vector<mpz_class> got;
  for (const mpz_class &p : primes::each()) {
    got.push_back(p);
    if (got.size() == 5)
      break;
  }
  REQUIRE(got == as_mpz({2, 3, 5, 7, 11}));
}

TEST_CASE("Bound is inclusive and applies to every generator") {
  for (const char *name : {"eratosthenes", "trial", "23"}) {
    INFO(name);
    auto gen = primes::make_generator(name);
    std::vector<mpz_class> got;
    primes::each(mpz_class(13), *gen,
                 [&](const mpz_class &p) { got.push_back(p); });
    REQUIRE(got == as_mpz({2, 3, 5, 7, 11, 13}));
  }

  primes::EratosthenesGenerator gen;
  gen.set_upper_bound(mpz_class(1));
  REQUIRE(gen.begin() == gen.end());
  gen.set_upper_bound(std::nullopt);
  REQUIRE_FALSE(gen.upper_bound().has_value());
}

TEST_CASE("Bounded enumeration matches a reference sieve") {
  const unsigned long bound = 50000;
  std::vector<bool> composite(bound + 1, false);
  std::vector<mpz_class> ref;
  for (unsigned long i = 2; i <= bound; ++i) {
    if (composite[i])
      continue;
    ref.push_back(i);
    for (unsigned long j = i * i; j <= bound; j += i)
      composite[j] = true;
  }

  std::vector<mpz_class> sieve, trial;
  for (const mpz_class &p : primes::each(bound))
    sieve.push_back(p);
  primes::TrialDivisionGenerator tgen;
  primes::each(mpz_class(bound), tgen,
               [&](const mpz_class &p) { trial.push_back(p); });
  REQUIRE(sieve == ref);
  REQUIRE(trial == ref);
}

TEST_CASE("Eratosthenes and trial division generators agree") {
  primes::EratosthenesGenerator sieve;
  primes::TrialDivisionGenerator trial;
  for (int i = 0; i < 10000; ++i)
    REQUIRE(sieve.succ() == trial.succ());
}

TEST_CASE("Generator23 skips multiples of 2 and 3") {
  primes::Generator23 gen;
  REQUIRE(take(gen, 10) == as_mpz({2, 3, 5, 7, 11, 13, 17, 19, 23, 25}));

  gen.rewind();
  mpz_class prev = gen.succ();
  REQUIRE(prev == 2);
  REQUIRE(gen.succ() == 3);
  prev = 3;
  for (int i = 0; i < 10000; ++i) {
    const mpz_class v = gen.succ();
    REQUIRE(v > prev);
    REQUIRE_FALSE(mpz_divisible_ui_p(v.get_mpz_t(), 2));
    REQUIRE_FALSE(mpz_divisible_ui_p(v.get_mpz_t(), 3));
    prev = v;
  }
}

TEST_CASE("Rewind replays the same sequence") {
  for (const char *name : {"eratosthenes", "trial", "23"}) {
    INFO(name);
    auto gen = primes::make_generator(name);
    const auto first = take(*gen, 500);
    gen->rewind();
    REQUIRE(take(*gen, 500) == first);
  }
}

TEST_CASE("Rewind keeps the upper bound") {
  primes::TrialDivisionGenerator gen;
  gen.set_upper_bound(mpz_class(10));
  std::vector<mpz_class> a, b;
  gen.each([&](const mpz_class &p) { a.push_back(p); });
  gen.rewind();
  gen.each([&](const mpz_class &p) { b.push_back(p); });
  REQUIRE(a == as_mpz({2, 3, 5, 7}));
  REQUIRE(b == a);
}

TEST_CASE("each_with_index counts from the offset") {
  primes::EratosthenesGenerator gen;
  gen.set_upper_bound(mpz_class(11));
  std::vector<std::size_t> idx;
  gen.each_with_index(
      [&](const mpz_class &, std::size_t i) { idx.push_back(i); }, 10);
  REQUIRE(idx == std::vector<std::size_t>{10, 11, 12, 13, 14});
}

TEST_CASE("Callbacks can stop early") {
  primes::Generator23 gen;
  int calls = 0;
  gen.each([&](const mpz_class &p) {
    ++calls;
    return p < 7;
  });
  REQUIRE(calls == 4); // 2, 3, 5, 7
}

TEST_CASE("Generators over private caches") {
  primes::SegmentedSieveCache cache(primes::SieveConfig{64});
  primes::EratosthenesGenerator gen(cache);
  gen.set_upper_bound(mpz_class(1000));
  std::size_t n = 0;
  for (const mpz_class &p : gen) {
    (void)p;
    ++n;
  }
  REQUIRE(n == 168);
  REQUIRE(cache.size() >= 168);
}

TEST_CASE("Unknown generator names are rejected") {
  REQUIRE_THROWS_AS(primes::make_generator("pollard"), std::invalid_argument);
}

TEST_CASE("next and succ share one cursor") {
  primes::EratosthenesGenerator gen;
  REQUIRE(gen.next() == 2);
  REQUIRE(gen.succ() == 3);
  REQUIRE(gen.next() == 5);
  gen.rewind();
  REQUIRE(gen.next() == 2);

  primes::Generator23 g23;
  REQUIRE(g23.succ() == 2);
  REQUIRE(g23.next() == 3);
  REQUIRE(g23.succ() == 5);
}

TEST_CASE("Generator23 lists pseudo-primes up to a bound") {
  auto gen = primes::make_generator("23");
  std::vector<mpz_class> got;
  primes::each(mpz_class(30), *gen,
               [&](const mpz_class &p) { got.push_back(p); });
  REQUIRE(got == as_mpz({2, 3, 5, 7, 11, 13, 17, 19, 23, 25, 29}));
  REQUIRE_FALSE(primes::is_prime(got[9]));
}
