#include "primes/log.hpp"
#include "primes/primes.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void usage() {
  std::cerr << "usage: primes_cli [--generator=eratosthenes|trial|23] "
               "[--bench=N] [--verbose|--quiet]\n"
               "                  prime N... | factor N... | list BOUND | "
               "first COUNT\n"
               "  --generator=23 lists pseudo-primes (adds composites such as "
               "25, 35)\n";
}

// Runs one command on one argument; prints only on the first repeat.
void run(const std::string &cmd, const std::string &arg,
         const std::string &gen_name, bool print) {
  const mpz_class n = primes::parse_integer(arg);
  if (cmd == "prime") {
    const bool p = primes::is_prime(n);
    if (print)
      std::cout << n.get_str() << ": " << (p ? "prime" : "composite") << "\n";
  } else if (cmd == "factor") {
    auto gen = primes::make_generator(gen_name);
    const auto pd = primes::prime_division(n, *gen);
    if (print)
      std::cout << n.get_str() << " = " << primes::to_string(pd) << "\n";
  } else if (cmd == "list") {
    auto gen = primes::make_generator(gen_name);
    primes::each(n, *gen, [&](const mpz_class &p) {
      if (print)
        std::cout << p.get_str() << "\n";
    });
  } else if (cmd == "first") {
    if (n < 0)
      throw std::invalid_argument("count must be >= 0");
    auto gen = primes::make_generator(gen_name);
    mpz_class left = n;
    gen->each([&](const mpz_class &p) {
      if (left == 0)
        return false;
      if (print)
        std::cout << p.get_str() << "\n";
      --left;
      return true;
    });
  } else {
    throw std::invalid_argument("unknown command '" + cmd + "'");
  }
}

} // namespace

int main(int argc, char **argv) {
  // Flags: --generator=NAME, --bench=N (repeat), --verbose, --quiet
  unsigned repeats = 1;
  std::string gen_name = "eratosthenes";
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--generator=", 0) == 0) {
      gen_name = a.substr(12);
    } else if (a.rfind("--bench=", 0) == 0) {
      try {
        repeats = std::stoul(a.substr(8));
      } catch (const std::exception &) {
        std::cerr << "bad --bench value '" << a.substr(8) << "'\n";
        return 2;
      }
      if (repeats == 0)
        repeats = 1;
    } else if (a == "--verbose") {
      primes::logger()->set_level(spdlog::level::debug);
    } else if (a == "--quiet") {
      primes::logger()->set_level(spdlog::level::warn);
    } else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      args.push_back(a);
    }
  }
  if (args.size() < 2) {
    usage();
    return 2;
  }

  const std::string cmd = args.front();
  primes::logger()->debug("primes {} ({}), command '{}', generator '{}'",
                          primes::PRIMES_VERSION, primes::engine_info(), cmd,
                          gen_name);

  int status = 0;
  for (std::size_t k = 1; k < args.size(); ++k) {
    std::uint64_t best = UINT64_MAX, sum = 0;
    try {
      for (unsigned r = 0; r < repeats; ++r) {
        auto t0 = std::chrono::steady_clock::now();
        run(cmd, args[k], gen_name, r == 0);
        auto t1 = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0)
                      .count();
        sum += ns;
        if ((std::uint64_t)ns < best)
          best = ns;
      }
    } catch (const std::exception &e) {
      primes::logger()->error("{} {}: {}", cmd, args[k], e.what());
      status = 1;
      continue;
    }
    if (repeats > 1) {
      std::cout << cmd << " " << args[k] << " bench repeats=" << repeats
                << " | best(ns)=" << best << " | avg(ns)=" << (sum / repeats)
                << "\n";
    }
  }
  return status;
}
