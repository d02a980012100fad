// src/primes_core.cpp
#include "primes/primes.hpp"

#include <cctype>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}
} // namespace

namespace primes {

std::string engine_info() {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         compiler_info();
}

mpz_class parse_integer(const std::string &text) {
  std::size_t b = 0, e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1])))
    --e;

  std::size_t digits = b;
  if (digits < e && (text[digits] == '-' || text[digits] == '+'))
    ++digits;
  if (digits == e)
    throw std::invalid_argument("expected an integer, got '" + text + "'");
  for (std::size_t i = digits; i < e; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      throw std::invalid_argument("expected an integer, got '" + text + "'");
  }

  // mpz_set_str rejects a leading '+'.
  std::string body = text.substr(digits, e - digits);
  mpz_class value(body, 10);
  if (text[b] == '-')
    value = -value;
  return value;
}

} // namespace primes
