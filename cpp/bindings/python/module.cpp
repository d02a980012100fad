#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "primes/primes.hpp"

namespace py = pybind11;

// Python ints cross the boundary as decimal text.
static mpz_class to_mpz(const py::int_ &v) {
  return primes::parse_integer(py::str(v).cast<std::string>());
}

// Rejects anything that is not a Python int (floats, strings, bools).
static mpz_class checked_mpz(py::handle h, const char *what) {
  if (!py::isinstance<py::int_>(h) || py::isinstance<py::bool_>(h))
    throw std::invalid_argument(std::string(what) + " must be an int, got " +
                                py::repr(h).cast<std::string>());
  return to_mpz(py::reinterpret_borrow<py::int_>(h));
}

static py::int_ to_py(const mpz_class &v) {
  return py::reinterpret_steal<py::int_>(
      PyLong_FromString(v.get_str().c_str(), nullptr, 10));
}

static bool is_prime_py(const py::int_ &n) {
  const mpz_class value = to_mpz(n);
  py::gil_scoped_release nogil;
  return primes::is_prime(value);
}

static py::list prime_division_py(const py::int_ &n,
                                  const std::string &generator) {
  const mpz_class value = to_mpz(n);
  auto gen = primes::make_generator(generator);
  primes::PrimeDivision pd;
  {
    py::gil_scoped_release nogil;
    pd = primes::prime_division(value, *gen);
  }
  py::list out;
  for (const primes::Factor &f : pd)
    out.append(py::make_tuple(to_py(f.prime), py::int_(f.exponent)));
  return out;
}

static py::int_ int_from_prime_division_py(const py::iterable &pairs) {
  primes::PrimeDivision pd;
  for (py::handle item : pairs) {
    if (!py::isinstance<py::tuple>(item) || py::len(item) != 2)
      throw std::invalid_argument("expected (prime, exponent) tuples, got " +
                                  py::repr(item).cast<std::string>());
    auto pair = py::reinterpret_borrow<py::tuple>(item);
    pd.push_back(primes::make_factor(checked_mpz(pair[0], "prime"),
                                     checked_mpz(pair[1], "exponent")));
  }
  return to_py(primes::int_from_prime_division(pd));
}

static py::list primes_up_to_py(const py::int_ &bound,
                                 const std::string &generator) {
  const mpz_class ubound = to_mpz(bound);
  auto gen = primes::make_generator(generator);
  std::vector<mpz_class> found;
  {
    py::gil_scoped_release nogil;
    primes::each(ubound, *gen,
                 [&](const mpz_class &p) { found.push_back(p); });
  }
  py::list out;
  for (const mpz_class &p : found)
    out.append(to_py(p));
  return out;
}

PYBIND11_MODULE(primescore, m) {
  m.doc() = "Primality, prime enumeration and factorization (pybind11)";

  m.def("is_prime", &is_prime_py, py::arg("n"),
        R"pbdoc(True iff n is prime. Exact for every integer.)pbdoc");

  m.def("prime_division", &prime_division_py, py::arg("n"),
        py::arg("generator") = "23",
        R"pbdoc(
Factor n into ascending (prime, exponent) tuples; (-1, 1) leads for n < 0.

Args:
  n (int): nonzero integer.
  generator (str): "23" (default), "eratosthenes" or "trial".

Raises:
  ZeroDivisionError: n == 0.
  ValueError: unknown generator name.
)pbdoc");

  m.def("int_from_prime_division", &int_from_prime_division_py,
        py::arg("pairs"),
        R"pbdoc(Product of prime**exponent over (prime, exponent) pairs.)pbdoc");

  m.def("primes_up_to", &primes_up_to_py, py::arg("bound"),
        py::arg("generator") = "eratosthenes",
        R"pbdoc(
List the values of generator up to bound.

"eratosthenes" and "trial" give exactly the primes <= bound. "23" is a
pseudo-prime source: it also yields composites not divisible by 2 or 3
(25, 35, ...).
)pbdoc");

  m.def("engine_info", &primes::engine_info);
  m.attr("__version__") = primes::PRIMES_VERSION;

  py::register_exception<primes::division_by_zero>(m, "DivisionByZero",
                                                   PyExc_ZeroDivisionError);
}
