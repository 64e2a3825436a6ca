#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cstdlib> // size_t
#include <cmath> // std::abs, ::pow

#include "status.hxx" // status_t, STATUS_TEST_NOT_INCLUDED

  template <typename T> inline T constexpr pow2(T const x) { return x*x; }
  template <typename T> inline T constexpr pow4(T const x) { return pow2(pow2(x)); }
  template <typename T> inline T constexpr pow8(T const x) { return pow2(pow4(x)); }

  template <typename real_t> inline
  real_t intpow(real_t const x, unsigned const nexp) {
      // power function using recursive doubling, only non-negative powers possible
      unsigned n{nexp};
      real_t xbin{x}, xpow{real_t(1)};
      while (n) {
          if (n & 0x1) xpow *= xbin; // if n modulo 2 == 1
          n >>= 1; // divide n by 2
          xbin *= xbin; // square x
      } // while n is nonzero
      return xpow;
  } // intpow

  template <unsigned Step=1> inline
  double constexpr factorial(unsigned const n) {
      return (n > 1)? factorial<Step>(n - Step)*double(n) : 1;
  } // factorial n! for Step=1 and double_factorial n!! for Step=2

  template <typename real_t> inline
  void set(real_t y[], size_t const n, real_t const a) {
      for (size_t i = 0; i < n; ++i) { y[i] = a; }
  } // set

  template <typename real_t, typename real_a_t> inline
  void set(real_t y[], size_t const n, real_a_t const a[]) {
      for (size_t i = 0; i < n; ++i) { y[i] = a[i]; }
  } // set

  template <typename real_t, typename real_a_t> inline
  double dot_product(size_t const n, real_t const bra[], real_a_t const ket[]) {
      double dot{0};
      for (size_t i = 0; i < n; ++i) {
          dot += bra[i]*ket[i];
      } // i
      return dot;
  } // dot_product

namespace inline_math {

#ifdef    NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else  // NO_UNIT_TESTS

  inline status_t test_factorials(int const echo=0) {
      status_t stat(0);
      stat += (factorial(5) != 120);
      stat += (factorial<2>(7) != 105); // 7!! = 7*5*3*1
      stat += (factorial<2>(0) != 1);
      return stat;
  } // test_factorials

  inline status_t test_intpow(int const echo=0) {
      double maxdev{0};
      for (int n = 0; n < 12; ++n) {
          auto const dev = std::abs(intpow(1.1, n) - std::pow(1.1, n));
          maxdev = (dev > maxdev) ? dev : maxdev;
      } // n
      if (echo > 3) std::printf("# %s: max deviation %.1e\n", __func__, maxdev);
      return (maxdev > 1e-14);
  } // test_intpow

  inline status_t all_tests(int const echo=0) {
      status_t stat(0);
      stat += test_factorials(echo);
      stat += test_intpow(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace inline_math
