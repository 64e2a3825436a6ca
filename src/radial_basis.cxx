// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::exp, ::cos, ::sqrt, ::pow, ::abs, ::tgamma
#include <algorithm> // std::max

#include "radial_basis.hxx"

#include "constants.hxx" // ::pi, ::sqrtpi
#include "inline_math.hxx" // pow2, pow8, intpow, factorial
#include "recorded_warnings.hxx" // warn

namespace radial_basis {

  inline double Gamma_ell_plus_3half(int const ell) {
      // Gamma(ell + 3/2) = (2ell + 1)!! sqrt(pi) / 2^(ell + 1)
      return factorial<2>(2*ell + 1)*constants::sqrtpi/double(1ul << (ell + 1));
  } // Gamma_ell_plus_3half

  double normalization(int const ell, std::vector<double> const & alpha) {
      double const sqrt2_over_sqrtGamma = constants::sqrt2/std::sqrt(Gamma_ell_plus_3half(ell));
      double N{0};
      for (auto const a : alpha) {
          N += std::pow(2*a, 0.5*ell + 0.75)*sqrt2_over_sqrtGamma;
      } // a
      return N;
  } // normalization

  double envelope(double const r, double const r_o) {
      if (r >= r_o) return 0;
      return 1 - pow8(0.5*(1 - std::cos(constants::pi*r/r_o)));
  } // envelope

  status_t evaluate(
        double values[]
      , double const r[]
      , size_t const n
      , basis_parser::radial_function_t const & rf
      , int const ell
  ) {
      auto const nprim = rf.alpha.size();
      if (0 == nprim) {
          warn("radial function with zero-length alpha, ell= %i", ell);
          return STATUS_CONFIG_ERROR | 1;
      } // empty
      if (rf.coeff.size() != nprim) {
          warn("radial function has %ld exponents but %ld coefficients", long(nprim), long(rf.coeff.size()));
          return STATUS_SHAPE_ERROR | 1;
      } // mismatch
      double const N = normalization(ell, rf.alpha);
      double const r_o = rf.cutoff();
      for (size_t i = 0; i < n; ++i) {
          double const ri = r[i];
          if (ri >= r_o) {
              values[i] = 0;
          } else {
              double f{0};
              for (size_t ip = 0; ip < nprim; ++ip) {
                  f += rf.coeff[ip]*std::exp(-rf.alpha[ip]*ri*ri);
              } // ip
              values[i] = N*intpow(ri, ell)*envelope(ri, r_o)*f;
          } // inside
      } // i
      return 0;
  } // evaluate

  status_t radials(
        std::vector<std::vector<double>> & values
      , double const r[]
      , size_t const n
      , basis_parser::species_basis_t const & basis
  ) {
      status_t stat(0);
      values.clear();
      for (auto const & shell : basis) {
          for (auto const & rf : shell.radial) {
              values.push_back(std::vector<double>(n, 0.0));
              stat |= evaluate(values.back().data(), r, n, rf, shell.ell);
          } // rf
      } // shell
      return stat;
  } // radials

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_gamma(int const echo=0) {
      double dev{0};
      for (int ell = 0; ell < 8; ++ell) {
          dev = std::max(dev, std::abs(Gamma_ell_plus_3half(ell) - std::tgamma(ell + 1.5))/std::tgamma(ell + 1.5));
      } // ell
      if (echo > 3) std::printf("# %s: relative deviation %.1e\n", __func__, dev);
      return (dev > 1e-14);
  } // test_gamma

  status_t test_boundary_values(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      basis_parser::radial_function_t rf;
      rf.alpha = {1.0, 0.5};
      rf.coeff = {0.6, 0.4};
      rf.r_o   = {2.0, 2.5};
      double const r[] = {0.0, 1.0, 2.4999, 2.5, 3.0};
      double v[5];
      for (int ell = 0; ell < 3; ++ell) {
          stat += evaluate(v, r, 5, rf, ell);
          double const N = normalization(ell, rf.alpha);
          if (0 == ell) {
              stat += (std::abs(v[0] - N*(0.6 + 0.4)) > 1e-14*N); // r == 0
          } else {
              stat += (0.0 != v[0]); // r^ell vanishes exactly
          }
          stat += (0.0 != v[3]) + (0.0 != v[4]); // r >= r_o
          stat += (std::abs(v[2]) > 1e-6); // smooth approach to zero
          stat += !(v[1] > 0);
          if (echo > 5) std::printf("# ell=%i g= %g %g %g %g %g\n", ell, v[0], v[1], v[2], v[3], v[4]);
      } // ell
      basis_parser::radial_function_t empty;
      stat += !is_config_error(evaluate(v, r, 5, empty, 0));
      return stat;
  } // test_boundary_values

  status_t test_normalization(int const echo=0) {
      // a single primitive without envelope is normalized to one: int_0^inf g(r)^2 r^2 dr = 1
      // here the envelope is pushed far out
      status_t stat(0);
      basis_parser::radial_function_t rf;
      rf.alpha = {0.7}; rf.coeff = {1.0}; rf.r_o = {400.0};
      int const nr = 20000; double const dr = 0.001;
      std::vector<double> r(nr), v(nr);
      for (int ir = 0; ir < nr; ++ir) { r[ir] = (ir + 0.5)*dr; }
      for (int ell = 0; ell < 4; ++ell) {
          stat += evaluate(v.data(), r.data(), nr, rf, ell);
          double norm{0};
          for (int ir = 0; ir < nr; ++ir) { norm += pow2(v[ir]*r[ir])*dr; }
          if (echo > 3) std::printf("# %s: ell=%i norm= %.9f\n", __func__, ell, norm);
          stat += (std::abs(norm - 1) > 1e-4);
      } // ell
      return stat;
  } // test_normalization

  status_t test_radials(int const echo=0) {
      basis_parser::species_basis_t basis;
      basis.push_back(basis_parser::make_shell(0, {{1.0}, {0.3}}, {{1.0}, {1.0}}, {{2.0}, {3.0}}));
      basis.push_back(basis_parser::make_shell(2, {{0.8}}, {{1.0}}, {{2.5}}));
      double const r[] = {0.5, 2.1};
      std::vector<std::vector<double>> values;
      status_t stat = radials(values, r, 2, basis);
      stat += (3 != values.size());
      if (3 == values.size()) {
          stat += (0.0 != values[0][1]); // beyond r_o= 2.0 of the first radial function
          stat += !(values[1][1] > 0) + !(values[2][1] > 0);
      } // 3
      return stat;
  } // test_radials

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_gamma(echo);
      stat += test_boundary_values(echo);
      stat += test_normalization(echo);
      stat += test_radials(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace radial_basis
