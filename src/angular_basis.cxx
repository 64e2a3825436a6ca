// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::sqrt, ::sin, ::cos, ::atan2, ::abs
#include <vector> // std::vector<T>
#include <algorithm> // std::max

#include "angular_basis.hxx"

#include "constants.hxx" // ::pi
#include "quantum_numbers.h" // ellmax_supported
#include "recorded_warnings.hxx" // warn

namespace angular_basis {

  void spherical_coordinates(double const v[3], double & r, double & cos_theta, double & phi) {
      double const xy2 = v[0]*v[0] + v[1]*v[1];
      r = std::sqrt(xy2 + v[2]*v[2]);
      if (r > 0) {
          cos_theta = std::max(-1., std::min(1., v[2]/r));
          phi = (xy2 > 0) ? std::atan2(v[1], v[0]) : 0.;
      } else {
          cos_theta = 1;
          phi = 0;
      }
  } // spherical_coordinates

  void Xlm_implementation(
        double xlm[]
      , int const ellmax
      , double const cth, double const sth
      , double const cph, double const sph
  ) {
      // stable upward recursion in ell for the associated Legendre functions (see notes by M. Weinert)
      int const S = (1 + ellmax); // stride for p
      std::vector<double> p(S*S); // associated Legendre functions

      // generate associated Legendre functions for m >= 0 without (-1)^m
      double fac{1};
      for (int m = 0; m < ellmax; ++m) {
          fac *= m ? (2*m - 1) : 1;
          p[m     + S*m] = fac;
          p[m + 1 + S*m] = (m + 1 + m)*cth*fac;
          // recurse upward in l
          for (int l = m + 2; l <= ellmax; ++l) {
              p[l + S*m] = ((2*l - 1)*cth*p[l - 1 + S*m] - (l + m - 1)*p[l - 2 + S*m])/double(l - m);
          } // l
          fac *= sth;
      } // m
      p[ellmax + S*ellmax] = (ellmax ? (2*ellmax - 1) : 1)*fac;

      // determine cos(m*phi) and sin(m*phi)
      std::vector<double> cs(S), sn(S);
      cs[0] = 1;
      sn[0] = 0;
      if (ellmax > 0) {
          cs[1] = cph; sn[1] = sph;
          auto const cph2 = 2*cph;
          for (int m = 2; m <= ellmax; ++m) {
              sn[m] = cph2*sn[m - 1] - sn[m - 2];
              cs[m] = cph2*cs[m - 1] - cs[m - 2];
          } // m
      } // ellmax > 0

      // multiply in the normalization factors
      double const fpi = 4*constants::pi;
      for (int l = 0; l <= ellmax; ++l) {
          int const lm0 = l*l + l;
          double const a = std::sqrt((2*l + 1.)/fpi);
          xlm[lm0] = a*p[l];
          double cd{1};
          for (int m = 1; m <= l; ++m) {
              cd /= ((l + 1. - m)*(l + m)); // (l - m)!/(l + m)!
              double const xn = a*std::sqrt(2*cd)*p[l + S*m];
              xlm[lm0 - m] = xn*sn[m]; // sine part
              xlm[lm0 + m] = xn*cs[m]; // cosine part
          } // m
      } // l

      if (ellmax > 0) {
          // reorder p-functions from (y, z, x) to (x, y, z)
          double const y = xlm[1], z = xlm[2], x = xlm[3];
          xlm[1] = x; xlm[2] = y; xlm[3] = z;
      } // ellmax > 0
  } // Xlm_implementation

  void Xlm(double xlm[], int const ellmax, double const cos_theta, double const phi) {
      double const sth = std::sqrt(std::max(0., 1 - cos_theta*cos_theta)); // theta in [0, pi]
      Xlm_implementation(xlm, ellmax, cos_theta, sth, std::cos(phi), std::sin(phi));
  } // Xlm

  void Xlm(double xlm[], int const ellmax, double const v[3]) {
      double r, cth, phi;
      spherical_coordinates(v, r, cth, phi);
      Xlm(xlm, ellmax, cth, phi);
  } // Xlm

  status_t evaluate(
        double values[]
      , int const ell
      , double const cos_theta[]
      , double const phi[]
      , size_t const n
  ) {
      if (ell < 0 || ell > ellmax_supported) {
          warn("angular momentum ell= %i not supported", ell);
          return STATUS_CONFIG_ERROR | 1;
      } // ell
      int const nm = 2*ell + 1;
      std::vector<double> xlm((ell + 1)*(ell + 1));
      for (size_t i = 0; i < n; ++i) {
          Xlm(xlm.data(), ell, cos_theta[i], phi[i]);
          for (int im = 0; im < nm; ++im) {
              values[im*n + i] = xlm[ell*ell + im];
          } // im
      } // i
      return 0;
  } // evaluate

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_reference_values(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      double const pi = constants::pi;
      double xlm[16];
      double const Y00 = std::sqrt(1/(4*pi)), Y1 = std::sqrt(3/(4*pi));
      { // px, py, pz along the Cartesian axes
          double const ex[] = {1,0,0}, ey[] = {0,1,0}, ez[] = {0,0,1};
          Xlm(xlm, 1, ex);
          stat += (std::abs(xlm[0] - Y00) > 1e-14);
          stat += (std::abs(xlm[1] - Y1) > 1e-14) + (std::abs(xlm[2]) > 1e-14) + (std::abs(xlm[3]) > 1e-14);
          Xlm(xlm, 1, ey);
          stat += (std::abs(xlm[2] - Y1) > 1e-14) + (std::abs(xlm[1]) > 1e-14);
          Xlm(xlm, 1, ez);
          stat += (std::abs(xlm[3] - Y1) > 1e-14) + (std::abs(xlm[1]) > 1e-14);
      }
      { // d-functions: xy, yz, z^2, xz, x^2-y^2
          double const s = std::sqrt(0.5);
          double const v[] = {s, s, 0};
          Xlm(xlm, 2, v);
          double const dxy = 0.25*std::sqrt(15/pi); // 0.546274
          if (echo > 3) std::printf("# %s: dxy= %.9f expected %.9f\n", __func__, xlm[4], dxy);
          stat += (std::abs(xlm[4] - dxy) > 1e-14);
          stat += (std::abs(xlm[8]) > 1e-14); // x^2-y^2 vanishes
          double const w[] = {1, 0, 0};
          Xlm(xlm, 2, w);
          stat += (std::abs(xlm[8] - dxy) > 1e-14); // x^2-y^2 at x-axis has the same value
          stat += (std::abs(xlm[6] + 0.25*std::sqrt(5/pi)) > 1e-14); // z^2 term is (3z^2 - r^2) scaled
          double const u[] = {s, 0, s};
          Xlm(xlm, 2, u);
          stat += (std::abs(xlm[7] - dxy) > 1e-14); // xz
          double const t[] = {0, s, s};
          Xlm(xlm, 2, t);
          stat += (std::abs(xlm[5] - dxy) > 1e-14); // yz
      }
      { // at the origin, theta=0 and phi=0
          double const zero[] = {0, 0, 0};
          Xlm(xlm, 1, zero);
          stat += (std::abs(xlm[3] - Y1) > 1e-14);
      }
      stat += !is_config_error(evaluate(xlm, 8, xlm, xlm, 0));
      return stat;
  } // test_reference_values

  status_t test_orthonormality(int const echo=0, int const ellmax=3) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      // midpoint rule in cos(theta), trapezoidal rule in phi
      int const nx = 2000, nphi = 64, nlm = (ellmax + 1)*(ellmax + 1);
      double const dx = 2./nx, dphi = 2*constants::pi/nphi;
      std::vector<double> ovl(nlm*nlm, 0.0), xlm(nlm);
      for (int ix = 0; ix < nx; ++ix) {
          double const cth = -1 + (ix + 0.5)*dx;
          for (int ip = 0; ip < nphi; ++ip) {
              Xlm(xlm.data(), ellmax, cth, ip*dphi);
              for (int i = 0; i < nlm; ++i) {
                  for (int j = 0; j < nlm; ++j) {
                      ovl[i*nlm + j] += xlm[i]*xlm[j]*dx*dphi;
                  } // j
              } // i
          } // ip
      } // ix
      double dev{0};
      for (int i = 0; i < nlm; ++i) {
          for (int j = 0; j < nlm; ++j) {
              dev = std::max(dev, std::abs(ovl[i*nlm + j] - (i == j)));
          } // j
      } // i
      if (echo > 3) std::printf("# %s: largest deviation from unit matrix %.1e\n", __func__, dev);
      return (dev > 1e-5);
  } // test_orthonormality

  status_t test_evaluate(int const echo=0) {
      // evaluate on several points must agree with single-point Xlm
      double const cth[] = {0.3, -0.8, 1.0}, phi[] = {0.1, 2.5, -1.0};
      int const ell = 3;
      double values[7*3], xlm[16];
      status_t stat = evaluate(values, ell, cth, phi, 3);
      double dev{0};
      for (int i = 0; i < 3; ++i) {
          Xlm(xlm, ell, cth[i], phi[i]);
          for (int im = 0; im < 7; ++im) {
              dev = std::max(dev, std::abs(values[im*3 + i] - xlm[9 + im]));
          } // im
      } // i
      return stat + (dev > 0);
  } // test_evaluate

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_reference_values(echo);
      stat += test_orthonormality(echo);
      stat += test_evaluate(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace angular_basis
