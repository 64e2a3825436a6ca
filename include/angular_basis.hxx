#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t

#include "status.hxx" // status_t

namespace angular_basis {
  /*
   *  Real spherical harmonics in the convention of atomic-orbital labels:
   *  no Condon-Shortley phase, ell=1 ordered as (x, y, z),
   *  ell >= 2 ordered m = -ell..ell with sine combinations for m < 0
   *  and cosine combinations for m > 0, e.g. d: xy, yz, z^2, xz, x^2-y^2
   */

  // direction of v in spherical coordinates, theta=0, phi=0 for v=0
  void spherical_coordinates(double const v[3], double & r, double & cos_theta, double & phi);

  // all harmonics up to ellmax at one point, xlm[(ellmax + 1)^2], block ell starts at ell^2
  void Xlm(double xlm[], int const ellmax, double const cos_theta, double const phi);

  // for a Cartesian direction vector
  void Xlm(double xlm[], int const ellmax, double const v[3]);

  // 2*ell + 1 harmonics on n points, values[(2*ell + 1)*n], stride n
  status_t evaluate(
        double values[]
      , int const ell
      , double const cos_theta[]
      , double const phi[]
      , size_t const n
  );

  status_t all_tests(int const echo=0); // declaration only

} // namespace angular_basis
