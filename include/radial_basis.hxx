#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t
#include <vector> // std::vector<T>

#include "status.hxx" // status_t
#include "basis_parser.hxx" // ::radial_function_t, ::species_basis_t

namespace radial_basis {
  /*
   *  Radial functions of the projection basis:
   *      g(r) = N r^ell fc(r) sum_i coeff_i exp(-alpha_i r^2)
   *  with the smooth envelope fc(r) = 1 - (sin^2(pi r/(2 r_o)))^8 that vanishes at r_o = max_i r_o_i
   *  and N = sum_i (2 alpha_i)^(ell/2 + 3/4) sqrt(2/Gamma(ell + 3/2))
   */

  double normalization(int const ell, std::vector<double> const & alpha);

  double envelope(double const r, double const r_o); // fc(r), 0 for r >= r_o

  status_t evaluate(
        double values[] // result [n]
      , double const r[] // radii [n]
      , size_t const n
      , basis_parser::radial_function_t const & rf
      , int const ell
  ); // values are exactly zero for r >= r_o

  // one array per radial function of each shell, in shell order
  status_t radials(
        std::vector<std::vector<double>> & values // result [n_radial_total][n]
      , double const r[] // radii [n]
      , size_t const n
      , basis_parser::species_basis_t const & basis
  );

  status_t all_tests(int const echo=0); // declaration only

} // namespace radial_basis
