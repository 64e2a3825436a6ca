#pragma once
// This file is part of bproj under MIT License

#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>

#include "status.hxx" // status_t

namespace basis_parser {
  // Basis declarations: per species a list of shells with angular momentum ell,
  // each shell holds one or more contracted radial functions.

  double constexpr default_sigma = 2.0; // cutoff radius scale r_o = sigma*(1 + ell/5)/sqrt(alpha)

  struct radial_function_t {
      std::vector<double> alpha; // Gaussian exponents
      std::vector<double> coeff; // contraction coefficients
      std::vector<double> r_o;   // outer cutoff radii, one per exponent
      double cutoff() const; // the largest r_o
  }; // radial_function_t

  struct shell_t {
      int ell; // angular momentum quantum number
      std::vector<radial_function_t> radial; // radial functions sharing ell
  }; // shell_t

  typedef std::vector<shell_t> species_basis_t; // shells sorted by ascending ell
  typedef std::map<std::string, species_basis_t> basis_map_t; // species symbol --> basis

  status_t validate(species_basis_t const & basis, char const *symbol="?", int const echo=0);
  status_t validate(basis_map_t const & basis, int const echo=0);

  // build one shell from explicit arrays, one radial function per row
  shell_t make_shell(int const ell
      , std::vector<std::vector<double>> const & alpha
      , std::vector<std::vector<double>> const & coeff
      , std::vector<std::vector<double>> const & r_o);

  // r_o of each exponent as sigma*(1 + ell/5)/sqrt(alpha)
  std::vector<double> default_cutoffs(std::vector<double> const & alpha, int const ell, double const sigma=default_sigma);

  // rescale coefficients so that the contracted radial function is L2-normalized
  std::vector<double> normalize_contraction(int const ell, std::vector<double> const & alpha, std::vector<double> const & coeff);

  // parse the NWChem text format, keep only the shells of species symbol (all if empty)
  status_t parse_nwchem(
        species_basis_t & basis // result
      , std::string const & text // NWChem basis text
      , char const *symbol // species symbol
      , double const sigma=default_sigma
      , int const echo=0 // log-level
  );

  status_t read_nwchem_file(species_basis_t & basis, char const *filename
      , char const *symbol, double const sigma=default_sigma, int const echo=0);

  // sort shells by ell (stable) and merge shells with equal ell
  void sort_shells(species_basis_t & basis);

  double max_cutoff(species_basis_t const & basis); // max r_o over all shells
  int number_of_functions(species_basis_t const & basis); // sum over shells of (2*ell + 1)*radial.size()
  int max_ell(species_basis_t const & basis);

  void show(species_basis_t const & basis, char const *symbol, int const echo=1);

  struct instructions_t {
      basis_map_t basis; // explicit or file-based basis per species
      std::string default_file; // global "basis" entry, applied to species without own basis
      double default_sigma = basis_parser::default_sigma;
      bool spec_agnostic = false; // concatenate all species into one feature block "X"
      bool strict = false; // require complete (n,l) coverage in label lists
  }; // instructions_t

  // JSON basis instructions, relative file names are resolved against directory
  status_t parse_basis_instructions(instructions_t & instructions, std::string const & json
      , char const *directory="", int const echo=0);

  status_t read_basis_instructions(instructions_t & instructions, char const *filename, int const echo=0);

  // load the default basis file for species listed in symbols that have no basis yet
  status_t complete_basis(instructions_t & instructions, std::vector<std::string> const & symbols, int const echo=0);

  status_t all_tests(int const echo=0); // declaration only

} // namespace basis_parser
