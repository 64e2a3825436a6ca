#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t
#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>
#include <utility> // std::pair<T1,T2>

#include "status.hxx" // status_t
#include "atomic_orbital.hxx" // ::ao_label_t
#include "basis_parser.hxx" // ::basis_map_t
#include "coefficient_map.hxx" // ::coefficient_map_t

namespace basis_padder {
  /*
   *  Conversion between the flat atomic-orbital ordering of coefficients (ragged, species dependent)
   *  and dense per-species arrays [atoms][max_n*(max_l + 1)^2] ordered n-major, then ell, then m.
   *  Slots of (n, ell) combinations that an atom does not have stay zero.
   */

  struct shape_t {
      int n; // max_n
      int l; // max_l + 1
      int width() const { return n*l*l; }
  }; // shape_t

  class BasisPadder {
  public:

      BasisPadder() : _n_labels(0), _strict(false) {} // default constructor

      // the index maps are built once from a label list
      status_t initialize(std::vector<atomic_orbital::ao_label_t> const & labels, bool const strict=false, int const echo=0);
      status_t initialize(std::vector<std::string> const & labels, bool const strict=false, int const echo=0);

      status_t pad_basis(coefficient_map::coefficient_map_t & padded, double const flat[], size_t const n_flat, int const echo=0) const;
      status_t pad_basis(coefficient_map::coefficient_map_t & padded, std::vector<double> const & flat, int const echo=0) const {
          return pad_basis(padded, flat.data(), flat.size(), echo); }

      // exact left inverse of pad_basis, unpopulated slots are never read
      status_t unpad_basis(std::vector<double> & flat, coefficient_map::coefficient_map_t const & padded, int const echo=0) const;

      // every shell the basis declares for an atom must be present in the label list
      status_t validate(basis_parser::basis_map_t const & basis, int const echo=0) const;

      std::map<std::string, shape_t> basis_shape() const;
      size_t number_of_labels() const { return _n_labels; }
      bool strict() const { return _strict; }

  private:

      struct species_t {
          int max_n = 0, max_l = 0;
          std::vector<int> atoms; // atom indices in ascending order
          std::vector<std::vector<char>> populated; // [atoms][width]
          std::vector<std::vector<int>> source; // [atoms][populated slots] positions in the label list
          std::map<int,int> max_n_of_ell; // largest n found for each ell
      }; // species_t

      std::map<std::string, species_t> _species;
      size_t _n_labels;
      bool _strict;
  }; // class BasisPadder

  // the rows of each species in a species-agnostic concatenation
  typedef std::vector<std::pair<std::string, size_t>> partition_t;

  // concatenate all species along the atom axis into a single entry "X"
  status_t concatenate(
        coefficient_map::coefficient_map_t & combined // result
      , partition_t & partition // result
      , coefficient_map::coefficient_map_t const & padded
      , int const echo=0
  );

  // inverse of concatenate using the recorded partition
  status_t split(
        coefficient_map::coefficient_map_t & padded // result
      , coefficient_map::coefficient_map_t const & combined
      , partition_t const & partition
      , int const echo=0
  );

  char constexpr agnostic_key[] = "X";

  status_t all_tests(int const echo=0); // declaration only

} // namespace basis_padder
