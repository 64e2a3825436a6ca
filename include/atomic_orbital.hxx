#pragma once
// This file is part of bproj under MIT License

#include <string> // std::string
#include <vector> // std::vector<T>

#include "status.hxx" // status_t
#include "basis_parser.hxx" // ::basis_map_t

namespace atomic_orbital {
  // Atomic-orbital labels of the form "<atom> <symbol> <n><letter><m-suffix>", e.g. "0 O 2px"

  struct ao_label_t {
      int atom; // atom index in the structure
      std::string symbol; // species
      int enn; // principal quantum number, enn > ell
      int ell; // angular momentum quantum number
      int emm; // magnetic index in shell order, 0 <= emm <= 2*ell
  }; // ao_label_t

  inline bool same_shell(ao_label_t const & a, ao_label_t const & b) {
      return a.atom == b.atom && a.enn == b.enn && a.ell == b.ell && a.symbol == b.symbol;
  } // same_shell

  // suffix of the magnetic index, p: x,y,z   d: xy,yz,z^2,xz,x2-y2   others: -ell..+ell
  std::string emm_suffix(int const ell, int const emm);

  status_t parse(ao_label_t & label, char const *text, int const echo=0);

  std::string format(ao_label_t const & label);

  // labels for all atoms in input order, per atom ordered by shell, radial function and m
  status_t make_labels(
        std::vector<ao_label_t> & labels // result
      , basis_parser::basis_map_t const & basis
      , std::vector<std::string> const & species // [natoms]
      , int const echo=0
  );

  std::vector<std::string> format(std::vector<ao_label_t> const & labels);

  status_t all_tests(int const echo=0); // declaration only

} // namespace atomic_orbital
