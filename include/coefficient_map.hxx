#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cassert> // assert
#include <cstdint> // uint32_t
#include <cmath> // std::abs
#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>
#include <utility> // std::move
#include <algorithm> // std::max

#include "status.hxx" // status_t

namespace coefficient_map {

  class species_array_t {
  // dense [atoms, features] array of one species, row-major
  public:

      species_array_t() : _data(0), _n1(0), _n0(0) {} // default constructor

      species_array_t(size_t const n_atoms, size_t const n_features, double const init_value=0)
        : _data(n_atoms*n_features, init_value), _n1(n_atoms), _n0(n_features) {} // constructor

      // adopt existing data, the shape is checked
      status_t assign(size_t const n_atoms, size_t const n_features, std::vector<double> && data) {
          if (data.size() != n_atoms*n_features) return STATUS_SHAPE_ERROR;
          _data = std::move(data);
          _n1 = n_atoms;
          _n0 = n_features;
          return 0;
      } // assign

      double const & operator () (size_t const i1, size_t const i0) const {
          assert(i1 < _n1); assert(i0 < _n0);
          return _data[i1*_n0 + i0]; } // (i,j)

      double       & operator () (size_t const i1, size_t const i0)       {
          assert(i1 < _n1); assert(i0 < _n0);
          return _data[i1*_n0 + i0]; } // (i,j)

      double const * operator[] (size_t const i1) const { assert(i1 < _n1); return &_data[i1*_n0]; }
      double       * operator[] (size_t const i1)       { assert(i1 < _n1); return &_data[i1*_n0]; }

      double const * data() const { return _data.data(); }
      double       * data()       { return _data.data(); }
      size_t rows() const { return _n1; } // number of atoms
      size_t cols() const { return _n0; } // number of features per atom
      size_t size() const { return _data.size(); }

  private:
      std::vector<double> _data;
      size_t _n1, _n0; // shape [_n1][_n0]
  }; // species_array_t

  typedef std::map<std::string, species_array_t> coefficient_map_t; // species symbol --> array

  // number of atoms summed over all species
  inline size_t total_rows(coefficient_map_t const & map) {
      size_t n{0};
      for (auto const & sa : map) { n += sa.second.rows(); }
      return n;
  } // total_rows

  // bit-wise comparison, shapes must match
  inline bool identical(coefficient_map_t const & a, coefficient_map_t const & b) {
      if (a.size() != b.size()) return false;
      for (auto const & sa : a) {
          auto const it = b.find(sa.first);
          if (b.end() == it) return false;
          auto const & x = sa.second;
          auto const & y = it->second;
          if (x.rows() != y.rows() || x.cols() != y.cols()) return false;
          for (size_t i = 0; i < x.size(); ++i) {
              if (x.data()[i] != y.data()[i]) return false;
          } // i
      } // sa
      return true;
  } // identical

  inline double max_abs_difference(species_array_t const & a, species_array_t const & b) {
      assert(a.size() == b.size());
      double dev{0};
      for (size_t i = 0; i < a.size(); ++i) {
          dev = std::max(dev, std::abs(a.data()[i] - b.data()[i]));
      } // i
      return dev;
  } // max_abs_difference

  inline void show(coefficient_map_t const & map, char const *name="coefficients", int const echo=1) {
      if (echo < 1) return;
      for (auto const & sa : map) {
          std::printf("# %s[\"%s\"] has shape [%ld, %ld]\n", name, sa.first.c_str(), long(sa.second.rows()), long(sa.second.cols()));
          if (echo > 5) {
              for (size_t ia = 0; ia < sa.second.rows(); ++ia) {
                  std::printf("#   atom#%ld ", long(ia));
                  for (size_t j = 0; j < sa.second.cols(); ++j) { std::printf(" %.6f", sa.second(ia,j)); }
                  std::printf("\n");
              } // ia
          } // echo
      } // sa
  } // show

#ifdef    NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else  // NO_UNIT_TESTS

  inline status_t test_shape_checks(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      species_array_t a;
      stat += (0 == a.assign(2, 3, std::vector<double>(5, 1.0))); // must fail
      stat += a.assign(2, 3, std::vector<double>(6, 1.0));
      stat += (2 != a.rows()) + (3 != a.cols());
      a(1,2) = 7;
      stat += (7 != a[1][2]);
      return stat;
  } // test_shape_checks

  inline status_t test_identical(int const echo=0) {
      coefficient_map_t m1, m2;
      m1["O"] = species_array_t(2, 4, 0.5);
      m2["O"] = species_array_t(2, 4, 0.5);
      status_t stat(0);
      stat += !identical(m1, m2);
      m2["O"](1,3) = 0.25;
      stat += identical(m1, m2);
      m2["O"](1,3) = 0.5;
      m2["H"] = species_array_t(1, 1);
      stat += identical(m1, m2);
      stat += (3 != total_rows(m2));
      show(m2, "m2", echo);
      return stat;
  } // test_identical

  inline status_t all_tests(int const echo=0) {
      status_t stat(0);
      stat += test_shape_checks(echo);
      stat += test_identical(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace coefficient_map
