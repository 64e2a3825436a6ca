#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t
#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>

#include "status.hxx" // status_t
#include "basis_parser.hxx" // ::basis_map_t, ::species_basis_t
#include "real_space.hxx" // ::grid_t, ::point_cloud_t
#include "grid_window.hxx" // ::window_t
#include "coefficient_map.hxx" // ::coefficient_map_t

namespace basis_projector {
  // Projection of a density onto atom-centered radial times angular functions (forward)
  // and the distribution of coefficient gradients onto the integration points (adjoint).

  struct config_t {
      bool use_memory = false; // cache windows and basis function values per species and position
  }; // config_t

  class Projector {
  public:

      Projector(basis_parser::basis_map_t const & basis, real_space::grid_t const & g
              , config_t const & config=config_t(), int const echo=0);

      Projector(basis_parser::basis_map_t const & basis, real_space::point_cloud_t const & cloud
              , config_t const & config=config_t(), int const echo=0);

      // coefficients[species][atom][function], functions ordered by shell, radial function, m
      status_t get_basis_rep(
            coefficient_map::coefficient_map_t & coefficients // result
          , double const density[] // on all integration points
          , size_t const n_density
          , std::vector<double> const & positions // [natoms*3]
          , std::vector<std::string> const & species // [natoms]
          , int const echo=0
      );

      // adjoint of get_basis_rep, the result is accumulated into a zeroed potential
      status_t get_V(
            std::vector<double> & potential // result, on all integration points
          , coefficient_map::coefficient_map_t const & gradient // dE/dc, same shape as the coefficients
          , std::vector<double> const & positions // [natoms*3]
          , std::vector<std::string> const & species // [natoms]
          , int const echo=0
      );

      size_t domain_size() const { return _is_grid ? _grid.all() : _cloud.all(); }
      int number_of_functions(std::string const & symbol) const; // -1 if the species has no basis
      status_t setup_status() const { return _setup_status; } // result of validating basis and domain
      basis_parser::basis_map_t const & basis() const { return _basis; }
      size_t cache_size() const { return _cache.size(); }
      void clear_cache() { _cache.clear(); }

  private:

      struct atom_values_t {
          grid_window::window_t window;
          std::vector<double> values; // [n_functions][window.size()], radial times angular
      }; // atom_values_t

      status_t check_atoms(std::vector<double> const & positions, std::vector<std::string> const & species
                         , std::vector<int> & row, std::map<std::string,int> & count) const;

      status_t compute_atom(atom_values_t & atom, basis_parser::species_basis_t const & basis
                          , double const center[3], int const echo) const;

      // cached values or freshly computed ones for all atoms
      status_t prepare_atoms(std::vector<atom_values_t const*> & atoms, std::vector<atom_values_t> & fresh
                          , std::vector<double> const & positions, std::vector<std::string> const & species, int const echo);

      static std::string cache_key(std::string const & symbol, double const position[3]);

      basis_parser::basis_map_t _basis;
      bool _is_grid;
      real_space::grid_t _grid;
      real_space::point_cloud_t _cloud;
      config_t _config;
      status_t _setup_status;
      std::map<std::string, atom_values_t> _cache; // private to this instance
  }; // class Projector

  status_t all_tests(int const echo=0); // declaration only

} // namespace basis_projector
