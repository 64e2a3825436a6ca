#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t
#include <string> // std::string
#include <vector> // std::vector<T>

#include "status.hxx" // status_t
#include "basis_parser.hxx" // ::basis_map_t
#include "basis_projector.hxx" // ::Projector, ::config_t
#include "basis_padder.hxx" // ::BasisPadder, ::partition_t
#include "atomic_orbital.hxx" // ::ao_label_t
#include "coefficient_map.hxx" // ::coefficient_map_t
#include "real_space.hxx" // ::grid_t, ::point_cloud_t

namespace density_features {
  // Fixed-size features of a density for a fixed geometry: projection, padding
  // and optionally the species-agnostic concatenation, plus the reverse path for gradients.

  struct config_t {
      basis_projector::config_t projector;
      bool spec_agnostic = false; // all species into one block "X", needs equal padded widths
      bool strict = false; // labels must cover all (n, ell) up to the species maximum
  }; // config_t

  // settings from the basis instructions, strict checking may also be requested by the caller
  config_t make_config(basis_parser::instructions_t const & instructions
      , bool const use_memory=false, bool const strict=false);

  class DensityFeatures {
  public:

      DensityFeatures(basis_parser::basis_map_t const & basis, real_space::grid_t const & g
          , std::vector<double> const & positions, std::vector<std::string> const & species
          , config_t const & config=config_t(), int const echo=0);

      DensityFeatures(basis_parser::basis_map_t const & basis, real_space::point_cloud_t const & cloud
          , std::vector<double> const & positions, std::vector<std::string> const & species
          , config_t const & config=config_t(), int const echo=0);

      status_t get_basis_rep(coefficient_map::coefficient_map_t & features, double const density[], size_t const n_density, int const echo=0);
      status_t get_V(std::vector<double> & potential, coefficient_map::coefficient_map_t const & gradient, int const echo=0);

      // ragged per-species coefficients <--> flat atomic-orbital order
      status_t flatten(std::vector<double> & flat, coefficient_map::coefficient_map_t const & ragged) const;
      status_t unflatten(coefficient_map::coefficient_map_t & ragged, std::vector<double> const & flat) const;

      std::vector<atomic_orbital::ao_label_t> const & labels() const { return _labels; }
      basis_padder::BasisPadder const & padder() const { return _padder; }
      basis_projector::Projector & projector() { return _projector; }
      status_t setup_status() const { return _setup_status; }

  private:

      status_t setup(int const echo);

      basis_projector::Projector _projector;
      basis_padder::BasisPadder _padder;
      std::vector<double> _positions;
      std::vector<std::string> _species;
      std::vector<atomic_orbital::ao_label_t> _labels;
      basis_padder::partition_t _partition;
      config_t _config;
      status_t _setup_status;
  }; // class DensityFeatures

  status_t all_tests(int const echo=0); // declaration only

} // namespace density_features
