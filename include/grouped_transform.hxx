#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t
#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>

#include "status.hxx" // status_t
#include "coefficient_map.hxx" // ::coefficient_map_t

namespace grouped_transform {
  // Per-species feature transforms with fit, transform and gradient (back-transform of derivatives).

  struct kind_t {
      enum strategy_t { variance_threshold, principal_components } strategy;
      double threshold; // keep features with variance > threshold
      int n_components; // number of principal components, -1: all

      static kind_t VarianceThreshold(double const threshold=0) {
          kind_t k; k.strategy = variance_threshold; k.threshold = threshold; k.n_components = -1; return k; }
      static kind_t PCA(int const n_components=-1) {
          kind_t k; k.strategy = principal_components; k.threshold = 0; k.n_components = n_components; return k; }
      char const * name() const { return (variance_threshold == strategy) ? "VarianceThreshold" : "PCA"; }
  }; // kind_t

  class GroupedTransformer {
  public:

      explicit GroupedTransformer(kind_t const & kind) : _kind(kind) {}

      // one fitted state per species
      status_t fit(coefficient_map::coefficient_map_t const & X, int const echo=0);

      status_t transform(coefficient_map::coefficient_map_t & Y, coefficient_map::coefficient_map_t const & X, int const echo=0) const;

      status_t fit_transform(coefficient_map::coefficient_map_t & Y, coefficient_map::coefficient_map_t const & X, int const echo=0) {
          auto const stat = fit(X, echo);
          return stat ? stat : transform(Y, X, echo);
      } // fit_transform

      // maps dE/dY [atoms][n_out] to dE/dX [atoms][n_in]
      status_t gradient(coefficient_map::coefficient_map_t & dX, coefficient_map::coefficient_map_t const & dY, int const echo=0) const;

      bool is_fitted(std::string const & symbol) const { return _state.count(symbol) > 0; }
      int n_features_out(std::string const & symbol) const; // -1 if not fitted
      std::vector<int> support(std::string const & symbol) const; // kept features of the variance threshold
      std::vector<double> components(std::string const & symbol) const; // [n_out][n_in] principal axes
      kind_t const & kind() const { return _kind; }

  private:

      struct state_t {
          size_t n_in = 0, n_out = 0;
          std::vector<int> support; // variance threshold
          std::vector<double> mean; // [n_in] principal components
          std::vector<double> components; // [n_out][n_in]
      }; // state_t

      status_t fit_species(state_t & state, coefficient_map::species_array_t const & X, char const *symbol, int const echo) const;
      status_t check(std::string const & symbol, size_t const cols, bool const input, char const *what) const;

      kind_t _kind;
      std::map<std::string, state_t> _state;
  }; // class GroupedTransformer

  status_t all_tests(int const echo=0); // declaration only

} // namespace grouped_transform
