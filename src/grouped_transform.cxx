// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::sqrt, ::abs
#include <string> // std::string
#include <vector> // std::vector<T>
#include <algorithm> // std::min, ::max
#include <utility> // std::move

#include "grouped_transform.hxx"

#include "recorded_warnings.hxx" // warn
#include "linear_algebra.hxx" // ::eigenvalues
#include "inline_math.hxx" // pow2

namespace grouped_transform {

  using coefficient_map::coefficient_map_t;
  using coefficient_map::species_array_t;

  inline void column_statistics(std::vector<double> & mean, std::vector<double> & variance, species_array_t const & X) {
      // population mean and variance of each column
      size_t const n = X.rows(), m = X.cols();
      mean.assign(m, 0.0);
      variance.assign(m, 0.0);
      for (size_t i = 0; i < n; ++i) {
          for (size_t j = 0; j < m; ++j) { mean[j] += X(i,j); }
      } // i
      for (size_t j = 0; j < m; ++j) { mean[j] /= n; }
      for (size_t i = 0; i < n; ++i) {
          for (size_t j = 0; j < m; ++j) { variance[j] += pow2(X(i,j) - mean[j]); }
      } // i
      for (size_t j = 0; j < m; ++j) { variance[j] /= n; }
  } // column_statistics

  status_t GroupedTransformer::fit_species(state_t & state, species_array_t const & X, char const *symbol, int const echo) const {
      size_t const n = X.rows(), n_in = X.cols();
      if (n < 1 || n_in < 1) {
          warn("cannot fit %s for species %s with %ld rows and %ld features", _kind.name(), symbol, long(n), long(n_in));
          return STATUS_SHAPE_ERROR;
      } // empty
      state = state_t();
      state.n_in = n_in;

      std::vector<double> mean, variance;
      column_statistics(mean, variance, X);

      if (kind_t::variance_threshold == _kind.strategy) {
          for (size_t j = 0; j < n_in; ++j) {
              if (variance[j] > _kind.threshold) state.support.push_back(j);
          } // j
          if (state.support.empty()) {
              warn("no feature of species %s has a variance above threshold %g", symbol, _kind.threshold);
              return STATUS_CONFIG_ERROR;
          } // none left
          state.n_out = state.support.size();
          if (echo > 3) std::printf("# %s: species %s keeps %ld of %ld features\n", __func__, symbol, long(state.n_out), long(n_in));
          return 0;
      } // variance_threshold

      // principal components of the standardized data
      size_t const n_max = std::min(n, n_in);
      int const n_comp = (_kind.n_components < 0) ? int(n_max) : _kind.n_components;
      if (n_comp < 1 || size_t(n_comp) > n_max) {
          warn("species %s: n_components= %d must be in [1, %ld]", symbol, n_comp, long(n_max));
          return STATUS_CONFIG_ERROR;
      } // n_comp out of range

      species_array_t Z(n, n_in);
      for (size_t j = 0; j < n_in; ++j) {
          double const std_dev = std::sqrt(variance[j]);
          double const scale = (std_dev > 0) ? 1./std_dev : 1.; // constant features are only centered
          for (size_t i = 0; i < n; ++i) { Z(i,j) = (X(i,j) - mean[j])*scale; }
      } // j

      std::vector<double> z_mean, z_var;
      column_statistics(z_mean, z_var, Z);

      // covariance matrix with unbiased normalization
      double const denom = (n > 1) ? 1./(n - 1.) : 1.;
      std::vector<double> cov(n_in*n_in, 0.0);
      for (size_t i = 0; i < n; ++i) {
          for (size_t j = 0; j < n_in; ++j) {
              double const zj = Z(i,j) - z_mean[j];
              for (size_t k = 0; k <= j; ++k) {
                  cov[j*n_in + k] += zj*(Z(i,k) - z_mean[k]);
              } // k
          } // j
      } // i
      for (size_t j = 0; j < n_in; ++j) {
          for (size_t k = 0; k <= j; ++k) {
              cov[j*n_in + k] *= denom;
              cov[k*n_in + j] = cov[j*n_in + k];
          } // k
      } // j

      std::vector<double> eigval(n_in);
      auto const info = linear_algebra::eigenvalues(eigval.data(), int(n_in), cov.data(), int(n_in));
      if (info) {
          warn("species %s: eigenvalue decomposition of the %ld x %ld covariance failed, info= %i", symbol, long(n_in), long(n_in), int(info));
          return STATUS_CONFIG_ERROR;
      } // info

      state.n_out = n_comp;
      state.mean = z_mean;
      state.components.resize(n_comp*n_in);
      for (int c = 0; c < n_comp; ++c) {
          auto const ev = &cov[(n_in - 1 - c)*n_in]; // descending eigenvalues
          // deterministic sign: the entry with the largest magnitude is positive
          size_t jmax{0};
          for (size_t j = 1; j < n_in; ++j) { if (std::abs(ev[j]) > std::abs(ev[jmax])) jmax = j; }
          double const sign = (ev[jmax] < 0) ? -1. : 1.;
          for (size_t j = 0; j < n_in; ++j) { state.components[c*n_in + j] = sign*ev[j]; }
          if (echo > 5) std::printf("# %s: species %s component #%i has variance %g\n", __func__, symbol, c, eigval[n_in - 1 - c]);
      } // c
      if (echo > 3) std::printf("# %s: species %s reduced from %ld to %d features\n", __func__, symbol, long(n_in), n_comp);
      return 0;
  } // fit_species

  status_t GroupedTransformer::fit(coefficient_map_t const & X, int const echo) {
      status_t stat(0);
      _state.clear();
      for (auto const & sa : X) {
          state_t state;
          auto const stat_species = fit_species(state, sa.second, sa.first.c_str(), echo);
          if (0 == stat_species) {
              _state[sa.first] = state;
          } else {
              stat |= stat_species;
          }
      } // sa
      if (stat) _state.clear();
      if (echo > 2) std::printf("# %s %s: fitted %ld species\n", _kind.name(), __func__, long(_state.size()));
      return stat;
  } // fit

  status_t GroupedTransformer::check(std::string const & symbol, size_t const cols, bool const input, char const *what) const {
      auto const it = _state.find(symbol);
      if (_state.end() == it) {
          warn("%s: species %s has not been fitted", what, symbol.c_str());
          return STATUS_CONFIG_ERROR;
      } // not fitted
      size_t const expected = input ? it->second.n_in : it->second.n_out;
      if (cols != expected) {
          warn("%s: species %s expects %ld features but got %ld", what, symbol.c_str(), long(expected), long(cols));
          return STATUS_SHAPE_ERROR;
      } // mismatch
      return 0;
  } // check

  status_t GroupedTransformer::transform(coefficient_map_t & Y, coefficient_map_t const & X, int const echo) const {
      status_t stat(0);
      for (auto const & sa : X) { stat |= check(sa.first, sa.second.cols(), true, __func__); }
      if (stat) return stat;
      Y.clear();
      for (auto const & sa : X) {
          auto const & x = sa.second;
          auto const & state = _state.at(sa.first);
          species_array_t y(x.rows(), state.n_out);
          for (size_t i = 0; i < x.rows(); ++i) {
              if (kind_t::variance_threshold == _kind.strategy) {
                  for (size_t c = 0; c < state.n_out; ++c) { y(i,c) = x(i,state.support[c]); }
              } else {
                  for (size_t c = 0; c < state.n_out; ++c) {
                      double const *const comp = &state.components[c*state.n_in];
                      double dot{0};
                      for (size_t j = 0; j < state.n_in; ++j) { dot += (x(i,j) - state.mean[j])*comp[j]; }
                      y(i,c) = dot;
                  } // c
              }
          } // i
          Y[sa.first] = std::move(y);
          if (echo > 5) std::printf("# %s %s: species %s [%ld][%ld]\n", _kind.name(), __func__, sa.first.c_str(), long(x.rows()), long(state.n_out));
      } // sa
      return stat;
  } // transform

  status_t GroupedTransformer::gradient(coefficient_map_t & dX, coefficient_map_t const & dY, int const echo) const {
      status_t stat(0);
      for (auto const & sa : dY) { stat |= check(sa.first, sa.second.cols(), false, __func__); }
      if (stat) return stat;
      dX.clear();
      for (auto const & sa : dY) {
          auto const & g = sa.second;
          auto const & state = _state.at(sa.first);
          species_array_t gx(g.rows(), state.n_in, 0.0); // zeros for dropped features
          for (size_t i = 0; i < g.rows(); ++i) {
              if (kind_t::variance_threshold == _kind.strategy) {
                  for (size_t c = 0; c < state.n_out; ++c) { gx(i,state.support[c]) = g(i,c); }
              } else {
                  for (size_t c = 0; c < state.n_out; ++c) {
                      double const *const comp = &state.components[c*state.n_in];
                      for (size_t j = 0; j < state.n_in; ++j) { gx(i,j) += g(i,c)*comp[j]; }
                  } // c
              }
          } // i
          dX[sa.first] = std::move(gx);
      } // sa
      if (echo > 5) std::printf("# %s %s: %ld species\n", _kind.name(), __func__, long(dX.size()));
      return stat;
  } // gradient

  int GroupedTransformer::n_features_out(std::string const & symbol) const {
      auto const it = _state.find(symbol);
      return (_state.end() == it) ? -1 : int(it->second.n_out);
  } // n_features_out

  std::vector<int> GroupedTransformer::support(std::string const & symbol) const {
      auto const it = _state.find(symbol);
      return (_state.end() == it) ? std::vector<int>(0) : it->second.support;
  } // support

  std::vector<double> GroupedTransformer::components(std::string const & symbol) const {
      auto const it = _state.find(symbol);
      return (_state.end() == it) ? std::vector<double>(0) : it->second.components;
  } // components

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_variance_threshold(int const echo=0) {
      status_t stat(0);
      coefficient_map_t X;
      X["O"] = species_array_t(4, 3);
      X["H"] = species_array_t(2, 2);
      for (int i = 0; i < 4; ++i) {
          X["O"](i,0) = 0.5*i;
          X["O"](i,1) = 1.25; // constant
          X["O"](i,2) = (i & 1) ? 1 : -1;
      } // i
      X["H"](0,0) = 1; X["H"](1,0) = 2; // H column 1 stays constant zero

      GroupedTransformer vt(kind_t::VarianceThreshold());
      coefficient_map_t Y;
      stat += vt.fit_transform(Y, X, echo);
      stat += (2 != vt.n_features_out("O")) + (1 != vt.n_features_out("H"));
      auto const support = vt.support("O");
      stat += (2 != support.size());
      if (2 == support.size()) stat += (0 != support[0]) + (2 != support[1]);
      for (int i = 0; i < 4; ++i) {
          stat += (Y["O"](i,0) != X["O"](i,0)) + (Y["O"](i,1) != X["O"](i,2));
      } // i

      coefficient_map_t dY, dX;
      dY["O"] = species_array_t(4, 2, 1.0);
      stat += vt.gradient(dX, dY, echo);
      for (int i = 0; i < 4; ++i) {
          stat += (1.0 != dX["O"](i,0)) + (0.0 != dX["O"](i,1)) + (1.0 != dX["O"](i,2));
      } // i

      GroupedTransformer strict(kind_t::VarianceThreshold(10.0));
      stat += !is_config_error(strict.fit(X, echo));
      stat += strict.is_fitted("O"); // failed fits leave no state
      if (echo > 2) std::printf("# %s: status= %i\n", __func__, int(stat));
      return stat;
  } // test_variance_threshold

  status_t test_principal_components(int const echo=0) {
      status_t stat(0);
      // two perfectly correlated features and one uncorrelated feature
      double const t[] = {1, -1, 1, -1}, s[] = {1, 1, -1, -1};
      coefficient_map_t X;
      X["C"] = species_array_t(4, 3);
      for (int i = 0; i < 4; ++i) {
          X["C"](i,0) = t[i];
          X["C"](i,1) = 2*t[i] + 3;
          X["C"](i,2) = 0.5*s[i];
      } // i

      GroupedTransformer pca(kind_t::PCA(2));
      stat += pca.fit(X, echo);
      auto const C = pca.components("C");
      stat += (6 != C.size());
      if (6 == C.size()) {
          double const h = std::sqrt(0.5);
          double const expected[6] = {h, h, 0,  0, 0, 1};
          double dev{0};
          for (int i = 0; i < 6; ++i) { dev = std::max(dev, std::abs(C[i] - expected[i])); }
          if (echo > 3) std::printf("# %s: components deviate %.1e\n", __func__, dev);
          stat += (dev > 1e-12);
      } // components

      // gradient is the transpose of the linear part of transform
      coefficient_map_t E, Y0, Y1, G, dX;
      E["C"] = species_array_t(4, 3);
      G["C"] = species_array_t(4, 2);
      for (int i = 0; i < 12; ++i) { E["C"].data()[i] = std::cos(1. + i); }
      for (int i = 0; i < 8; ++i) { G["C"].data()[i] = std::sin(2. + i); }
      coefficient_map_t XE; XE["C"] = X["C"];
      for (int i = 0; i < 12; ++i) { XE["C"].data()[i] += E["C"].data()[i]; }
      stat += pca.transform(Y0, X, echo);
      stat += pca.transform(Y1, XE, echo);
      stat += pca.gradient(dX, G, echo);
      double lhs{0}, rhs{0};
      for (int i = 0; i < 8; ++i) { lhs += (Y1["C"].data()[i] - Y0["C"].data()[i])*G["C"].data()[i]; }
      for (int i = 0; i < 12; ++i) { rhs += E["C"].data()[i]*dX["C"].data()[i]; }
      if (echo > 3) std::printf("# %s: <dY,G>= %.15f <E,dX>= %.15f\n", __func__, lhs, rhs);
      stat += (std::abs(lhs - rhs) > 1e-12);

      GroupedTransformer too_many(kind_t::PCA(5));
      stat += !is_config_error(too_many.fit(X, echo));
      GroupedTransformer all(kind_t::PCA());
      stat += all.fit(X, echo);
      stat += (3 != all.n_features_out("C"));
      return stat;
  } // test_principal_components

  status_t test_errors(int const echo=0) {
      status_t stat(0);
      coefficient_map_t X, Y;
      X["O"] = species_array_t(3, 2);
      X["O"](0,0) = 1; X["O"](1,1) = 2;
      GroupedTransformer vt(kind_t::VarianceThreshold());
      stat += vt.fit(X, echo);
      coefficient_map_t unknown; unknown["N"] = species_array_t(1, 2);
      stat += !is_config_error(vt.transform(Y, unknown, echo));
      coefficient_map_t narrow; narrow["O"] = species_array_t(1, 1);
      stat += !is_shape_error(vt.transform(Y, narrow, echo));
      coefficient_map_t wide; wide["O"] = species_array_t(3, 3);
      stat += !is_shape_error(vt.gradient(Y, wide, echo));
      coefficient_map_t empty; empty["O"] = species_array_t(0, 2);
      stat += !is_shape_error(vt.fit(empty, echo));
      return stat;
  } // test_errors

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_variance_threshold(echo);
      stat += test_principal_components(echo);
      stat += test_errors(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace grouped_transform
