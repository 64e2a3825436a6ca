// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::sin, ::cos, ::abs
#include <map> // std::map<K,V>
#include <algorithm> // std::max

#include "density_features.hxx"

#include "recorded_warnings.hxx" // warn
#include "inline_math.hxx" // set, dot_product

namespace density_features {

  config_t make_config(basis_parser::instructions_t const & instructions, bool const use_memory, bool const strict) {
      config_t config;
      config.projector.use_memory = use_memory;
      config.spec_agnostic = instructions.spec_agnostic;
      config.strict = instructions.strict || strict;
      return config;
  } // make_config

  DensityFeatures::DensityFeatures(basis_parser::basis_map_t const & basis, real_space::grid_t const & g
      , std::vector<double> const & positions, std::vector<std::string> const & species
      , config_t const & config, int const echo)
    : _projector(basis, g, config.projector, echo), _positions(positions), _species(species), _config(config) {
      _setup_status = setup(echo);
  } // constructor

  DensityFeatures::DensityFeatures(basis_parser::basis_map_t const & basis, real_space::point_cloud_t const & cloud
      , std::vector<double> const & positions, std::vector<std::string> const & species
      , config_t const & config, int const echo)
    : _projector(basis, cloud, config.projector, echo), _positions(positions), _species(species), _config(config) {
      _setup_status = setup(echo);
  } // constructor

  status_t DensityFeatures::setup(int const echo) {
      status_t stat = _projector.setup_status();
      if (stat) return stat;
      if (_positions.size() != 3*_species.size()) {
          warn("%ld position coordinates for %ld atoms", long(_positions.size()), long(_species.size()));
          return STATUS_SHAPE_ERROR | 1;
      } // size mismatch
      stat = atomic_orbital::make_labels(_labels, _projector.basis(), _species, echo);
      if (stat) return stat;
      stat = _padder.initialize(_labels, _config.strict, echo);
      if (stat) return stat;
      stat = _padder.validate(_projector.basis(), echo);
      if (stat) return stat;
      // partition of the agnostic block, species in map order
      std::map<std::string, size_t> count;
      for (auto const & s : _species) { ++count[s]; }
      _partition.clear();
      for (auto const & sc : count) { _partition.push_back(sc); }
      if (echo > 2) std::printf("# %s: %ld atoms, %ld labels, spec_agnostic= %d\n", __func__,
                          long(_species.size()), long(_labels.size()), int(_config.spec_agnostic));
      return 0;
  } // setup

  status_t DensityFeatures::flatten(std::vector<double> & flat, coefficient_map::coefficient_map_t const & ragged) const {
      std::map<std::string, size_t> row;
      flat.clear();
      flat.reserve(_labels.size());
      for (auto const & s : _species) {
          auto const it = ragged.find(s);
          int const nf = _projector.number_of_functions(s);
          if (ragged.end() == it || it->second.cols() != size_t(nf) || row[s] >= it->second.rows()) {
              warn("ragged coefficients do not match species \"%s\" with %d functions", s.c_str(), nf);
              return STATUS_SHAPE_ERROR | 1;
          } // mismatch
          auto const c = it->second[row[s]++];
          flat.insert(flat.end(), c, c + nf);
      } // s
      return 0;
  } // flatten

  status_t DensityFeatures::unflatten(coefficient_map::coefficient_map_t & ragged, std::vector<double> const & flat) const {
      if (flat.size() != _labels.size()) {
          warn("expected %ld flat coefficients, found %ld", long(_labels.size()), long(flat.size()));
          return STATUS_SHAPE_ERROR | 1;
      } // size mismatch
      ragged.clear();
      for (auto const & part : _partition) {
          ragged[part.first] = coefficient_map::species_array_t(part.second, _projector.number_of_functions(part.first));
      } // part
      std::map<std::string, size_t> row;
      size_t offset{0};
      for (auto const & s : _species) {
          int const nf = _projector.number_of_functions(s);
          set(ragged[s][row[s]++], nf, &flat[offset]);
          offset += nf;
      } // s
      return 0;
  } // unflatten

  status_t DensityFeatures::get_basis_rep(coefficient_map::coefficient_map_t & features, double const density[], size_t const n_density, int const echo) {
      if (_setup_status) return _setup_status;
      coefficient_map::coefficient_map_t ragged;
      status_t stat = _projector.get_basis_rep(ragged, density, n_density, _positions, _species, echo);
      if (stat) return stat;
      std::vector<double> flat;
      stat = flatten(flat, ragged);
      if (stat) return stat;
      if (_config.spec_agnostic) {
          coefficient_map::coefficient_map_t padded;
          stat = _padder.pad_basis(padded, flat, echo);
          if (stat) return stat;
          return basis_padder::concatenate(features, _partition, padded, echo);
      } // spec_agnostic
      return _padder.pad_basis(features, flat, echo);
  } // get_basis_rep

  status_t DensityFeatures::get_V(std::vector<double> & potential, coefficient_map::coefficient_map_t const & gradient, int const echo) {
      if (_setup_status) return _setup_status;
      status_t stat(0);
      std::vector<double> flat;
      if (_config.spec_agnostic) {
          coefficient_map::coefficient_map_t padded;
          stat = basis_padder::split(padded, gradient, _partition, echo);
          if (stat) return stat;
          stat = _padder.unpad_basis(flat, padded, echo);
      } else {
          stat = _padder.unpad_basis(flat, gradient, echo);
      } // spec_agnostic
      if (stat) return stat;
      coefficient_map::coefficient_map_t ragged;
      stat = unflatten(ragged, flat);
      if (stat) return stat;
      return _projector.get_V(potential, ragged, _positions, _species, echo);
  } // get_V

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  basis_parser::basis_map_t test_basis() {
      basis_parser::basis_map_t basis;
      basis["O"].push_back(basis_parser::make_shell(0, {{1.0, 0.4}, {0.25}}, {{0.7, 0.3}, {1.0}}, {{2.0, 2.4}, {2.5}}));
      basis["O"].push_back(basis_parser::make_shell(1, {{0.8}}, {{1.0}}, {{2.2}}));
      basis["H"].push_back(basis_parser::make_shell(0, {{0.9}}, {{1.0}}, {{1.8}}));
      return basis;
  } // test_basis

  real_space::grid_t test_grid() {
      real_space::grid_t g(12, 12, 12);
      g.set_grid_spacing(0.5);
      double const center[] = {0, 0, 0};
      g.center_around(center);
      return g;
  } // test_grid

  inline double dot(coefficient_map::coefficient_map_t const & a, coefficient_map::coefficient_map_t const & b) {
      double d{0};
      for (auto const & sa : a) {
          d += dot_product(sa.second.size(), sa.second.data(), b.at(sa.first).data());
      } // sa
      return d;
  } // dot

  status_t test_pipeline(int const echo=0, bool const agnostic=false) {
      if (echo > 2) std::printf("\n# %s %s agnostic= %d\n", __FILE__, __func__, int(agnostic));
      status_t stat(0);
      auto basis = test_basis();
      if (agnostic) basis["N"] = basis["O"];
      std::vector<double> const positions = {0.1, 0.2, -0.3,  1.0, -0.5, 0.4,  -1.2, 0.3, 0.8};
      std::vector<std::string> const species = {"O", agnostic ? "N" : "H", "O"};
      config_t config;
      config.spec_agnostic = agnostic;
      auto const g = test_grid();
      DensityFeatures features(basis, g, positions, species, config, echo);
      stat += features.setup_status();
      if (stat) return stat;
      std::vector<double> density(g.all());
      for (size_t i = 0; i < g.all(); ++i) { density[i] = 1 + std::sin(0.23*i); }
      coefficient_map::coefficient_map_t c;
      stat += features.get_basis_rep(c, density.data(), density.size(), echo);
      if (stat) return stat;
      coefficient_map::show(c, "features", echo);
      if (agnostic) {
          stat += (1 != c.size()) + (3 != c[basis_padder::agnostic_key].rows()) + (2*4 != c[basis_padder::agnostic_key].cols());
      } else {
          // O: 1s, 2s, 2p --> n=2, ell=1, width 8; H: 1s --> n=1, ell=0, width 1
          stat += (2 != c["O"].rows()) + (8 != c["O"].cols());
          stat += (1 != c["H"].rows()) + (1 != c["H"].cols());
          for (int row = 0; row < 2; ++row) {
              stat += (0.0 != c["O"](row, 1)) + (0.0 != c["O"](row, 2)) + (0.0 != c["O"](row, 3)); // no 1p
              stat += (0.0 == c["O"](row, 5)); // 2px is populated
          } // row
      } // agnostic
      if (stat) return stat;

      auto gradient = c;
      for (auto & sg : gradient) {
          for (size_t i = 0; i < sg.second.size(); ++i) { sg.second.data()[i] = std::cos(0.7*i); }
      } // sg
      std::vector<double> V;
      stat += features.get_V(V, gradient, echo);
      if (stat) return stat;
      // the unpopulated slots of the gradient do not contribute
      double const lhs = dot(c, gradient), rhs = dot_product(g.all(), density.data(), V.data());
      if (echo > 3) std::printf("# %s: <features,g>= %.15f <rho,V>= %.15f\n", __func__, lhs, rhs);
      stat += (std::abs(lhs - rhs) > 1e-10*std::max(1., std::abs(lhs)));
      return stat;
  } // test_pipeline

  status_t test_flatten(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      auto const g = test_grid();
      DensityFeatures features(test_basis(), g, {0,0,0, 1,0,0, 0,1,0}, {"H", "O", "H"}, config_t(), echo);
      stat += features.setup_status();
      stat += (1 + 5 + 1 != features.labels().size());
      std::vector<double> flat(features.labels().size());
      for (size_t i = 0; i < flat.size(); ++i) { flat[i] = i; }
      coefficient_map::coefficient_map_t ragged;
      stat += features.unflatten(ragged, flat);
      stat += (2 != ragged["H"].rows()) + (1 != ragged["O"].rows());
      if (stat) return stat;
      stat += (6.0 != ragged["H"](1,0)) + (1.0 != ragged["O"](0,0));
      std::vector<double> back;
      stat += features.flatten(back, ragged);
      stat += (back != flat);
      stat += !is_shape_error(features.unflatten(ragged, std::vector<double>(3)));
      return stat;
  } // test_flatten

  status_t test_errors(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      auto const g = test_grid();
      config_t agnostic;
      agnostic.spec_agnostic = true;
      DensityFeatures features(test_basis(), g, {0,0,0, 1,0,0}, {"O", "H"}, agnostic, echo);
      stat += features.setup_status();
      std::vector<double> const density(g.all(), 1.0);
      coefficient_map::coefficient_map_t c;
      stat += !is_shape_error(features.get_basis_rep(c, density.data(), density.size(), echo)); // widths differ
      DensityFeatures unknown(test_basis(), g, {0,0,0}, {"C"}, config_t(), echo);
      stat += !is_config_error(unknown.setup_status());
      stat += !is_config_error(unknown.get_basis_rep(c, density.data(), density.size(), echo));
      DensityFeatures mismatch(test_basis(), g, {0,0,0, 1}, {"O", "H"}, config_t(), echo);
      stat += !is_shape_error(mismatch.setup_status());
      return stat;
  } // test_errors

  status_t test_config(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      std::vector<std::string> const gap = {"0 O 1s", "0 O 2s", "1 O 1s"}; // atom 1 lacks 2s

      basis_parser::instructions_t from_json;
      stat += basis_parser::parse_basis_instructions(from_json, "{\"strict\": true}", "", echo);
      auto const strict = make_config(from_json);
      stat += !strict.strict + strict.spec_agnostic + strict.projector.use_memory;
      basis_padder::BasisPadder padder;
      stat += !is_shape_error(padder.initialize(gap, strict.strict, echo));

      basis_parser::instructions_t const defaults;
      auto const sparse = make_config(defaults, true);
      stat += sparse.strict + !sparse.projector.use_memory;
      stat += padder.initialize(gap, sparse.strict, echo);
      auto const requested = make_config(defaults, false, true); // e.g. +padder.strict=1
      stat += !requested.strict;
      stat += !is_shape_error(padder.initialize(gap, requested.strict, echo));

      // labels generated from a basis have no gaps
      DensityFeatures features(test_basis(), test_grid(), {0,0,0, 1,0,0}, {"O", "H"}, strict, echo);
      stat += features.setup_status();
      stat += !features.padder().strict();
      return stat;
  } // test_config

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_config(echo);
      stat += test_pipeline(echo, false);
      stat += test_pipeline(echo, true);
      stat += test_flatten(echo);
      stat += test_errors(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace density_features
