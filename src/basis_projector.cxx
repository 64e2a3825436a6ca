// This file is part of bproj under MIT License

#include <cstdio> // std::printf, ::snprintf
#include <cmath> // std::sqrt, ::exp, ::cos, ::sin, ::abs
#include <vector> // std::vector<T>
#include <string> // std::string
#include <map> // std::map<K,V>
#include <utility> // std::move, ::make_pair
#include <algorithm> // std::max

#include "basis_projector.hxx"

#include "radial_basis.hxx" // ::radials
#include "angular_basis.hxx" // ::evaluate
#include "grid_window.hxx" // ::box_around
#include "recorded_warnings.hxx" // warn
#include "omp_parallel.hxx" // ::max_threads
#include "simple_timer.hxx" // SimpleTimer
#include "inline_math.hxx" // pow2, set, dot_product
#include "constants.hxx" // ::pi

namespace basis_projector {

  Projector::Projector(basis_parser::basis_map_t const & basis, real_space::grid_t const & g
                     , config_t const & config, int const echo)
    : _basis(basis), _is_grid(true), _grid(g), _config(config) {
      _setup_status = basis_parser::validate(_basis, echo);
      if (echo > 3) std::printf("# Projector on a %d x %d x %d grid, %ld species, memory= %d\n",
                          g[0], g[1], g[2], long(_basis.size()), int(_config.use_memory));
  } // constructor

  Projector::Projector(basis_parser::basis_map_t const & basis, real_space::point_cloud_t const & cloud
                     , config_t const & config, int const echo)
    : _basis(basis), _is_grid(false), _cloud(cloud), _config(config) {
      _setup_status = basis_parser::validate(_basis, echo) | cloud.check(echo);
      if (echo > 3) std::printf("# Projector on %ld points, %ld species, memory= %d\n",
                          long(cloud.all()), long(_basis.size()), int(_config.use_memory));
  } // constructor

  int Projector::number_of_functions(std::string const & symbol) const {
      auto const it = _basis.find(symbol);
      return (_basis.end() == it) ? -1 : basis_parser::number_of_functions(it->second);
  } // number_of_functions

  std::string Projector::cache_key(std::string const & symbol, double const position[3]) {
      char buffer[96];
      std::snprintf(buffer, 96, " %.17g %.17g %.17g", position[0], position[1], position[2]);
      return symbol + buffer;
  } // cache_key

  status_t Projector::check_atoms(std::vector<double> const & positions, std::vector<std::string> const & species
                                , std::vector<int> & row, std::map<std::string,int> & count) const {
      if (_setup_status) {
          warn("projector setup failed with status %i", int(_setup_status));
          return _setup_status;
      } // setup failed
      if (species.empty()) {
          warn("empty species list, %ld positions", long(positions.size()));
          return STATUS_CONFIG_ERROR | 1;
      } // empty
      if (positions.size() != 3*species.size()) {
          warn("%ld position coordinates for %ld atoms", long(positions.size()), long(species.size()));
          return STATUS_SHAPE_ERROR | 1;
      } // size mismatch
      status_t stat(0);
      row.resize(species.size());
      count.clear();
      for (size_t ia = 0; ia < species.size(); ++ia) {
          if (0 == _basis.count(species[ia])) {
              warn("no basis for species \"%s\" of atom #%ld", species[ia].c_str(), long(ia));
              stat |= STATUS_CONFIG_ERROR | 1;
          } // no basis
          row[ia] = count[species[ia]]++; // atoms keep their input order within each species
      } // ia
      return stat;
  } // check_atoms

  status_t Projector::compute_atom(atom_values_t & atom, basis_parser::species_basis_t const & basis
                                 , double const center[3], int const echo) const {
      auto const r_cut = basis_parser::max_cutoff(basis);
      auto & window = atom.window;
      status_t stat = _is_grid ? grid_window::box_around(window, _grid,  center, r_cut, echo)
                               : grid_window::box_around(window, _cloud, center, r_cut, echo);
      if (stat) return stat;
      auto const n = window.size();
      int const nf = basis_parser::number_of_functions(basis);
      atom.values.assign(nf*n, 0.0);
      if (0 == n) return 0; // empty window, zero contribution

      std::vector<std::vector<double>> rad;
      stat = radial_basis::radials(rad, window.r.data(), n, basis);
      if (stat) return stat;

      int f{0}, irad{0};
      for (auto const & shell : basis) {
          int const nm = 2*shell.ell + 1;
          std::vector<double> ang(nm*n);
          stat = angular_basis::evaluate(ang.data(), shell.ell, window.cos_theta.data(), window.phi.data(), n);
          if (stat) return stat;
          for (size_t k = 0; k < shell.radial.size(); ++k) {
              auto const r_values = rad[irad].data();
              for (int im = 0; im < nm; ++im) {
                  auto const values = &atom.values[f*n];
                  for (size_t ip = 0; ip < n; ++ip) {
                      values[ip] = r_values[ip]*ang[im*n + ip];
                  } // ip
                  ++f;
              } // im
              ++irad;
          } // k
      } // shell
      return 0;
  } // compute_atom

  status_t Projector::prepare_atoms(std::vector<atom_values_t const*> & atoms, std::vector<atom_values_t> & fresh
                          , std::vector<double> const & positions, std::vector<std::string> const & species, int const echo) {
      int const natoms = species.size();
      atoms.assign(natoms, nullptr);
      fresh.resize(natoms);
      std::vector<std::string> keys(natoms);
      if (_config.use_memory) {
          for (int ia = 0; ia < natoms; ++ia) {
              keys[ia] = cache_key(species[ia], &positions[ia*3]);
              auto const it = _cache.find(keys[ia]);
              if (_cache.end() != it) atoms[ia] = &(it->second);
          } // ia
      } // use_memory

      status_t stat(0);
      #pragma omp parallel for schedule(dynamic) reduction(|:stat)
      for (int ia = 0; ia < natoms; ++ia) {
          if (nullptr == atoms[ia]) {
              stat |= compute_atom(fresh[ia], _basis.at(species[ia]), &positions[ia*3], echo/2);
          } // not cached
      } // ia
      if (stat) return stat;

      // the cache is filled after the parallel region
      int computed{0};
      for (int ia = 0; ia < natoms; ++ia) {
          if (nullptr != atoms[ia]) continue;
          ++computed;
          if (_config.use_memory) {
              auto const inserted = _cache.insert(std::make_pair(keys[ia], std::move(fresh[ia])));
              atoms[ia] = &(inserted.first->second);
          } else {
              atoms[ia] = &fresh[ia];
          } // use_memory
      } // ia
      if (echo > 4) std::printf("# %s: computed %d of %d atoms with %d threads, %ld cached\n",
                          __func__, computed, natoms, omp_parallel::max_threads(), long(_cache.size()));
      return 0;
  } // prepare_atoms

  status_t Projector::get_basis_rep(
        coefficient_map::coefficient_map_t & coefficients
      , double const density[]
      , size_t const n_density
      , std::vector<double> const & positions
      , std::vector<std::string> const & species
      , int const echo
  ) {
      SimpleTimer timer(__FILE__, __LINE__, __func__, echo/4);
      std::vector<int> row;
      std::map<std::string,int> count;
      status_t stat = check_atoms(positions, species, row, count);
      if (stat) return stat;
      if (n_density != domain_size()) {
          warn("density has %ld values but the domain has %ld points", long(n_density), long(domain_size()));
          return STATUS_SHAPE_ERROR | 1;
      } // size mismatch

      std::vector<atom_values_t const*> atoms;
      std::vector<atom_values_t> fresh;
      stat = prepare_atoms(atoms, fresh, positions, species, echo);
      if (stat) return stat;

      coefficients.clear();
      for (auto const & sc : count) {
          coefficients[sc.first] = coefficient_map::species_array_t(sc.second, number_of_functions(sc.first));
      } // sc
      int const natoms = species.size();
      std::vector<double*> out(natoms);
      for (int ia = 0; ia < natoms; ++ia) {
          out[ia] = coefficients.at(species[ia])[row[ia]];
      } // ia

      #pragma omp parallel for schedule(dynamic)
      for (int ia = 0; ia < natoms; ++ia) {
          auto const & atom = *atoms[ia];
          auto const & w = atom.window;
          auto const n = w.size();
          int const nf = number_of_functions(species[ia]);
          std::vector<double> rho_w(n);
          for (size_t ip = 0; ip < n; ++ip) {
              rho_w[ip] = density[w.index[ip]]*w.weight[ip];
          } // ip
          for (int f = 0; f < nf; ++f) {
              double c{0};
              auto const values = &atom.values[f*n];
              for (size_t ip = 0; ip < n; ++ip) {
                  c += rho_w[ip]*values[ip];
              } // ip
              out[ia][f] = c;
          } // f
      } // ia

      if (echo > 3) std::printf("# %s: %d atoms of %ld species projected\n", __func__, natoms, long(count.size()));
      return 0;
  } // get_basis_rep

  status_t Projector::get_V(
        std::vector<double> & potential
      , coefficient_map::coefficient_map_t const & gradient
      , std::vector<double> const & positions
      , std::vector<std::string> const & species
      , int const echo
  ) {
      SimpleTimer timer(__FILE__, __LINE__, __func__, echo/4);
      std::vector<int> row;
      std::map<std::string,int> count;
      status_t stat = check_atoms(positions, species, row, count);
      if (stat) return stat;

      for (auto const & sc : count) {
          auto const it = gradient.find(sc.first);
          if (gradient.end() == it) {
              warn("gradient has no entry for species \"%s\"", sc.first.c_str());
              stat |= STATUS_SHAPE_ERROR | 1;
              continue;
          } // missing
          auto const & g = it->second;
          if (int(g.rows()) != sc.second || int(g.cols()) != number_of_functions(sc.first)) {
              warn("gradient of species \"%s\" has shape [%ld, %ld], expected [%d, %d]", sc.first.c_str(),
                    long(g.rows()), long(g.cols()), sc.second, number_of_functions(sc.first));
              stat |= STATUS_SHAPE_ERROR | 1;
          } // shape mismatch
      } // sc
      if (gradient.size() != count.size()) {
          warn("gradient has %ld species, expected %ld", long(gradient.size()), long(count.size()));
          stat |= STATUS_SHAPE_ERROR | 1;
      } // extra species
      if (stat) return stat;

      std::vector<atom_values_t const*> atoms;
      std::vector<atom_values_t> fresh;
      stat = prepare_atoms(atoms, fresh, positions, species, echo);
      if (stat) return stat;

      int const natoms = species.size();
      std::vector<std::vector<double>> local(natoms); // window-local contributions
      #pragma omp parallel for schedule(dynamic)
      for (int ia = 0; ia < natoms; ++ia) {
          auto const & atom = *atoms[ia];
          auto const & w = atom.window;
          auto const n = w.size();
          int const nf = number_of_functions(species[ia]);
          auto const grad = gradient.at(species[ia])[row[ia]];
          auto & v = local[ia];
          v.assign(n, 0.0);
          for (int f = 0; f < nf; ++f) {
              auto const values = &atom.values[f*n];
              for (size_t ip = 0; ip < n; ++ip) {
                  v[ip] += grad[f]*values[ip];
              } // ip
          } // f
          for (size_t ip = 0; ip < n; ++ip) {
              v[ip] *= w.weight[ip];
          } // ip
      } // ia

      // serial scatter-add in atom order
      potential.assign(domain_size(), 0.0);
      for (int ia = 0; ia < natoms; ++ia) {
          auto const & w = atoms[ia]->window;
          for (size_t ip = 0; ip < w.size(); ++ip) {
              potential[w.index[ip]] += local[ia][ip];
          } // ip
      } // ia

      if (echo > 3) std::printf("# %s: %d atoms of %ld species added\n", __func__, natoms, long(count.size()));
      return 0;
  } // get_V

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  basis_parser::basis_map_t test_basis() {
      basis_parser::basis_map_t basis;
      basis["O"].push_back(basis_parser::make_shell(0, {{1.0, 0.4}, {0.25}}, {{0.7, 0.3}, {1.0}}, {{2.0, 2.4}, {2.5}}));
      basis["O"].push_back(basis_parser::make_shell(1, {{0.8}}, {{1.0}}, {{2.2}}));
      basis["H"].push_back(basis_parser::make_shell(0, {{0.9}}, {{1.0}}, {{1.8}}));
      basis["H"].push_back(basis_parser::make_shell(2, {{0.6}}, {{1.0}}, {{2.0}}));
      return basis;
  } // test_basis

  real_space::grid_t test_grid(int const n=10, double const h=0.5) {
      real_space::grid_t g(n, n, n);
      g.set_grid_spacing(h);
      double const center[] = {0, 0, 0};
      g.center_around(center);
      return g;
  } // test_grid

  status_t test_single_oxygen(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      basis_parser::basis_map_t basis;
      basis["O"].push_back(basis_parser::make_shell(0, {{1.0}}, {{1.0}}, {{2.0}}));
      auto const g = test_grid(8, 1.0);
      Projector projector(basis, g, config_t(), echo);
      std::vector<double> const density(g.all(), 1.0);
      std::vector<double> const positions = {0, 0, 0};
      std::vector<std::string> const species = {"O"};
      coefficient_map::coefficient_map_t c1, c2;
      stat += projector.get_basis_rep(c1, density.data(), density.size(), positions, species, echo);
      stat += projector.get_basis_rep(c2, density.data(), density.size(), positions, species, echo);
      stat += !coefficient_map::identical(c1, c2); // bit-identical when repeated
      stat += (1 != c1["O"].rows()) + (1 != c1["O"].cols());
      if (stat) return stat;

      // analytic sum over the grid points inside r_o= 2
      double const pi = constants::pi;
      double const N = std::pow(2.0, 0.75)*std::sqrt(2/std::tgamma(1.5));
      double reference{0};
      for (int iz = 0; iz < 8; ++iz) {
          for (int iy = 0; iy < 8; ++iy) {
              for (int ix = 0; ix < 8; ++ix) {
                  double const r = std::sqrt(pow2(ix - 3.5) + pow2(iy - 3.5) + pow2(iz - 3.5));
                  if (r < 2) {
                      double const fc = 1 - std::pow(0.5*(1 - std::cos(pi*r/2)), 8);
                      reference += N*std::exp(-r*r)*fc/std::sqrt(4*pi);
                  } // inside
              } // ix
          } // iy
      } // iz
      double const c = c1["O"](0,0);
      if (echo > 3) std::printf("# %s: coefficient %.15f, analytic sum %.15f\n", __func__, c, reference);
      stat += (std::abs(c - reference) > 1e-12*std::abs(reference));
      stat += !(reference > 0);
      return stat;
  } // test_single_oxygen

  inline double dot(coefficient_map::coefficient_map_t const & a, coefficient_map::coefficient_map_t const & b) {
      double d{0};
      for (auto const & sa : a) {
          auto const & y = b.at(sa.first);
          for (size_t i = 0; i < sa.second.size(); ++i) { d += sa.second.data()[i]*y.data()[i]; }
      } // sa
      return d;
  } // dot

  status_t test_duality(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      // <c(rho), g> == <rho, V(g)> for the adjoint pair
      status_t stat(0);
      auto const g = test_grid(12, 0.5);
      Projector projector(test_basis(), g, config_t(), echo);
      std::vector<double> const positions = {0.1, 0.2, -0.3,  1.0, -0.5, 0.4,  -1.2, 0.3, 0.8};
      std::vector<std::string> const species = {"O", "H", "O"};
      std::vector<double> density(g.all());
      for (size_t i = 0; i < g.all(); ++i) { density[i] = std::sin(0.37*i) + 0.5*std::cos(0.011*i*i); }
      coefficient_map::coefficient_map_t c;
      stat += projector.get_basis_rep(c, density.data(), density.size(), positions, species, echo);
      if (stat) return stat;
      stat += (2 != c["O"].rows()) + (2 + 3 != c["O"].cols());
      stat += (1 != c["H"].rows()) + (1 + 5 != c["H"].cols());

      auto gradient = c; // same shapes
      for (auto & sg : gradient) {
          for (size_t i = 0; i < sg.second.size(); ++i) { sg.second.data()[i] = std::cos(0.11*i + sg.first[0]); }
      } // sg
      std::vector<double> V;
      stat += projector.get_V(V, gradient, positions, species, echo);
      stat += (V.size() != g.all());
      if (stat) return stat;
      double const lhs = dot(c, gradient);
      double const rhs = dot_product(g.all(), density.data(), V.data());
      if (echo > 3) std::printf("# %s: <c,g>= %.15f <rho,V>= %.15f\n", __func__, lhs, rhs);
      stat += (std::abs(lhs - rhs) > 1e-10*std::max(1., std::abs(lhs)));

      { // unit impulses: c(e_p)[f] == V(e_f)[p]
          size_t const ip = g.index(6, 6, 5);
          std::vector<double> impulse(g.all(), 0.0);
          impulse[ip] = 1;
          coefficient_map::coefficient_map_t ce;
          stat += projector.get_basis_rep(ce, impulse.data(), impulse.size(), positions, species, echo);
          double maxdev{0};
          for (auto const & sg : ce) {
              for (size_t i = 0; i < sg.second.size(); ++i) {
                  auto e = gradient;
                  for (auto & se : e) { set(se.second.data(), se.second.size(), 0.0); }
                  e[sg.first].data()[i] = 1;
                  stat += projector.get_V(V, e, positions, species);
                  maxdev = std::max(maxdev, std::abs(V[ip] - sg.second.data()[i]));
              } // i
          } // sg
          if (echo > 3) std::printf("# %s: unit impulses deviate %.1e\n", __func__, maxdev);
          stat += (maxdev > 1e-10);
      }
      return stat;
  } // test_duality

  status_t test_memory_mode(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      auto const g = test_grid(10, 0.5);
      config_t with_memory;
      with_memory.use_memory = true;
      Projector plain(test_basis(), g, config_t(), echo);
      Projector cached(test_basis(), g, with_memory, echo);
      std::vector<double> const positions = {0.1, 0.2, -0.3,  1.0, -0.5, 0.4};
      std::vector<std::string> const species = {"O", "H"};
      std::vector<double> density(g.all());
      for (size_t i = 0; i < g.all(); ++i) { density[i] = 1 + std::sin(0.1*i); }
      coefficient_map::coefficient_map_t c0, c1, c2;
      stat += plain.get_basis_rep(c0, density.data(), density.size(), positions, species, echo);
      stat += cached.get_basis_rep(c1, density.data(), density.size(), positions, species, echo);
      stat += (2 != cached.cache_size()) + (0 != plain.cache_size());
      stat += cached.get_basis_rep(c2, density.data(), density.size(), positions, species, echo);
      stat += (2 != cached.cache_size());
      stat += !coefficient_map::identical(c0, c1) + !coefficient_map::identical(c1, c2);
      cached.clear_cache();
      stat += (0 != cached.cache_size());
      return stat;
  } // test_memory_mode

  status_t test_point_cloud(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      // a point cloud with all grid points and weights dV reproduces the grid projection
      auto const g = test_grid(10, 0.5);
      real_space::point_cloud_t cloud;
      for (int iz = 0; iz < g[2]; ++iz) {
          for (int iy = 0; iy < g[1]; ++iy) {
              for (int ix = 0; ix < g[0]; ++ix) {
                  cloud.xyz.push_back(g.position(ix, 0));
                  cloud.xyz.push_back(g.position(iy, 1));
                  cloud.xyz.push_back(g.position(iz, 2));
                  cloud.weights.push_back(g.dV());
              } // ix
          } // iy
      } // iz
      Projector on_grid(test_basis(), g, config_t(), echo);
      Projector on_cloud(test_basis(), cloud, config_t(), echo);
      std::vector<double> const positions = {0.3, -0.2, 0.1};
      std::vector<std::string> const species = {"O"};
      std::vector<double> density(g.all());
      for (size_t i = 0; i < g.all(); ++i) { density[i] = std::exp(-0.001*i); }
      coefficient_map::coefficient_map_t cg, cc;
      status_t stat(0);
      stat += on_grid.get_basis_rep(cg, density.data(), density.size(), positions, species, echo);
      stat += on_cloud.get_basis_rep(cc, density.data(), density.size(), positions, species, echo);
      if (stat) return stat;
      double const dev = coefficient_map::max_abs_difference(cg["O"], cc["O"]);
      if (echo > 3) std::printf("# %s: grid and point cloud deviate %.1e\n", __func__, dev);
      return (dev > 1e-12);
  } // test_point_cloud

  status_t test_periodic(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      // in a periodic cell with constant density, the atom position on a grid point does not matter
      real_space::grid_t g(8, 8, 8);
      status_t stat = g.set_grid_spacing(1.0);
      stat += g.set_boundary_conditions(Periodic_Boundary);
      Projector projector(test_basis(), g, config_t(), echo);
      std::vector<double> const density(g.all(), 1.0);
      std::vector<double> const positions = {0, 0, 0,  4, 4, 4};
      std::vector<std::string> const species = {"O", "O"};
      coefficient_map::coefficient_map_t c;
      stat += projector.get_basis_rep(c, density.data(), density.size(), positions, species, echo);
      if (stat) return stat;
      double dev{0};
      for (size_t f = 0; f < c["O"].cols(); ++f) {
          dev = std::max(dev, std::abs(c["O"](0,f) - c["O"](1,f)));
      } // f
      if (echo > 3) std::printf("# %s: corner and center atom deviate %.1e\n", __func__, dev);
      return stat + (dev > 1e-12);
  } // test_periodic

  status_t test_errors(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      auto const g = test_grid(6, 0.5);
      Projector projector(test_basis(), g, config_t(), echo);
      std::vector<double> const density(g.all(), 1.0);
      coefficient_map::coefficient_map_t c;
      stat += !is_shape_error(projector.get_basis_rep(c, density.data(), density.size(), {0,0,0, 1,1}, {"O", "H"}, echo));
      stat += !is_config_error(projector.get_basis_rep(c, density.data(), density.size(), {0,0,0}, {"C"}, echo));
      stat += !is_shape_error(projector.get_basis_rep(c, density.data(), density.size() - 1, {0,0,0}, {"O"}, echo));
      stat += !is_config_error(projector.get_basis_rep(c, density.data(), density.size(), {}, {}, echo));
      std::vector<double> V;
      coefficient_map::coefficient_map_t wrong;
      wrong["O"] = coefficient_map::species_array_t(1, 4); // needs 5 functions
      stat += !is_shape_error(projector.get_V(V, wrong, {0,0,0}, {"O"}, echo));
      wrong["O"] = coefficient_map::species_array_t(1, 5);
      stat += projector.get_V(V, wrong, {0,0,0}, {"O"}, echo); // correct shape
      wrong["H"] = coefficient_map::species_array_t(1, 6);
      stat += !is_shape_error(projector.get_V(V, wrong, {0,0,0}, {"O"}, echo)); // extra species
      basis_parser::basis_map_t broken;
      broken["O"].push_back(basis_parser::make_shell(0, {{}}, {{}}, {{}}));
      Projector bad(broken, g, config_t(), echo);
      stat += !is_config_error(bad.setup_status());
      stat += !is_config_error(bad.get_basis_rep(c, density.data(), density.size(), {0,0,0}, {"O"}, echo));
      return stat;
  } // test_errors

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_single_oxygen(echo);
      stat += test_duality(echo);
      stat += test_memory_mode(echo);
      stat += test_point_cloud(echo);
      stat += test_periodic(echo);
      stat += test_errors(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace basis_projector
