// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::ceil, ::floor, ::sqrt, ::abs
#include <algorithm> // std::max, ::min

#include "grid_window.hxx"

#include "angular_basis.hxx" // ::spherical_coordinates
#include "boundary_condition.hxx" // ::fold_index
#include "recorded_warnings.hxx" // warn

namespace grid_window {

  inline void add_point(window_t & window, int64_t const index, double const v[3], double const weight) {
      double r, cth, phi;
      angular_basis::spherical_coordinates(v, r, cth, phi);
      window.index.push_back(index);
      window.r.push_back(r);
      window.cos_theta.push_back(cth);
      window.phi.push_back(phi);
      window.weight.push_back(weight);
  } // add_point

  status_t box_around(
        window_t & window
      , real_space::grid_t const & g
      , double const center[3]
      , double const r_cut
      , int const echo
  ) {
      window.clear();
      if (!(r_cut > 0)) {
          warn("cutoff radius must be positive, found %g", r_cut);
          return STATUS_CONFIG_ERROR | 1;
      } // r_cut
      // determine the limitations of the window box
      int off[3], end[3], num[3];
      for (int d = 0; d < 3; ++d) {
          double const rel = (center[d] - g.origin[d])*g.inv_h[d];
          off[d] = int(std::ceil (rel - r_cut*g.inv_h[d]));
          end[d] = int(std::floor(rel + r_cut*g.inv_h[d])) + 1;
          if (!g.is_periodic(d)) {
              off[d] = std::max(off[d], 0); // lower
              end[d] = std::min(end[d], g[d]); // upper boundary
          } // isolated
          num[d] = std::max(0, end[d] - off[d]);
      } // d
      auto const nvolume = (size_t(num[0]) * num[1]) * num[2];
      if (echo > 7) std::printf("# %s box x:[%d, %d) y:[%d, %d) z:[%d, %d) = %ld points\n", __func__,
                        off[0], end[0], off[1], end[1], off[2], end[2], long(nvolume));
      if (nvolume < 1) return 0; // empty window, zero contribution

      double const dV = g.dV();
      double const r_cut2 = r_cut*r_cut;
      for (        int iz = off[2]; iz < end[2]; ++iz) {
          double const vz = g.position(iz, 2) - center[2];
          for (    int iy = off[1]; iy < end[1]; ++iy) {
              double const vy = g.position(iy, 1) - center[1];
              for (int ix = off[0]; ix < end[0]; ++ix) {
                  double const vx = g.position(ix, 0) - center[0];
                  if (vx*vx + vy*vy + vz*vz < r_cut2) {
                      // fold periodic images back into the cell
                      int const jx = boundary_condition::fold_index(ix, g[0]),
                                jy = boundary_condition::fold_index(iy, g[1]),
                                jz = boundary_condition::fold_index(iz, g[2]);
                      double const v[] = {vx, vy, vz};
                      add_point(window, int64_t(g.index(jx, jy, jz)), v, dV);
                  } // inside
              } // ix
          } // iy
      } // iz
      if (echo > 5) std::printf("# %s selected %ld of %ld points within %g Bohr\n", __func__, long(window.size()), long(nvolume), r_cut);
      return 0;
  } // box_around

  status_t box_around(
        window_t & window
      , real_space::point_cloud_t const & cloud
      , double const center[3]
      , double const r_cut
      , int const echo
  ) {
      window.clear();
      auto const stat = cloud.check(echo);
      if (stat) return stat;
      if (!(r_cut > 0)) {
          warn("cutoff radius must be positive, found %g", r_cut);
          return STATUS_CONFIG_ERROR | 1;
      } // r_cut
      double const r_cut2 = r_cut*r_cut;
      for (size_t ip = 0; ip < cloud.all(); ++ip) {
          auto const pos = cloud.point(ip);
          double const v[] = {pos[0] - center[0], pos[1] - center[1], pos[2] - center[2]};
          if (v[0]*v[0] + v[1]*v[1] + v[2]*v[2] < r_cut2) {
              add_point(window, int64_t(ip), v, cloud.weights[ip]);
          } // inside
      } // ip
      if (echo > 5) std::printf("# %s selected %ld of %ld points within %g Bohr\n", __func__, long(window.size()), long(cloud.all()), r_cut);
      return 0;
  } // box_around

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_completeness(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      // every grid point with distance < r_cut is included, all others are excluded
      status_t stat(0);
      real_space::grid_t g(12, 10, 9);
      stat += g.set_grid_spacing(0.5, 0.4, 0.6);
      g.set_origin(-1.0, 0.3, -2.0);
      double const center[] = {0.7, 1.1, 0.2}, r_cut = 1.3;
      window_t w;
      stat += box_around(w, g, center, r_cut, echo);
      std::vector<char> selected(g.all(), 0);
      for (size_t i = 0; i < w.size(); ++i) {
          stat += (w.index[i] < 0) + (w.index[i] >= int64_t(g.all()));
          stat += (w.r[i] >= r_cut);
          stat += (w.weight[i] != g.dV());
          ++selected[w.index[i]];
      } // i
      int inside{0};
      for (int iz = 0; iz < g[2]; ++iz) {
          for (int iy = 0; iy < g[1]; ++iy) {
              for (int ix = 0; ix < g[0]; ++ix) {
                  double const v[] = {g.position(ix, 0) - center[0], g.position(iy, 1) - center[1], g.position(iz, 2) - center[2]};
                  bool const is_inside = (v[0]*v[0] + v[1]*v[1] + v[2]*v[2] < r_cut*r_cut);
                  inside += is_inside;
                  stat += (int(is_inside) != selected[g.index(ix, iy, iz)]);
              } // ix
          } // iy
      } // iz
      if (echo > 3) std::printf("# %s: %d points inside, %ld selected\n", __func__, inside, long(w.size()));
      stat += (size_t(inside) != w.size());
      for (size_t i = 1; i < w.size(); ++i) {
          stat += (w.index[i] <= w.index[i - 1]); // scan order
      } // i
      return stat;
  } // test_completeness

  status_t test_exact_cutoff(int const echo=0) {
      // a point at exactly r_cut is excluded
      real_space::grid_t g(5, 5, 5);
      status_t stat = g.set_grid_spacing(1.0);
      double const center[] = {2, 2, 2};
      window_t w;
      stat += box_around(w, g, center, 1.0, echo);
      stat += (1 != w.size()); // only the center point itself
      if (1 == w.size()) stat += (0.0 != w.r[0]) + (1.0 != w.cos_theta[0]) + (0.0 != w.phi[0]);
      double const far[] = {-10, 2, 2};
      stat += box_around(w, g, far, 1.5, echo);
      stat += !w.empty(); // outside of the isolated cell
      return stat;
  } // test_exact_cutoff

  status_t test_periodic_images(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      real_space::grid_t g(4, 4, 4);
      status_t stat = g.set_grid_spacing(1.0);
      stat += g.set_boundary_conditions(Periodic_Boundary);
      double const corner[] = {0, 0, 0};
      window_t w;
      stat += box_around(w, g, corner, 1.1, echo);
      // the center and its 6 neighbors, 3 of them are periodic images
      stat += (7 != w.size());
      for (size_t i = 0; i < w.size(); ++i) {
          stat += (w.index[i] < 0) + (w.index[i] >= int64_t(g.all()));
      } // i
      // box scan order z=-1,0,+1 with the negative neighbors folded to the far side of the cell
      int64_t const expected[] = {48, 12, 3, 0, 1, 4, 16};
      if (7 == w.size()) {
          for (int i = 0; i < 7; ++i) {
              stat += (expected[i] != w.index[i]);
              stat += (std::abs(w.r[i] - (3 == i ? 0.0 : 1.0)) > 1e-14);
          } // i
          stat += (std::abs(w.cos_theta[0] + 1) > 1e-14); // image below the center
          stat += (std::abs(w.cos_theta[6] - 1) > 1e-14); // neighbor above
      } // 7
      stat += (0 == box_around(w, g, corner, 0.0, echo)); // must fail
      return stat;
  } // test_periodic_images

  status_t test_point_cloud(int const echo=0) {
      real_space::point_cloud_t cloud({0,0,0, 0.5,0,0, 2,0,0, 0,0,-0.9}, {0.1, 0.2, 0.3, 0.4});
      double const center[] = {0, 0, 0};
      window_t w;
      status_t stat = box_around(w, cloud, center, 1.0, echo);
      stat += (3 != w.size());
      if (3 == w.size()) {
          stat += (0 != w.index[0]) + (1 != w.index[1]) + (3 != w.index[2]);
          stat += (0.4 != w.weight[2]) + (std::abs(w.cos_theta[2] + 1) > 1e-14);
      } // 3
      real_space::point_cloud_t bad({0,0,0}, {0.1, 0.2});
      stat += !is_shape_error(box_around(w, bad, center, 1.0, echo));
      return stat;
  } // test_point_cloud

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_completeness(echo);
      stat += test_exact_cutoff(echo);
      stat += test_periodic_images(echo);
      stat += test_point_cloud(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace grid_window
