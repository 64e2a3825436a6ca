#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cstdint> // uint32_t, int8_t
#include <algorithm> // std::min, ::max
#include <cassert> // assert
#include <vector> // std::vector<T>

#include "status.hxx" // status_t

#include "boundary_condition.hxx" // Periodic_Boundary, Isolated_Boundary, Invalid_Boundary
#include "recorded_warnings.hxx" // warn

namespace real_space {

  class grid_t {
  // Cartesian real-space grid, x runs fastest: izyx = (iz*ny + iy)*nx + ix
  private:
      uint32_t dims[3]; // grid points in x,y,z
      int8_t bc[3]; // boundary conditions
  public:
      double h[3], inv_h[3]; // grid spacings and their inverse
      double origin[3]; // Cartesian position of grid point (0,0,0)

      grid_t(void) : dims{0,0,0}, bc{0,0,0}, h{1,1,1}, inv_h{1,1,1}, origin{0,0,0} {} // default constructor

      grid_t(int const d0, int const d1, int const d2)
        : bc{Isolated_Boundary, Isolated_Boundary, Isolated_Boundary}, h{1,1,1}, inv_h{1,1,1}, origin{0,0,0} {
          dims[0] = std::max(1, d0); // x
          dims[1] = std::max(1, d1); // y
          dims[2] = std::max(1, d2); // z
      } // constructor

      template <typename int_t>
      grid_t(int_t const dim[3]) : grid_t(dim[0], dim[1], dim[2]) {} // delegating contructor

      status_t set_grid_spacing(double const hx, double const hy=-1, double const hz=-1) {
          status_t stat(0);
          double const h3[3] = {hx, (hy < 0) ? hx : hy, (hz < 0) ? hx : hz};
          for (int d = 0; d < 3; ++d) {
              if (h3[d] > 0) {
                  h[d] = h3[d];
                  inv_h[d] = 1./h[d];
              } else {
                  ++stat;
              } // h > 0
          } // d
          return stat ? (STATUS_CONFIG_ERROR | stat) : 0;
      } // set_grid_spacing

      void set_origin(double const x, double const y, double const z) { origin[0] = x; origin[1] = y; origin[2] = z; }

      // place the origin such that the grid is centered around a point
      void center_around(double const c[3]) {
          for (int d = 0; d < 3; ++d) {
              origin[d] = c[d] - 0.5*(dims[d] - 1)*h[d];
          } // d
      } // center_around

      status_t set_boundary_conditions(int8_t const bcx
                                     , int8_t const bcy=Invalid_Boundary
                                     , int8_t const bcz=Invalid_Boundary) {
          bc[0] = bcx;
          bc[1] = (bcy == Invalid_Boundary) ? bcx : bcy;
          bc[2] = (bcz == Invalid_Boundary) ? bcx : bcz;
          return (bcx == Invalid_Boundary) ? STATUS_CONFIG_ERROR : 0;
      } // set_boundary_conditions

      inline int operator[] (int const d) const { assert(0 <= d); assert(d < 3); return dims[d]; }
      inline int operator() (char const c) const { assert('x' <= (c|32)); assert((c|32) <= 'z'); return dims[(c|32) - 120]; }
      inline double dV() const { return h[0]*h[1]*h[2]; } // volume element for integration
      inline size_t all() const { return (size_t(dims[2]) * dims[1]) * dims[0]; }
      inline size_t index(int const ix, int const iy, int const iz) const { return (size_t(iz)*dims[1] + iy)*dims[0] + ix; }
      inline double position(int const i, int const d) const { return origin[d] + i*h[d]; }
      inline int8_t boundary_condition(int const d) const { assert(0 <= d); assert(d < 3); return bc[d]; }
      inline int8_t const * boundary_conditions() const { return bc; }
      inline bool is_periodic(int const d) const { return Periodic_Boundary == boundary_condition(d); }

  }; // class grid_t


  class point_cloud_t {
  // arbitrary integration points with individual weights, e.g. atom-centered quadrature grids
  public:
      std::vector<double> xyz; // positions, [npoints*3]
      std::vector<double> weights; // integration weights, [npoints]

      point_cloud_t() {} // default constructor

      point_cloud_t(std::vector<double> const & coords, std::vector<double> const & w)
        : xyz(coords), weights(w) {} // constructor

      status_t check(int const echo=0) const {
          if (weights.empty()) {
              warn("point cloud has no points, %ld coordinates", long(xyz.size()));
              return STATUS_SHAPE_ERROR;
          } // empty
          if (xyz.size() != 3*weights.size()) {
              warn("point cloud has %ld coordinates for %ld weights", long(xyz.size()), long(weights.size()));
              return STATUS_SHAPE_ERROR;
          } // size mismatch
          if (echo > 7) std::printf("# point cloud with %ld points\n", long(weights.size()));
          return 0;
      } // check

      inline size_t all() const { return weights.size(); }
      inline double const * point(size_t const ip) const { return &xyz[ip*3]; }

  }; // class point_cloud_t


#ifdef    NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else  // NO_UNIT_TESTS

  inline status_t test_indexing(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      grid_t g(5, 6, 7);
      status_t stat(0);
      stat += (210 != g.all());
      stat += (g.index(1, 2, 3) != size_t((3*6 + 2)*5 + 1));
      stat += (5 != g('x')) + (7 != g('z'));
      return stat;
  } // test_indexing

  inline status_t test_centering(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      grid_t g(8, 8, 8);
      status_t stat(0);
      stat += g.set_grid_spacing(1.0);
      double const center[] = {0, 0, 0};
      g.center_around(center);
      // grid points at -3.5, -2.5, ..., 3.5
      stat += (-3.5 != g.position(0, 0));
      stat += ( 3.5 != g.position(7, 2));
      stat += (1.0 != g.dV());
      stat += (0 == g.set_grid_spacing(-1.0)); // must fail
      return stat;
  } // test_centering

  inline status_t test_point_cloud(int const echo=0) {
      std::vector<double> const coords = {0,0,0, 1,0,0};
      point_cloud_t ok(coords, std::vector<double>(2, 0.5)), bad(coords, std::vector<double>(3, 0.5)), empty;
      return ok.check(echo) + !is_shape_error(bad.check(echo)) + !is_shape_error(empty.check(echo));
  } // test_point_cloud

  inline status_t all_tests(int const echo=0) {
      status_t stat(0);
      stat += test_indexing(echo);
      stat += test_centering(echo);
      stat += test_point_cloud(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace real_space
