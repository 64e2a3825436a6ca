#pragma once
// This file is part of bproj under MIT License

#include <cstdlib> // size_t
#include <cstdint> // int64_t
#include <vector> // std::vector<T>

#include "status.hxx" // status_t
#include "real_space.hxx" // ::grid_t, ::point_cloud_t

namespace grid_window {
  // Selection of integration points around an atom

  struct window_t {
      std::vector<int64_t> index; // linear index into the grid or point cloud
      std::vector<double> r; // distance to the center
      std::vector<double> cos_theta; // polar angle
      std::vector<double> phi; // azimuthal angle
      std::vector<double> weight; // integration weight of the point
      size_t size() const { return index.size(); }
      bool empty() const { return index.empty(); }
      void clear() { index.clear(); r.clear(); cos_theta.clear(); phi.clear(); weight.clear(); }
  }; // window_t

  // grid points with distance < r_cut, in scan order (z slowest, x fastest) of the window box.
  // Periodic directions include all images, folded back into the cell, so the indices
  // are ascending only for isolated boundary conditions
  status_t box_around(
        window_t & window // result
      , real_space::grid_t const & g
      , double const center[3]
      , double const r_cut
      , int const echo=0
  );

  // points of a point cloud with distance < r_cut, in input order
  status_t box_around(
        window_t & window // result
      , real_space::point_cloud_t const & cloud
      , double const center[3]
      , double const r_cut
      , int const echo=0
  );

  status_t all_tests(int const echo=0); // declaration only

} // namespace grid_window
