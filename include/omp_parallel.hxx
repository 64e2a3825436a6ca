#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf

#include <omp.h> // omp_get_max_threads, ::omp_get_thread_num, ::omp_get_num_threads

#include "status.hxx" // status_t

namespace omp_parallel {
  // Per-atom work in the projector is distributed with OpenMP

  inline int max_threads() { return omp_get_max_threads(); } // controlled by OMP_NUM_THREADS

#ifdef    NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else  // NO_UNIT_TESTS

  inline status_t test_reduction(int const echo=0) {
      int const nitems = 4*max_threads();
      if (echo > 2) std::printf("# OpenMP with max %d threads\n", max_threads());
      int sum{0};
      #pragma omp parallel for reduction(+:sum)
      for (int i = 0; i < nitems; ++i) {
          if (echo > 6) std::printf("# OpenMP thread#%i of %d works on item#%i\n", omp_get_thread_num(), omp_get_num_threads(), i);
          ++sum;
      } // i
      return (nitems != sum);
  } // test_reduction

  inline status_t all_tests(int const echo=0) { return test_reduction(echo); }

#endif // NO_UNIT_TESTS

} // namespace omp_parallel
