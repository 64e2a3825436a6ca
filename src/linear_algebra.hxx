#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::abs
#include <vector> // std::vector<T>
#include <algorithm> // std::max

#include "status.hxx" // status_t

extern "C" {
    // float64 eigenvalues of a real symmetric matrix
    void dsyev_(char const *jobz, char const *uplo, int const* n, double a[], int const *lda,
                double w[], double work[], int const *lwork, int *info);
} // extern "C"

namespace linear_algebra {

  inline status_t eigenvalues(double w[], int const n, double a[], int const lda) {
      // symmetric matrix a[n][lda] is overwritten by its eigenvectors, row k is the k-th eigenvector,
      // eigenvalues w[n] in ascending order
      int info{0}; char const jobz = 'V', uplo = 'U'; int const lwork = (2*n + 2)*n;
      std::vector<double> work(lwork);
      dsyev_(&jobz, &uplo, &n, a, &lda, w, work.data(), &lwork, &info); // Fortran interface
      return info;
  } // eigenvalues

#ifdef  NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else  // NO_UNIT_TESTS

  inline status_t test_eigenvalues(int const echo=0) {
      // tridiagonal matrix with 2 on the diagonal and -1 off-diagonal has
      // analytical eigenvalues 2 - 2*cos(k*pi/(N + 1)) for k=1..N
      int constexpr N = 6;
      double A[N][N], Eval[N];
      for (int i = 0; i < N; ++i) {
          for (int j = 0; j < N; ++j) {
              A[i][j] = (i == j) ? 2. : ((1 == std::abs(i - j)) ? -1. : 0.);
          } // j
      } // i
      double const Acopy[N][N] = {{2,-1,0,0,0,0}, {-1,2,-1,0,0,0}, {0,-1,2,-1,0,0},
                                  {0,0,-1,2,-1,0}, {0,0,0,-1,2,-1}, {0,0,0,0,-1,2}};
      status_t stat = eigenvalues(Eval, N, A[0], N);
      double dev{0}, dev_vec{0};
      for (int k = 0; k < N; ++k) {
          double const exact = 2 - 2*std::cos((k + 1)*3.14159265358979323846/(N + 1));
          dev = std::max(dev, std::abs(Eval[k] - exact));
          // check A*v = lambda*v for the row eigenvector
          for (int i = 0; i < N; ++i) {
              double Av{0};
              for (int j = 0; j < N; ++j) { Av += Acopy[i][j]*A[k][j]; }
              dev_vec = std::max(dev_vec, std::abs(Av - Eval[k]*A[k][i]));
          } // i
      } // k
      if (echo > 2) std::printf("# %s: DSYEV eigenvalues deviate %.1e, eigenvectors %.1e\n", __func__, dev, dev_vec);
      stat += (dev > 1e-12) + (dev_vec > 1e-12);
      return stat;
  } // test_eigenvalues

  inline status_t all_tests(int const echo=0) {
      status_t stat(0);
      stat += test_eigenvalues(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace linear_algebra
