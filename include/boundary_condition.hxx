#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cstdint> // int8_t

#include "status.hxx" // status_t

  int8_t constexpr Periodic_Boundary =  1;
  int8_t constexpr Isolated_Boundary =  0;
  int8_t constexpr Invalid_Boundary  = -2;

namespace boundary_condition {

  inline int8_t fromString(
        char const *string
      , int const echo=0
      , char const dir='?'
  ) {
      int8_t bc{Invalid_Boundary};
      if (nullptr != string) {
          switch (*string | 32) { // ignore case with | 32
              case 'p': case '1': bc = Periodic_Boundary; break;
              case 'i': case '0': bc = Isolated_Boundary; break;
          } // switch
      } // nullptr != string
      if (echo > 0) {
          char const *const name = (Periodic_Boundary == bc) ? "periodic" :
                                  ((Isolated_Boundary == bc) ? "isolated" : "invalid");
          std::printf("# interpret \"%s\" as %s boundary condition in %c-direction\n", string, name, dir);
      } // echo
      return bc;
  } // fromString

  // index of a periodic image folded back into [0, n)
  inline int fold_index(int const i, int const n) {
      int const r = i % n;
      return (r < 0) ? r + n : r;
  } // fold_index

#ifdef    NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else  // NO_UNIT_TESTS

  inline status_t test_fromString(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      stat += (Periodic_Boundary != fromString("periodic", echo, 'x'));
      stat += (Isolated_Boundary != fromString("Isolated", echo, 'y'));
      stat += (Isolated_Boundary != fromString("0", echo, 'z'));
      stat += (Invalid_Boundary  != fromString("vacuum", echo));
      stat += (Invalid_Boundary  != fromString(nullptr));
      return stat;
  } // test_fromString

  inline status_t test_fold_index(int const echo=0) {
      status_t stat(0);
      stat += (3 != fold_index(-5, 8));
      stat += (0 != fold_index(16, 8));
      stat += (7 != fold_index(-1, 8));
      return stat;
  } // test_fold_index

  inline status_t all_tests(int const echo=0) {
      status_t stat(0);
      stat += test_fromString(echo);
      stat += test_fold_index(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace boundary_condition
