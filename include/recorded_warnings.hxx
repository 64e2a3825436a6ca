#pragma once
// This file is part of bproj under MIT License

#include <cstdio>  // std::printf, ::fprintf, ::snprintf, ::fflush, stdout, stderr
#include <utility> // std::forward, ::pair<T1,T1>
#include <cstring> // std::strrchr

#include "status.hxx" // status_t

#define warn(MESSAGE, ...) \
    recorded_warnings::_print_warning_message(__FILE__, __LINE__, __func__, MESSAGE, __VA_ARGS__)

namespace recorded_warnings {

  int constexpr MaxMessageLength = 256;

  inline char const * after_last_slash(char const *path_and_file, char const slash='/') {
      auto const has_slash = std::strrchr(path_and_file, slash);
      return has_slash ? (has_slash + 1) : path_and_file;
  } // after_last_slash

  // hidden function, please use the macro 'warn' above to create a new warning
  std::pair<char*,int> _new_warning(char const *file, int const line, char const *func); // declaration only

  template <class... Args>
  int _print_warning_message(
        char const *srcfile
      , int  const  srcline
      , char const *srcfunc
      , char const *format
      , Args &&... args
  ) {
      auto const str_int = _new_warning(srcfile, srcline, srcfunc);
      char *const message = str_int.first;
      int const nchars = std::snprintf(message, MaxMessageLength, format, std::forward<Args>(args)...);

      int const flags = str_int.second; // 0x1:stdout, 0x2:stderr, 0x4:last time on stdout
      if (flags & 0x1) {
          std::printf("# Warning: %s\n", message);
          if (flags & 0x4) std::printf("# This warning will not be shown again!\n");
          std::printf("\n");
          std::fflush(stdout);
      } // message to stdout
      if (flags & 0x2) {
          std::fprintf(stderr, "%s:%d warn(\"%s\")\n", after_last_slash(srcfile), srcline, message);
      } // message to stderr

      return nchars*(flags & 0x1);
  } // _print_warning_message

  status_t show_warnings(int const echo=1); // summary of all recorded warnings

  status_t clear_warnings(int const echo=1);

  size_t number_of_warnings(); // how many different source locations have warned

  status_t all_tests(int const echo=0); // declaration only

} // namespace recorded_warnings
