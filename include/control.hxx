#pragma once
// This file is part of bproj under MIT License

#include "status.hxx" // status_t

namespace control {
  /*
   *    Variable environment of the bproj executable.
   *    Variables are defined as "name=value" on the command line (prefixed by '+'),
   *    in a control file (+control.file=<name>) or by the code itself.
   *    Library classes receive explicit configuration structs; only main() reads here.
   *    Internally, variables are stored as pairs of two strings, name and value.
   */

  int constexpr default_echo_level = 2;

  status_t command_line_interface(char const *statement, int const iarg=0 // define a (name, value) pair
                                  , int const echo=default_echo_level); // by "name=value" syntax

  void set(char const *name, char const  *value, int const echo=default_echo_level); // define a (name, value) pair
  void set(char const *name, double const value, int const echo=default_echo_level);

  char const* get(char const *name, char const * default_value); // read a string  value from the variable environment
  double      get(char const *name, double const default_value); // read a numeric value from the variable environment

  status_t read_control_file(char const *filename, int const echo=0); // read definitions given in an input file

  status_t show_variables(int const echo=default_echo_level); // show which variables were defined

  status_t all_tests(int const echo=0); // declaration only

} // namespace control
