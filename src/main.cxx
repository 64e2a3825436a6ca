// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cassert> // assert
#include <cstdlib> // std::abs
#include <vector> // std::vector
#include <string> // std::string
#include <sstream> // std::istringstream
#include <tuple> // std::tuple, ::make_tuple, ::get

#include "status.hxx" // status_t
#include "recorded_warnings.hxx" // warn, ::show_warnings, ::clear_warnings
#include "simple_timer.hxx" // SimpleTimer
#include "control.hxx" // ::command_line_interface, ::get, ::set, ::read_control_file, ::show_variables
#include "basis_parser.hxx" // ::instructions_t, ::read_basis_instructions, ::complete_basis, ::validate, ::show
#include "real_space.hxx" // ::grid_t
#include "boundary_condition.hxx" // ::fromString
#include "density_features.hxx" // ::DensityFeatures, ::config_t

#ifndef   NO_UNIT_TESTS
  #include "recorded_warnings.hxx" // ::all_tests
  #include "control.hxx" // ::all_tests
  #include "inline_math.hxx" // ::all_tests
  #include "simple_timer.hxx" // ::all_tests
  #include "omp_parallel.hxx" // ::all_tests
  #include "boundary_condition.hxx" // ::all_tests
  #include "real_space.hxx" // ::all_tests
  #include "coefficient_map.hxx" // ::all_tests
  #include "linear_algebra.hxx" // ::all_tests
  #include "json_reading.hxx" // ::all_tests
  #include "basis_parser.hxx" // ::all_tests
  #include "radial_basis.hxx" // ::all_tests
  #include "angular_basis.hxx" // ::all_tests
  #include "grid_window.hxx" // ::all_tests
  #include "basis_projector.hxx" // ::all_tests
  #include "atomic_orbital.hxx" // ::all_tests
  #include "basis_padder.hxx" // ::all_tests
  #include "density_features.hxx" // ::all_tests
  #include "grouped_transform.hxx" // ::all_tests
#endif // NO_UNIT_TESTS

  status_t run_unit_tests(char const *module=nullptr, int const echo=0) {
#ifdef    NO_UNIT_TESTS
      warn("version was compiled with -D NO_UNIT_TESTS, cannot test module '%s'", module);
      return STATUS_TEST_NOT_INCLUDED;
#else  // NO_UNIT_TESTS

      SimpleTimer unit_test_timer(__FILE__, __LINE__, __func__, 0); // timer over all tests

      std::string const input_name(module ? module : "");
      bool const show = ('?' == input_name[0]);
      bool const all  = ( 0  == input_name[0]) || show;
      if (echo > 0) {
          if (show) { std::printf("\n# show available module tests:\n"); } else
          if (all)  { std::printf("\n# run all tests!\n\n"); }
          else      { std::printf("\n# run unit tests for module '%s'\n\n", input_name.c_str()); }
      } // echo

      std::vector<std::tuple<char const*, double, status_t>> results;
      { // testing scope

#define   add_module_test(MODULE_NAME) {                                            \
              auto const module_name = #MODULE_NAME;                                \
              if (all || (input_name == module_name)) {                             \
                  SimpleTimer timer(module_name, 0, "", 0);                         \
                  if (echo > 2) std::printf("\n\n\n# ============= Module test"     \
                     " for %s ==================\n\n", module_name);                \
                  auto const stat = show ? 0 : MODULE_NAME::all_tests(echo);        \
                  results.push_back(std::make_tuple(module_name, timer.stop(), stat)); \
              }                                                                     \
          } // add_module_test

          // infrastructure
          add_module_test(recorded_warnings);
          add_module_test(control);
          add_module_test(inline_math);
          add_module_test(simple_timer);
          add_module_test(omp_parallel);
          add_module_test(boundary_condition);
          add_module_test(real_space);
          add_module_test(coefficient_map);
          add_module_test(linear_algebra);
          add_module_test(json_reading);
          // basis and projection
          add_module_test(basis_parser);
          add_module_test(radial_basis);
          add_module_test(angular_basis);
          add_module_test(grid_window);
          add_module_test(basis_projector);
          // labels, padding and features
          add_module_test(atomic_orbital);
          add_module_test(basis_padder);
          add_module_test(density_features);
          add_module_test(grouped_transform);

#undef    add_module_test

      } // testing scope

      status_t status(0);
      if (results.size() < 1) { // nothing has been tested
          warn("test for '%s' not found, use -t '?' to see available modules!", module);
          return -1;
      } else {
          if (echo > 0) std::printf("\n\n");
          int const show_timings = control::get("timings.show", 0.);
          int nonzero_status{0};
          int const nmodules = results.size();
          for (auto result : results) {
              auto const name = std::get<0>(result);
              auto const time = std::get<1>(result);
              auto const stat = std::get<2>(result);
              if (echo > 1) {
                  if (show) {
                      std::printf("#    module= %s\n", name);
                  } else {
                      std::printf("#    module= %-24s status= %i", name, int(stat));
                      if (0 != stat)    std::printf(" FAILED");
                      if (show_timings) std::printf(" \ttime=%9.3f seconds", time);
                      std::printf("\n");
                  }
              } // echo
              status += std::abs(int(stat)); // |stat| so that positive and negative statuses do not cancel out
              nonzero_status += (0 != int(stat));
          } // result
          if (show) {
              if (echo > 0) std::printf("\n# %d modules can be tested\n", nmodules);
              warn("display mode only, none of %d modules has been tested", nmodules);
          } else { // show
              if (nmodules > 1 && echo > 0) {
                  std::printf("\n#%3d modules have been tested,  total status= %d", nmodules, int(status));
                  if (show_timings) std::printf(" \t %13.3f seconds", unit_test_timer.stop()); // total time
                  std::printf("\n\n");
              } // show total status if many modules have been tested
              if (status > 0) warn("Tests for %d module%s failed!", nonzero_status, (1 == nonzero_status)?"":"s");
          } // show
      } // something has been tested
      return status;
#endif // NO_UNIT_TESTS
  } // run_unit_tests

  status_t run_basis(char const *filename, int const echo=0) {
      // load basis instructions, complete them for the requested species,
      // and optionally project a constant density on a small cubic grid
      basis_parser::instructions_t instructions;
      instructions.default_sigma = control::get("basis.sigma", basis_parser::default_sigma);
      auto stat = basis_parser::read_basis_instructions(instructions, filename, echo);
      if (stat) return stat;

      std::vector<std::string> symbols;
      {   std::istringstream list(control::get("basis.species", ""));
          std::string symbol;
          while (list >> symbol) { symbols.push_back(symbol); }
      } // species list
      stat += basis_parser::complete_basis(instructions, symbols, echo);
      stat += basis_parser::validate(instructions.basis, echo);
      if (stat) return stat;
      if (echo > 2) {
          for (auto const & sb : instructions.basis) {
              basis_parser::show(sb.second, sb.first.c_str(), echo);
          } // sb
      } // echo

      int const ng = control::get("features.grid", 0.); // grid points per direction, 0: no projection
      if (ng < 1) return stat;
      double const spacing = control::get("features.spacing", 0.25);

      // one atom of each species at the center of a cubic grid
      real_space::grid_t g(ng, ng, ng);
      stat += g.set_grid_spacing(spacing);
      auto const bc = boundary_condition::fromString(control::get("features.boundary", "isolated"), echo);
      if (Invalid_Boundary == bc) warn("features.boundary must be \"isolated\" or \"periodic\", found \"%s\"", control::get("features.boundary", ""));
      stat += g.set_boundary_conditions(bc);
      double const center[] = {0, 0, 0};
      g.center_around(center);
      std::vector<double> positions;
      std::vector<std::string> species;
      for (auto const & sb : instructions.basis) {
          species.push_back(sb.first);
          positions.insert(positions.end(), center, center + 3);
      } // sb

      auto const config = density_features::make_config(instructions,
                              control::get("projector.memory", 0.) > 0,
                              control::get("padder.strict", 0.) > 0);
      density_features::DensityFeatures features(instructions.basis, g, positions, species, config, echo);
      stat += features.setup_status();
      if (stat) return stat;

      std::vector<double> const density(g.all(), 1.0);
      coefficient_map::coefficient_map_t coefficients;
      stat += features.get_basis_rep(coefficients, density.data(), density.size(), echo);
      if (echo > 0) {
          for (auto const & sa : coefficients) {
              auto const & c = sa.second;
              double norm2{0};
              for (size_t i = 0; i < c.size(); ++i) { norm2 += c.data()[i]*c.data()[i]; }
              std::printf("# features of %s: [%ld][%ld] norm^2= %.9g\n", sa.first.c_str(), long(c.rows()), long(c.cols()), norm2);
          } // sa
      } // echo
      return stat;
  } // run_basis

  int show_help(char const *executable) {
      std::printf("Usage %s [OPTION]\n"
        "   --help           [-h]\tThis help message\n"
        "   --version            \tShow version number\n"
#ifndef  NO_UNIT_TESTS
        "   --test <module>  [-t]\tRun module unit test\n"
#endif // NO_UNIT_TESTS
        "   --verbose        [-V]\tIncrement verbosity level\n"
        "   +<name>=<value>      \tModify variable environment\n"
        "   +basis.file=<json>   \tLoad basis instructions\n"
        "\n", executable);
      return 0;
  } // show_help

  int show_version(char const *executable="#", int const echo=0) {
#ifdef    _GIT_KEY
      // stringify the value of a macro, two expansion levels needed
      #define macro2string(a) stringify(a)
      #define stringify(b) #b
      auto const git_key = macro2string(_GIT_KEY);
      #undef  stringify
      #undef  macro2string
      control::set("git.key", git_key); // store in the global variable environment
      if (echo > 0) std::printf("# %s git checkout %s\n\n", executable, git_key);
#endif // _GIT_KEY
      return 0;
  } // show_version

  int main(int const argc, char const *argv[]) {
      if (argc < 2) {
          std::printf("%s: no arguments passed!\n", (argc < 1) ? __FILE__ : argv[0]);
          return -1;
      } // no argument passed to executable
      status_t stat(0);
      char const *test_unit = ""; // the name of the unit to be tested
      int run_tests{0};
      int verbosity{3}; // set default verbosity low
      control::set("executable.name", argv[0]);
      for (int iarg = 1; iarg < argc; ++iarg) {
          assert(nullptr != argv[iarg]);
          char const ci0 = *argv[iarg]; // char #0 of command line argument #iarg
          if ('-' == ci0) {

              // options (short or long)
              char const ci1 = *(argv[iarg] + 1); // char #1 of command line argument #iarg
              char const IgnoreCase = 'a' - 'A'; // use with | to convert upper case chars into lower case chars
              if ('-' == ci1) {

                  // long options with "--"
                  std::string option(argv[iarg] + 2); // + 2 to remove "--" in front
                  if ("help" == option) {
                      return show_help(argv[0]);
                  } else
                  if ("version" == option) {
                      return show_version(argv[0], 1);
                  } else
                  if ("verbose" == option) {
                      verbosity = 6; // set verbosity high
                  } else
                  if ("test" == option) {
                      ++run_tests; if (iarg + 1 < argc) test_unit = argv[iarg + 1];
                  } else {
                      ++stat; warn("ignored unknown command line option --%s", option.c_str());
                  } // option

              } else { // ci1

                  // short options with "-"
                  if ('h' == (ci1 | IgnoreCase)) {
                      return show_help(argv[0]);
                  } else
                  if ('v' == (ci1 | IgnoreCase)) {
                      verbosity += 1 + 3*('V' == ci1); // increment by 'V':4, 'v':1
                  } else
                  if ('t' == (ci1 | IgnoreCase)) {
                      ++run_tests; if (iarg + 1 < argc) test_unit = argv[iarg + 1];
                  } else {
                      ++stat; warn("ignored unknown command line option -%c", ci1);
                  } // ci1

              } // ci1

          } else // ci0
          if ('+' == ci0) {
              stat += control::command_line_interface(argv[iarg] + 1, iarg); // start after the '+' char
          } else
          if (argv[iarg] != test_unit) {
              ++stat; warn("ignored command line argument \'%s\'", argv[iarg]);
          } // ci0

      } // iarg
      //
      if (verbosity > 0) {
          std::printf("\n#");
          for (int iarg = 0; iarg < argc; ++iarg) {
              std::printf(" %s", argv[iarg]); // repeat all command line arguments for completeness of the log file
          } // iarg
          std::printf("\n");
      } // verbosity
      //
      // in addition to command_line_interface, we can modify the control environment by a file
      stat += control::read_control_file(control::get("control.file", ""), verbosity);
      //
      int const echo = control::get("verbosity", double(verbosity)); // verbosity may have been defined in the control file
      //
      stat += show_version(argv[0], echo);
      //
      if (echo > 0) std::printf("\n# verbosity=%d\n", echo);
      // run
      if (run_tests) {
          stat += run_unit_tests(test_unit, echo);
      } // run_tests

      auto const basis_file = control::get("basis.file", "");
      if ('\0' != *basis_file) {
          stat += run_basis(basis_file, echo);
      } // basis_file

      // finalize
      {   int const control_show = control::get("control.show", 0.); // 0:show none, 1:show used, 2:show unused, 4:show defaults
          if (echo > 3) std::printf("\n# control.show=%d     0:none 1:used 2:unused 4:defaults\n", control_show);
          if (control_show && echo > 0) {
              stat += control::show_variables(control_show);
          }
      } // show all variable names defined in the control environment

      if (echo > 0) recorded_warnings::show_warnings(3);
      recorded_warnings::clear_warnings(1);
      return int(stat);
  } // main
