// This file is part of bproj under MIT License

#include <cstdio> // std::printf, ::snprintf
#include <cassert> // assert
#include <string> // std::string
#include <cstdlib> // std::strtod
#include <cstdint> // int32_t, uint32_t
#include <cstring> // std::strchr
#include <map> // std::map<K,V>
#include <fstream> // std::ifstream

#include "control.hxx" // ::set, ::get, ::command_line_interface, ::read_control_file

#include "recorded_warnings.hxx" // warn

namespace control {

  int constexpr MaxNameLength = 64; // max variable name length

  int32_t constexpr default_value_tag = 2e9; // origin tag of variables defined by a get with default

  struct entry_t {
      std::string value;
      uint32_t times_used; // how often the value has been read
      int32_t origin; // >0: command line argument, <0: line in control file, 0: code, default_value_tag
  }; // entry_t

  typedef std::map<std::string, entry_t> environment_t;

  environment_t & _environment() {
      static environment_t map_; // sorted by variable name
      return map_;
  } // _environment

  // convert numeric values to strings without precision loss
  inline std::string double2string(double const number) {
      char buffer[32];
      std::snprintf(buffer, 32, "%.16e", number);
      return std::string(buffer);
  } // double2string

  void _define(char const *const name, char const *const value, int32_t const origin, int const echo) {
      assert(nullptr == std::strchr(name, '=') && "variable names may not contain '='");
      auto & entry = _environment()[name];
      if (!entry.value.empty()) {
          if (echo > 7) std::printf("# control redefines \"%s\" from \"%s\" to \"%s\"\n", name, entry.value.c_str(), value);
          if (default_value_tag != origin) {
              warn("variable \"%s\" was redefined from \"%s\" to \"%s\"", name, entry.value.c_str(), value);
          } // not a default
      } // redefined
      entry.value = value;
      entry.times_used = (default_value_tag == origin); // defaults count as used once
      entry.origin = origin;
  } // _define

  void set(char const *const name, char const *const value, int const echo) {
      assert(nullptr != name  && "control::set(name, value) needs a valid string as name!");
      assert(nullptr != value && "control::set(name, value) needs a valid string as value!");
      if (echo > 5) std::printf("# control::set(\"%s\", \"%s\")\n", name, value);
      _define(name, value, 0, echo);
  } // set<string>

  void set(char const *const name, double const value, int const echo) {
      set(name, double2string(value).c_str(), echo);
  } // set<double>

  char const* get(char const *const name, char const *const default_value) {
      assert(nullptr != name && "control::get(name, default_value) needs a valid string as name!");
      int constexpr echo = default_echo_level;
      auto & map_ = _environment();
      auto const it = map_.find(name);
      if (map_.end() != it && !it->second.value.empty()) {
          ++it->second.times_used;
          if (echo > 5) std::printf("# control::get(\"%s\") = \"%s\"\n", name, it->second.value.c_str());
          return it->second.value.c_str();
      } // found
      _define(name, default_value, default_value_tag, echo);
      return map_[name].value.c_str();
  } // get<string>

  double get(char const *const name, double const default_value) {
      auto const string = get(name, double2string(default_value).c_str());
      return std::strtod(string, nullptr);
  } // get<double>

  status_t show_variables(int const echo) {
      if (echo < 1) return 0;
      bool const show_unused  = echo & 0x2; // all or only accessed ones
      bool const show_default = echo & 0x4; // list also variables at their default value
      std::printf("\n# control has the following variables defined:\n#\n");
      int listed{0};
      for (auto const & pair : _environment()) {
          auto const & entry = pair.second;
          bool const is_default = (default_value_tag == entry.origin);
          if ((show_unused || entry.times_used > 0) && (show_default || !is_default)) {
              std::printf("# %s=%s\n", pair.first.c_str(), entry.value.c_str());
              ++listed;
          } // show
      } // pair
      std::printf("#\n# %d variables listed for control.show=%d\n", listed, echo);
      return 0;
  } // show_variables

  status_t command_line_interface(char const *const statement, int const iarg, int const echo) {
      auto const equal = std::strchr(statement, '=');
      if (nullptr == equal) {
          warn("ignored statement \"%s\", maybe missing \'=\'", statement);
          return STATUS_CONFIG_ERROR;
      } // no '='-sign in statement
      auto const name_length = size_t(equal - statement);
      if (name_length < 1 || name_length >= size_t(MaxNameLength)) {
          warn("variable name in \"%s\" must have 1 to %d chars", statement, MaxNameLength - 1);
          return STATUS_CONFIG_ERROR;
      } // name length
      std::string const name(statement, name_length);
      if (echo > 7) std::printf("# control::command_line_interface found name=\"%s\", value=\"%s\"\n", name.c_str(), equal + 1);
      _define(name.c_str(), equal + 1, iarg, echo);
      return 0;
  } // command_line_interface

  std::string left_trim(std::string const & s) {
      auto const start = s.find_first_not_of(" \n\r\t\f\v");
      return (std::string::npos == start) ? "" : s.substr(start);
  } // left_trim

  status_t read_control_file(char const *const filename, int const echo) {
      char const CommentChar = '#';
      assert(nullptr != filename);
      if ('\0' == *filename) {
          if (echo > 1) std::printf("# no control file given\n");
          return 0;
      } // no filename

      std::ifstream infile(filename, std::ifstream::in);
      if (infile.fail()) {
          warn("unable to open file \"%s\" for reading controls", filename);
          return STATUS_IO_ERROR;
      } // failed

      if (echo > 1) std::printf("\n# reading \"%s\" ...\n\n", filename);
      status_t stat(0);
      int linenumber{0};
      std::string line;
      while (std::getline(infile, line)) {
          ++linenumber;
          auto const tlin = left_trim(line);
          if (tlin.empty() || CommentChar == tlin[0]) continue;
          auto const line_stat = command_line_interface(tlin.c_str(), -linenumber, echo);
          if (line_stat) {
              warn("failure parsing %s:%d \'%s\'", filename, linenumber, line.c_str());
          } else if (echo > 0) {
              std::printf("# %s\n", tlin.c_str());
          }
          stat |= line_stat;
      } // parse file line by line
      if (echo > 3) std::printf("# %s read %d lines from \"%s\", status= %i\n\n", __func__, linenumber, filename, int(stat));
      return stat;
  } // read_control_file

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_control(int const echo=0) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      set("test.a", "5", echo);
      stat += (std::string("5") != get("test.a", "default"));
      stat += (0 != command_line_interface("test.a=6", 99, echo)); // launches a warning about redefining
      stat += (6.0 != get("test.a", 0.));
      stat += (std::string("default") != get("test.undefined", "default"));
      stat += (0 == command_line_interface("no_equal_sign", 98, echo)); // must fail
      return stat;
  } // test_control

  status_t test_precision(int const echo=0, int const nmax=106) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      // rounding errors must not arise from the ASCII representation
      status_t stat(0);
      double d{0.2}; // 1/5 is not representable in binary
      for (int i = 0; i < nmax; ++i) {
          set("test.d", d, 0);
          stat += (get("test.d", 1.) != d);
          d *= 1.0155048; // some number close to 1
      } // i
      if (echo > 1) std::printf("# %s: %i of %i numbers not retrieved exactly\n", __func__, int(stat), nmax);
      return stat;
  } // test_precision

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_control(echo);
      stat += test_precision(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace control
