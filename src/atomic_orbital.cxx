// This file is part of bproj under MIT License

#include <cstdio> // std::printf, ::snprintf
#include <cstdlib> // std::strtol
#include <cctype> // std::isdigit, ::isspace
#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>

#include "atomic_orbital.hxx"

#include "quantum_numbers.h" // ell2letter, letter2ell, ellmax_supported
#include "recorded_warnings.hxx" // warn

namespace atomic_orbital {

  std::string emm_suffix(int const ell, int const emm) {
      if (1 == ell) {
          char const xyz[][2] = {"x", "y", "z"};
          return std::string(xyz[emm % 3]);
      } // p
      if (2 == ell) {
          char const d[][8] = {"xy", "yz", "z^2", "xz", "x2-y2"};
          return std::string(d[emm % 5]);
      } // d
      if (0 == ell) return std::string("");
      char buffer[8];
      std::snprintf(buffer, 8, "%+d", emm - ell);
      return std::string(buffer);
  } // emm_suffix

  status_t parse(ao_label_t & label, char const *text, int const echo) {
      char const *c = text;
      char *end{nullptr};
      label.atom = std::strtol(c, &end, 10);
      if (end == c || label.atom < 0) {
          warn("label \"%s\" does not start with an atom index", text);
          return STATUS_CONFIG_ERROR | 1;
      } // no atom index
      c = end;
      while (std::isspace((unsigned char)*c)) ++c;
      label.symbol.clear();
      while (*c && !std::isspace((unsigned char)*c)) { label.symbol += *c; ++c; }
      while (std::isspace((unsigned char)*c)) ++c;
      if (label.symbol.empty() || !std::isdigit((unsigned char)*c)) {
          warn("label \"%s\" needs a species symbol and a principal quantum number", text);
          return STATUS_CONFIG_ERROR | 1;
      } // no symbol
      label.enn = std::strtol(c, &end, 10);
      c = end;
      label.ell = letter2ell(*c);
      if (label.ell < 0 || label.enn <= label.ell) {
          warn("label \"%s\" has an invalid shell n=%d letter \'%c\'", text, label.enn, *c);
          return STATUS_CONFIG_ERROR | 1;
      } // invalid shell
      ++c;
      std::string suffix;
      while (*c && !std::isspace((unsigned char)*c)) { suffix += *c; ++c; }
      label.emm = -1;
      for (int emm = 0; emm <= 2*label.ell; ++emm) {
          if (emm_suffix(label.ell, emm) == suffix) label.emm = emm;
      } // emm
      if (label.emm < 0) {
          warn("label \"%s\" has an unknown %c-suffix \"%s\"", text, ell2letter(label.ell), suffix.c_str());
          return STATUS_CONFIG_ERROR | 1;
      } // unknown suffix
      if (echo > 7) std::printf("# %s: \"%s\" is atom #%d n=%d ell=%d emm=%d\n", __func__, text, label.atom, label.enn, label.ell, label.emm);
      return 0;
  } // parse

  std::string format(ao_label_t const & label) {
      char buffer[64];
      std::snprintf(buffer, 64, "%d %s %d%c%s", label.atom, label.symbol.c_str(), label.enn,
                    ell2letter(label.ell), emm_suffix(label.ell, label.emm).c_str());
      return std::string(buffer);
  } // format

  std::vector<std::string> format(std::vector<ao_label_t> const & labels) {
      std::vector<std::string> texts;
      texts.reserve(labels.size());
      for (auto const & label : labels) { texts.push_back(format(label)); }
      return texts;
  } // format

  status_t make_labels(
        std::vector<ao_label_t> & labels
      , basis_parser::basis_map_t const & basis
      , std::vector<std::string> const & species
      , int const echo
  ) {
      labels.clear();
      for (size_t ia = 0; ia < species.size(); ++ia) {
          auto const it = basis.find(species[ia]);
          if (basis.end() == it) {
              warn("no basis for species \"%s\" of atom #%ld", species[ia].c_str(), long(ia));
              return STATUS_CONFIG_ERROR | 1;
          } // no basis
          std::map<int,int> radials_per_ell; // the k-th radial function with ell has n = ell + 1 + k
          for (auto const & shell : it->second) {
              for (size_t k = 0; k < shell.radial.size(); ++k) {
                  int const enn = shell.ell + 1 + radials_per_ell[shell.ell]++;
                  for (int emm = 0; emm <= 2*shell.ell; ++emm) {
                      ao_label_t label;
                      label.atom = ia;
                      label.symbol = species[ia];
                      label.enn = enn;
                      label.ell = shell.ell;
                      label.emm = emm;
                      labels.push_back(label);
                  } // emm
              } // k
          } // shell
      } // ia
      if (echo > 3) std::printf("# %s: %ld labels for %ld atoms\n", __func__, long(labels.size()), long(species.size()));
      return 0;
  } // make_labels

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_parse_and_format(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      char const *const texts[] = {"0 O 2px", "12 Ca 3dx2-y2", "1 H 1s", "3 Fe 4f-3", "2 C 5g+4"};
      for (auto const text : texts) {
          ao_label_t label;
          stat += parse(label, text, echo);
          auto const back = format(label);
          if (echo > 5) std::printf("# %s: \"%s\" --> \"%s\"\n", __func__, text, back.c_str());
          stat += (back != text);
      } // text
      ao_label_t label;
      stat += parse(label, "12 Ca 3dx2-y2", echo);
      stat += (12 != label.atom) + (3 != label.enn) + (2 != label.ell) + (4 != label.emm) + ("Ca" != label.symbol);
      stat += (0 == parse(label, "O 2px", echo)); // no atom index
      stat += (0 == parse(label, "0 O 1p", echo)); // n <= l
      stat += (0 == parse(label, "0 O 2q", echo)); // unknown letter
      stat += !is_config_error(parse(label, "0 O 2pw", echo)); // unknown m-suffix
      stat += !is_config_error(parse(label, "0 O 3dz", echo)); // incomplete d-suffix
      stat += !is_config_error(parse(label, "0 O 1s+1", echo)); // s has no suffix
      stat += parse(label, "0 \xc3\x96 2px", echo); // non-ASCII bytes in the symbol are kept
      stat += (2 != label.symbol.size());
      stat += !is_config_error(parse(label, "0 O \xc2\xb2s", echo)); // non-ASCII instead of n
      return stat;
  } // test_parse_and_format

  status_t test_make_labels(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      basis_parser::basis_map_t basis;
      basis["O"].push_back(basis_parser::make_shell(0, {{1.0}, {0.3}}, {{1.0}, {1.0}}, {{2.0}, {3.0}}));
      basis["O"].push_back(basis_parser::make_shell(1, {{0.8}}, {{1.0}}, {{2.5}}));
      basis["H"].push_back(basis_parser::make_shell(0, {{0.9}}, {{1.0}}, {{1.8}}));
      std::vector<ao_label_t> labels;
      stat += make_labels(labels, basis, {"H", "O"}, echo);
      auto const texts = format(labels);
      char const *const expected[] = {"0 H 1s", "1 O 1s", "1 O 2s", "1 O 2px", "1 O 2py", "1 O 2pz"};
      stat += (6 != texts.size());
      for (size_t i = 0; i < 6 && i < texts.size(); ++i) {
          if (echo > 5) std::printf("# %s: %s\n", __func__, texts[i].c_str());
          stat += (texts[i] != expected[i]);
      } // i
      stat += (0 == make_labels(labels, basis, {"C"}, echo)); // no basis
      return stat;
  } // test_make_labels

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_parse_and_format(echo);
      stat += test_make_labels(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace atomic_orbital
