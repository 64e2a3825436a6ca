// This file is part of bproj under MIT License

#include <cstdio> // std::printf, ::remove
#include <cmath> // std::sqrt, ::pow, ::tgamma, ::isfinite
#include <cstdlib> // std::strtod
#include <cstring> // std::strlen
#include <cctype> // std::isalpha, ::toupper
#include <string> // std::string
#include <vector> // std::vector<T>
#include <sstream> // std::istringstream
#include <fstream> // std::ofstream
#include <algorithm> // std::max, ::stable_sort

#include "basis_parser.hxx"

#include "json_reading.hxx" // ::read_json_matrix, ::read_text_file, ::parse_document
#include "quantum_numbers.h" // letter2ell, ell2letter, ellmax_supported
#include "recorded_warnings.hxx" // warn
#include "inline_math.hxx" // pow2

namespace basis_parser {

  double radial_function_t::cutoff() const {
      double r_max{0};
      for (auto const r : r_o) { r_max = std::max(r_max, r); }
      return r_max;
  } // cutoff

  status_t validate(species_basis_t const & basis, char const *symbol, int const echo) {
      status_t stat(0);
      if (basis.empty()) {
          warn("species \"%s\" has no shells", symbol);
          return STATUS_CONFIG_ERROR | 1;
      } // empty
      for (size_t is = 0; is < basis.size(); ++is) {
          auto const & shell = basis[is];
          if (shell.ell < 0 || shell.ell > ellmax_supported) {
              warn("species \"%s\" shell#%i has ell= %i outside [0, %i]", symbol, int(is), shell.ell, ellmax_supported);
              ++stat;
          } // ell out of range
          if (shell.radial.empty()) {
              warn("species \"%s\" shell#%i has no radial functions", symbol, int(is));
              ++stat;
          } // no radials
          for (size_t ir = 0; ir < shell.radial.size(); ++ir) {
              auto const & rf = shell.radial[ir];
              auto const n = rf.alpha.size();
              if (0 == n) {
                  warn("species \"%s\" shell#%i radial#%i has zero-length alpha", symbol, int(is), int(ir));
                  ++stat;
              } // no exponents
              if (rf.coeff.size() != n || rf.r_o.size() != n) {
                  warn("species \"%s\" shell#%i radial#%i has %ld exponents, %ld coefficients and %ld cutoffs",
                        symbol, int(is), int(ir), long(n), long(rf.coeff.size()), long(rf.r_o.size()));
                  ++stat;
                  continue;
              } // length mismatch
              for (size_t i = 0; i < n; ++i) {
                  if (!(rf.alpha[i] > 0) || !(rf.r_o[i] > 0) || !std::isfinite(rf.coeff[i])) {
                      warn("species \"%s\" shell#%i radial#%i entry#%i has alpha= %g, coeff= %g, r_o= %g",
                            symbol, int(is), int(ir), int(i), rf.alpha[i], rf.coeff[i], rf.r_o[i]);
                      ++stat;
                  } // invalid
              } // i
          } // ir
          if (is > 0 && basis[is - 1].ell > shell.ell) {
              warn("species \"%s\" shells are not sorted by ell", symbol);
              ++stat;
          } // not sorted
      } // is
      if (echo > 3) std::printf("# %s: species \"%s\" has %ld shells, status= %i\n", __func__, symbol, long(basis.size()), int(stat));
      return stat ? (STATUS_CONFIG_ERROR | stat) : 0;
  } // validate

  status_t validate(basis_map_t const & basis, int const echo) {
      if (basis.empty()) {
          warn("basis contains no species, found %d", 0);
          return STATUS_CONFIG_ERROR | 1;
      } // empty
      status_t stat(0);
      for (auto const & sb : basis) {
          stat |= validate(sb.second, sb.first.c_str(), echo);
      } // sb
      return stat;
  } // validate

  shell_t make_shell(int const ell
      , std::vector<std::vector<double>> const & alpha
      , std::vector<std::vector<double>> const & coeff
      , std::vector<std::vector<double>> const & r_o
  ) {
      shell_t shell;
      shell.ell = ell;
      auto const nrad = std::max(alpha.size(), std::max(coeff.size(), r_o.size()));
      shell.radial.resize(nrad);
      for (size_t ir = 0; ir < nrad; ++ir) {
          // missing rows stay empty and are reported by validate
          if (ir < alpha.size()) shell.radial[ir].alpha = alpha[ir];
          if (ir < coeff.size()) shell.radial[ir].coeff = coeff[ir];
          if (ir < r_o.size())   shell.radial[ir].r_o   = r_o[ir];
      } // ir
      return shell;
  } // make_shell

  std::vector<double> default_cutoffs(std::vector<double> const & alpha, int const ell, double const sigma) {
      std::vector<double> r_o(alpha.size());
      for (size_t i = 0; i < alpha.size(); ++i) {
          r_o[i] = sigma*(1 + ell/5.)/std::sqrt(alpha[i]);
      } // i
      return r_o;
  } // default_cutoffs

  inline double gaussian_int(int const ell, double const alpha) {
      // int_0^inf r^(2ell+2) exp(-alpha r^2) dr
      return std::tgamma(ell + 1.5)/(2*std::pow(alpha, ell + 1.5));
  } // gaussian_int

  std::vector<double> normalize_contraction(int const ell, std::vector<double> const & alpha, std::vector<double> const & coeff) {
      auto const n = alpha.size();
      std::vector<double> c_norm(n); // coefficients including the primitive normalization
      for (size_t i = 0; i < n; ++i) {
          c_norm[i] = coeff[i]/std::sqrt(gaussian_int(ell, 2*alpha[i]));
      } // i
      double norm2{0};
      for (size_t i = 0; i < n; ++i) {
          for (size_t j = 0; j < n; ++j) {
              norm2 += c_norm[i]*gaussian_int(ell, alpha[i] + alpha[j])*c_norm[j];
          } // j
      } // i
      std::vector<double> normalized(coeff);
      if (norm2 > 0) {
          double const f = 1./std::sqrt(norm2);
          for (auto & c : normalized) { c *= f; }
      } // norm2 > 0
      return normalized;
  } // normalize_contraction

  void sort_shells(species_basis_t & basis) {
      std::stable_sort(basis.begin(), basis.end(),
          [](shell_t const & a, shell_t const & b) { return a.ell < b.ell; });
      species_basis_t merged;
      for (auto & shell : basis) {
          if (!merged.empty() && merged.back().ell == shell.ell) {
              for (auto & rf : shell.radial) { merged.back().radial.push_back(rf); }
          } else {
              merged.push_back(shell);
          }
      } // shell
      basis.swap(merged);
  } // sort_shells

  inline bool same_symbol(std::string const & a, char const *b) {
      if (nullptr == b || '\0' == *b) return true; // accept all
      if (a.size() != std::strlen(b)) return false;
      for (size_t i = 0; i < a.size(); ++i) {
          if (std::toupper((unsigned char)a[i]) != std::toupper((unsigned char)b[i])) return false;
      } // i
      return true;
  } // same_symbol

  inline bool starts_with_keyword(std::string const & line, char const *keyword) {
      size_t const n = std::strlen(keyword);
      if (line.size() < n) return false;
      for (size_t i = 0; i < n; ++i) {
          if (std::toupper((unsigned char)line[i]) != keyword[i]) return false;
      } // i
      return true;
  } // starts_with_keyword

  status_t parse_nwchem(
        species_basis_t & basis
      , std::string const & text
      , char const *symbol
      , double const sigma
      , int const echo
  ) {
      basis.clear();
      struct block_t { std::string letters; std::vector<std::vector<double>> rows; bool active; };
      std::vector<block_t> blocks;
      bool active{false}; // currently inside a block of the requested species
      bool inside{false}; // inside any block

      std::istringstream stream(text);
      std::string line;
      int linenumber{0};
      while (std::getline(stream, line)) {
          ++linenumber;
          auto const hash = line.find('#');
          if (std::string::npos != hash) line = line.substr(0, hash); // strip comment
          auto const start = line.find_first_not_of(" \t\r");
          if (std::string::npos == start) continue; // blank line
          line = line.substr(start);
          if (starts_with_keyword(line, "BASIS") || starts_with_keyword(line, "END")) {
              inside = false;
              continue;
          } // markers

          std::istringstream tokens(line);
          std::string first;
          tokens >> first;
          if (std::isalpha((unsigned char)first[0])) {
              std::string letters;
              tokens >> letters;
              if (letters.empty()) {
                  warn("line %d \"%s\" is not a shell header", linenumber, line.c_str());
                  return STATUS_CONFIG_ERROR | 1;
              } // no shell letters
              for (auto const c : letters) {
                  if (letter2ell(c) < 0) {
                      warn("line %d has unknown angular momentum letter \'%c\'", linenumber, c);
                      return STATUS_CONFIG_ERROR | 1;
                  } // unknown
              } // c
              active = same_symbol(first, symbol);
              inside = true;
              block_t block;
              block.letters = letters;
              block.active = active;
              blocks.push_back(block);
          } else {
              if (!inside) {
                  warn("line %d \"%s\" has data outside of a shell", linenumber, line.c_str());
                  return STATUS_CONFIG_ERROR | 1;
              } // outside
              for (auto & c : line) { if ('D' == c || 'd' == c) c = 'E'; } // Fortran exponents
              std::istringstream numbers(line);
              std::vector<double> row;
              std::string word;
              while (numbers >> word) {
                  char *end{nullptr};
                  double const value = std::strtod(word.c_str(), &end);
                  if (end == word.c_str() || '\0' != *end) {
                      warn("line %d: cannot convert \"%s\" to a number", linenumber, word.c_str());
                      return STATUS_CONFIG_ERROR | 1;
                  } // conversion failed
                  row.push_back(value);
              } // word
              if (row.size() < 2) {
                  warn("line %d needs an exponent and at least one coefficient", linenumber);
                  return STATUS_CONFIG_ERROR | 1;
              } // too short
              blocks.back().rows.push_back(row);
          } // header or data
      } // while

      int n_active{0};
      for (auto const & block : blocks) { n_active += block.active; }
      if (0 == n_active) {
          // element labels of the file do not name this species, take all shells
          if (echo > 2 && !blocks.empty()) std::printf("# %s: no block labeled \"%s\", use all %ld blocks\n", __func__, symbol, long(blocks.size()));
          for (auto & block : blocks) { block.active = true; }
      } // no matching block

      for (auto const & block : blocks) {
          if (!block.active) continue;
          if (block.rows.empty()) {
              warn("species \"%s\" has an empty %s shell", symbol, block.letters.c_str());
              return STATUS_CONFIG_ERROR | 1;
          } // empty block
          auto const ncols = block.rows[0].size() - 1;
          for (auto const & row : block.rows) {
              if (row.size() - 1 != ncols) {
                  warn("species \"%s\" %s shell has rows of different length", symbol, block.letters.c_str());
                  return STATUS_CONFIG_ERROR | 1;
              } // ragged
          } // row
          bool const combined = (block.letters.size() > 1); // e.g. SP: one column per letter
          if (combined && block.letters.size() != ncols) {
              warn("species \"%s\" %s shell needs %ld coefficient columns, found %ld",
                    symbol, block.letters.c_str(), long(block.letters.size()), long(ncols));
              return STATUS_CONFIG_ERROR | 1;
          } // mismatch
          std::vector<double> alpha;
          for (auto const & row : block.rows) { alpha.push_back(row[0]); }
          for (size_t ic = 0; ic < ncols; ++ic) {
              int const ell = letter2ell(block.letters[combined ? ic : 0]);
              std::vector<double> coeff;
              for (auto const & row : block.rows) { coeff.push_back(row[1 + ic]); }
              shell_t shell;
              shell.ell = ell;
              shell.radial.resize(1);
              shell.radial[0].alpha = alpha;
              shell.radial[0].coeff = normalize_contraction(ell, alpha, coeff);
              shell.radial[0].r_o = default_cutoffs(alpha, ell, sigma);
              basis.push_back(shell);
          } // ic
      } // block

      if (basis.empty()) {
          warn("no shells found for species \"%s\"", symbol);
          return STATUS_CONFIG_ERROR | 1;
      } // empty
      sort_shells(basis);
      if (echo > 3) std::printf("# %s: species \"%s\" has %ld shells up to ell= %i\n", __func__, symbol, long(basis.size()), max_ell(basis));
      return validate(basis, symbol, echo);
  } // parse_nwchem

  status_t read_nwchem_file(species_basis_t & basis, char const *filename
      , char const *symbol, double const sigma, int const echo
  ) {
      std::string text;
      auto const stat = json_reading::read_text_file(text, filename, echo);
      if (stat) return stat;
      if (echo > 2) std::printf("# read basis for species \"%s\" from \"%s\"\n", symbol, filename);
      return parse_nwchem(basis, text, symbol, sigma, echo);
  } // read_nwchem_file

  double max_cutoff(species_basis_t const & basis) {
      double r_max{0};
      for (auto const & shell : basis) {
          for (auto const & rf : shell.radial) {
              r_max = std::max(r_max, rf.cutoff());
          } // rf
      } // shell
      return r_max;
  } // max_cutoff

  int number_of_functions(species_basis_t const & basis) {
      int n{0};
      for (auto const & shell : basis) {
          n += (2*shell.ell + 1)*int(shell.radial.size());
      } // shell
      return n;
  } // number_of_functions

  int max_ell(species_basis_t const & basis) {
      int ell{-1};
      for (auto const & shell : basis) { ell = std::max(ell, shell.ell); }
      return ell;
  } // max_ell

  void show(species_basis_t const & basis, char const *symbol, int const echo) {
      if (echo < 1) return;
      std::printf("# basis of species \"%s\": %d functions, cutoff %g Bohr\n", symbol, number_of_functions(basis), max_cutoff(basis));
      for (auto const & shell : basis) {
          for (size_t ir = 0; ir < shell.radial.size(); ++ir) {
              auto const & rf = shell.radial[ir];
              std::printf("#   %c-shell radial#%i with %ld primitives, r_o <= %.3f\n",
                          ell2letter(shell.ell), int(ir), long(rf.alpha.size()), rf.cutoff());
              if (echo > 5) {
                  for (size_t i = 0; i < rf.alpha.size(); ++i) {
                      std::printf("#     alpha= %.6e coeff= %.6e r_o= %.4f\n", rf.alpha[i], rf.coeff[i], rf.r_o[i]);
                  } // i
              } // echo
          } // ir
      } // shell
  } // show

  inline std::string file_path(char const *directory, std::string const & filename) {
      if (nullptr == directory || '\0' == *directory || '/' == filename[0]) return filename;
      std::string path(directory);
      if ('/' != path.back()) path += '/';
      return path + filename;
  } // file_path

  template <class C>
  status_t read_species_entry(species_basis_t & basis, C const & entry, char const *symbol
      , char const *directory, double const default_sigma_value, int const echo
  ) {
      if (entry.IsObject()) {
          if (!entry.HasMember("basis") || !entry["basis"].IsString()) {
              warn("species \"%s\" needs a \"basis\" file name", symbol);
              return STATUS_CONFIG_ERROR | 1;
          } // no basis
          double sigma{default_sigma_value};
          if (entry.HasMember("sigma")) {
              if (!entry["sigma"].IsNumber()) {
                  warn("species \"%s\" has a non-numeric sigma", symbol);
                  return STATUS_CONFIG_ERROR | 1;
              } // not a number
              sigma = entry["sigma"].GetDouble();
          } // has sigma
          if (!(sigma > 0)) {
              warn("species \"%s\" has sigma= %g", symbol, sigma);
              return STATUS_CONFIG_ERROR | 1;
          } // sigma
          auto const path = file_path(directory, entry["basis"].GetString());
          return read_nwchem_file(basis, path.c_str(), symbol, sigma, echo);
      } // file-based basis

      if (entry.IsArray()) {
          basis.clear();
          auto const shells = entry.GetArray();
          for (unsigned is = 0; is < shells.Size(); ++is) {
              auto const & sh = shells[is];
              if (!sh.IsObject() || !sh.HasMember("l") || !sh["l"].IsInt()) {
                  warn("species \"%s\" shell#%i needs an integer \"l\"", symbol, is);
                  return STATUS_CONFIG_ERROR | 1;
              } // no ell
              for (auto const key : {"alpha", "coeff", "r_o"}) {
                  if (!sh.HasMember(key)) {
                      warn("species \"%s\" shell#%i has no \"%s\"", symbol, is, key);
                      return STATUS_CONFIG_ERROR | 1;
                  } // missing
              } // key
              basis.push_back(make_shell(sh["l"].GetInt()
                  , json_reading::read_json_matrix(sh["alpha"], "alpha", echo/2)
                  , json_reading::read_json_matrix(sh["coeff"], "coeff", echo/2)
                  , json_reading::read_json_matrix(sh["r_o"],   "r_o",   echo/2)));
          } // is
          sort_shells(basis);
          return validate(basis, symbol, echo);
      } // explicit shell list

      warn("species \"%s\" entry must be an object or an array", symbol);
      return STATUS_CONFIG_ERROR | 1;
  } // read_species_entry

  status_t parse_basis_instructions(instructions_t & instructions, std::string const & json
      , char const *directory, int const echo
  ) {
      rapidjson::Document doc;
      auto const parse_stat = json_reading::parse_document(doc, json, "basis instructions", echo);
      if (parse_stat) return parse_stat;

      status_t stat(0);
      for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
          std::string const key(it->name.GetString());
          auto const & value = it->value;
          if ("spec_agnostic" == key || "strict" == key) {
              if (!value.IsBool()) {
                  warn("\"%s\" must be true or false", key.c_str());
                  stat |= STATUS_CONFIG_ERROR | 1;
                  continue;
              } // not a bool
              if ("strict" == key) { instructions.strict = value.GetBool(); }
              else                 { instructions.spec_agnostic = value.GetBool(); }
          } else if ("basis" == key) {
              if (!value.IsString()) {
                  warn("global \"basis\" must be a file name, found type %d", int(value.GetType()));
                  stat |= STATUS_CONFIG_ERROR | 1;
                  continue;
              } // not a string
              instructions.default_file = file_path(directory, value.GetString());
          } else if ("sigma" == key) {
              if (!value.IsNumber() || !(value.GetDouble() > 0)) {
                  warn("global \"sigma\" must be a positive number, found type %d", int(value.GetType()));
                  stat |= STATUS_CONFIG_ERROR | 1;
                  continue;
              } // invalid
              instructions.default_sigma = value.GetDouble();
          } else if (key.size() < 3) {
              // chemical symbols have one or two letters
              auto & basis = instructions.basis[key];
              stat |= read_species_entry(basis, value, key.c_str(), directory, instructions.default_sigma, echo);
          } else {
              if (echo > 0) std::printf("# %s: ignore key \"%s\"\n", __func__, key.c_str());
          } // key
      } // it
      if (echo > 2) std::printf("# %s: %ld species, spec_agnostic= %d, strict= %d\n", __func__,
                      long(instructions.basis.size()), int(instructions.spec_agnostic), int(instructions.strict));
      return stat;
  } // parse_basis_instructions

  status_t read_basis_instructions(instructions_t & instructions, char const *filename, int const echo) {
      std::string json;
      auto const stat = json_reading::read_text_file(json, filename, echo);
      if (stat) return stat;
      std::string const path(filename);
      auto const slash = path.rfind('/');
      std::string const directory = (std::string::npos == slash) ? "" : path.substr(0, slash);
      return parse_basis_instructions(instructions, json, directory.c_str(), echo);
  } // read_basis_instructions

  status_t complete_basis(instructions_t & instructions, std::vector<std::string> const & symbols, int const echo) {
      status_t stat(0);
      for (auto const & symbol : symbols) {
          if (instructions.basis.count(symbol)) continue;
          if (instructions.default_file.empty()) {
              warn("no basis for species \"%s\"", symbol.c_str());
              stat |= STATUS_CONFIG_ERROR | 1;
              continue;
          } // no default
          stat |= read_nwchem_file(instructions.basis[symbol], instructions.default_file.c_str(),
                                   symbol.c_str(), instructions.default_sigma, echo);
      } // symbol
      return stat;
  } // complete_basis

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  char const test_basis_text[] =
      "# small test basis\n"
      "BASIS \"ao basis\" PRINT\n"
      "O    S\n"
      "      5.0000000D+00    0.4000000\n"
      "      1.0000000       0.7000000\n"
      "O    D\n"
      "      0.8000000       1.0000000\n"
      "O    SP\n"
      "      0.3000000       1.0000000       1.0000000\n"
      "H    S\n"
      "      1.0000000       1.0000000\n"
      "END\n";

  status_t test_parse_nwchem(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      species_basis_t basis;
      stat += parse_nwchem(basis, test_basis_text, "O", 2.0, echo);
      show(basis, "O", echo);
      // shells sorted by ell: s (two radials), p, d
      stat += (3 != basis.size());
      if (3 != basis.size()) return stat + 1;
      stat += (0 != basis[0].ell) + (1 != basis[1].ell) + (2 != basis[2].ell);
      stat += (2 != basis[0].radial.size()) + (1 != basis[1].radial.size());
      stat += (5.0 != basis[0].radial[0].alpha[0]); // Fortran exponent
      stat += (std::abs(basis[1].radial[0].coeff[0] - 1.0) > 1e-14); // a single primitive is normalized to 1
      stat += (std::abs(basis[2].radial[0].r_o[0] - 2.0*1.4/std::sqrt(0.8)) > 1e-12);
      stat += (2*1 + 3 + 5 != number_of_functions(basis));
      stat += (std::abs(max_cutoff(basis) - 2.0*1.2/std::sqrt(0.3)) > 1e-12);

      { // the contracted s-function is normalized
          auto const & rf = basis[0].radial[0];
          double norm2{0};
          for (int i = 0; i < 2; ++i) {
              for (int j = 0; j < 2; ++j) {
                  norm2 += rf.coeff[i]*rf.coeff[j]*gaussian_int(0, rf.alpha[i] + rf.alpha[j])
                          /std::sqrt(gaussian_int(0, 2*rf.alpha[i])*gaussian_int(0, 2*rf.alpha[j]));
              } // j
          } // i
          if (echo > 3) std::printf("# %s: norm of contracted s-function %.15f\n", __func__, norm2);
          stat += (std::abs(norm2 - 1) > 1e-12);
      }

      species_basis_t all;
      stat += parse_nwchem(all, test_basis_text, "C", 2.0, echo); // no block labeled C, take all
      stat += (3*1 + 3 + 5 != number_of_functions(all));

      // the element label of a file need not match the species
      species_basis_t relabeled;
      stat += parse_nwchem(relabeled, "O S\n 3.0 1.0\nEND\n", "H", 2.0, echo);
      stat += (1 != relabeled.size());
      if (1 == relabeled.size()) stat += (std::abs(relabeled[0].radial[0].r_o[0] - 2.0/std::sqrt(3.0)) > 1e-12);

      species_basis_t none;
      stat += !is_config_error(parse_nwchem(none, "# no shells\nEND\n", "O", 2.0, echo));
      stat += (0 == parse_nwchem(none, "\xc3\x96 S\n 1.0 1.0\n", "O", 2.0, echo)); // non-ASCII element label
      stat += (0 == parse_nwchem(none, "O  S\n  1.0  abc\n", "O", 2.0, echo)); // not a number
      stat += (0 == parse_nwchem(none, "  1.0  1.0\n", "O", 2.0, echo)); // data outside of a shell
      return stat;
  } // test_parse_nwchem

  status_t test_validate(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      species_basis_t basis(1, make_shell(0, {{1.0}}, {{1.0}}, {{2.0}}));
      stat += validate(basis, "O", echo);
      stat += (1 != number_of_functions(basis));
      species_basis_t const empty;
      stat += !is_config_error(validate(empty, "X", echo));
      species_basis_t mismatch(1, make_shell(1, {{1.0, 2.0}}, {{1.0}}, {{2.0, 1.0}}));
      stat += !is_config_error(validate(mismatch, "X", echo));
      species_basis_t no_alpha(1, make_shell(0, {{}}, {{}}, {{}}));
      stat += !is_config_error(validate(no_alpha, "X", echo));
      species_basis_t high_ell(1, make_shell(8, {{1.0}}, {{1.0}}, {{2.0}}));
      stat += !is_config_error(validate(high_ell, "X", echo));
      species_basis_t negative(1, make_shell(0, {{-1.0}}, {{1.0}}, {{2.0}}));
      stat += !is_config_error(validate(negative, "X", echo));
      basis_map_t const no_species;
      stat += !is_config_error(validate(no_species, echo));
      return stat;
  } // test_validate

  status_t test_instructions(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      instructions_t inst;
      stat += parse_basis_instructions(inst,
          "{\"O\": [{\"l\": 1, \"alpha\": [[2.0]], \"coeff\": [[1.0]], \"r_o\": [[1.5]]},"
          "         {\"l\": 0, \"alpha\": [[1.0, 0.5], [0.2]], \"coeff\": [[0.6, 0.4], [1.0]], \"r_o\": [[2.0, 2.5], [3.0]]}],"
          " \"spec_agnostic\": true, \"strict\": false}", "", echo);
      stat += !inst.spec_agnostic + inst.strict;
      stat += (1 != inst.basis.size());
      auto const & O = inst.basis["O"];
      stat += (2 != O.size());
      if (2 == O.size()) {
          stat += (0 != O[0].ell) + (2 != O[0].radial.size()); // sorted by ell
          stat += (3 + 2 != number_of_functions(O));
          stat += (3.0 != max_cutoff(O));
      } // 2 shells

      instructions_t bad;
      stat += (0 == parse_basis_instructions(bad, "{\"O\": [{\"l\": 0, \"alpha\": [[1.0]], \"coeff\": [[1.0, 2.0]], \"r_o\": [[2.0]]}]}", "", echo));
      stat += (0 == parse_basis_instructions(bad, "{\"O\": {\"basis\": \"/non/existing/basis.nwchem\"}}", "", echo));
      stat += (0 == parse_basis_instructions(bad, "{\"strict\": 1}", "", echo));
      instructions_t none;
      stat += (0 == complete_basis(none, {"H"}, echo)); // no default file
      return stat;
  } // test_instructions

  status_t test_files(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      char const nwchem_file[] = "/tmp/bproj_basis_parser_test.nwchem";
      char const json_file[]   = "/tmp/bproj_basis_parser_test.json";
      {   std::ofstream nwchem(nwchem_file);
          nwchem << "BASIS \"ao basis\" PRINT\nO    S\n   3.0   1.0\nO    P\n   1.0   1.0\nEND\n";
          std::ofstream json(json_file);
          json << "{\"H\": {\"basis\": \"bproj_basis_parser_test.nwchem\", \"sigma\": 1.5},\n"
                  " \"basis\": \"bproj_basis_parser_test.nwchem\", \"strict\": true}\n";
          if (!nwchem || !json) {
              warn("cannot write test files \"%s\" and \"%s\"", nwchem_file, json_file);
              return STATUS_IO_ERROR;
          } // failed
      } // files are closed here
      status_t stat(0);

      species_basis_t O;
      stat += read_nwchem_file(O, nwchem_file, "O", default_sigma, echo);
      stat += (2 != O.size()) + (4 != number_of_functions(O));

      // relative file names are resolved against the directory of the instructions
      instructions_t inst;
      stat += read_basis_instructions(inst, json_file, echo);
      stat += !inst.strict + inst.spec_agnostic;
      stat += (std::string(nwchem_file) != inst.default_file);
      stat += (1 != inst.basis.size());
      auto const & H = inst.basis["H"]; // file labeled O, all shells taken
      stat += (2 != H.size());
      if (2 == H.size()) {
          stat += (std::abs(H[0].radial[0].r_o[0] - 1.5/std::sqrt(3.0)) > 1e-12);
          stat += (std::abs(H[1].radial[0].r_o[0] - 1.5*1.2) > 1e-12);
      } // 2 shells

      // species without an own entry use the global basis file with the default sigma
      stat += complete_basis(inst, {"H", "N", "O"}, echo);
      stat += (3 != inst.basis.size());
      auto const & N = inst.basis["N"];
      stat += (2 != N.size());
      if (2 == N.size()) stat += (std::abs(N[0].radial[0].r_o[0] - 2.0/std::sqrt(3.0)) > 1e-12);
      stat += (inst.basis["H"][0].radial[0].r_o[0] == N[0].radial[0].r_o[0]); // H keeps its own sigma
      stat += validate(inst.basis, echo);

      instructions_t missing;
      stat += !is_io_error(read_basis_instructions(missing, "/tmp/bproj_basis_parser_missing.json", echo));
      stat += !is_io_error(parse_basis_instructions(missing, "{\"O\": {\"basis\": \"missing.nwchem\"}}", "/tmp", echo));

      std::remove(nwchem_file);
      std::remove(json_file);
      return stat;
  } // test_files

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_parse_nwchem(echo);
      stat += test_files(echo);
      stat += test_validate(echo);
      stat += test_instructions(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace basis_parser
