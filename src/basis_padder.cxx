// This file is part of bproj under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::sin
#include <string> // std::string
#include <vector> // std::vector<T>
#include <map> // std::map<K,V>
#include <tuple> // std::tuple, ::make_tuple
#include <algorithm> // std::max
#include <utility> // std::make_pair

#include "basis_padder.hxx"

#include "quantum_numbers.h" // ell2letter
#include "recorded_warnings.hxx" // warn
#include "inline_math.hxx" // set

namespace basis_padder {

  inline int slot_offset(int const enn, int const ell, int const max_l) {
      return (enn - 1)*(max_l + 1)*(max_l + 1) + ell*ell;
  } // slot_offset

  status_t BasisPadder::initialize(std::vector<atomic_orbital::ao_label_t> const & labels, bool const strict, int const echo) {
      _species.clear();
      _n_labels = labels.size();
      _strict = strict;
      if (labels.empty()) {
          warn("empty label list, strict= %d", int(strict));
          return STATUS_CONFIG_ERROR | 1;
      } // empty

      // find maximum angular momentum and n for each species
      std::map<int, std::string> atom_symbol;
      for (auto const & label : labels) {
          auto const it = atom_symbol.find(label.atom);
          if (atom_symbol.end() == it) {
              atom_symbol[label.atom] = label.symbol;
          } else if (it->second != label.symbol) {
              warn("atom #%i is labeled as \"%s\" and \"%s\"", label.atom, it->second.c_str(), label.symbol.c_str());
              _species.clear();
              return STATUS_SHAPE_ERROR | 1;
          } // symbol changes
          auto & s = _species[label.symbol];
          s.max_n = std::max(s.max_n, label.enn);
          s.max_l = std::max(s.max_l, label.ell);
          s.max_n_of_ell[label.ell] = std::max(s.max_n_of_ell[label.ell], label.enn);
      } // label

      // first position and number of labels of each shell
      typedef std::tuple<int,int,int> shell_key_t; // (atom, n, ell)
      std::map<shell_key_t, int> first, count;
      for (size_t i = 0; i < labels.size(); ++i) {
          auto const & label = labels[i];
          auto const key = std::make_tuple(label.atom, label.enn, label.ell);
          if (0 == count[key]++) first[key] = i;
      } // i
      status_t stat(0);
      for (auto const & kf : first) {
          int const i0 = kf.second;
          auto const & label = labels[i0];
          int const nm = 2*label.ell + 1;
          bool contiguous = (count[kf.first] == nm) && (i0 + nm <= int(labels.size()));
          for (int j = 1; j < nm && contiguous; ++j) {
              contiguous = atomic_orbital::same_shell(labels[i0 + j], label);
          } // j
          if (!contiguous) {
              warn("shell %d%c of atom #%i needs %d contiguous labels starting at #%i, found %d", label.enn,
                    ell2letter(label.ell), label.atom, nm, i0, count[kf.first]);
              ++stat;
          } // not contiguous
      } // kf
      if (stat) {
          _species.clear();
          return STATUS_SHAPE_ERROR | stat;
      } // not contiguous

      for (auto const & as : atom_symbol) {
          _species[as.second].atoms.push_back(as.first); // ascending atom index
      } // as

      for (auto & ss : _species) {
          auto const & symbol = ss.first;
          auto & s = ss.second;
          int const width = s.max_n*(s.max_l + 1)*(s.max_l + 1);
          s.populated.assign(s.atoms.size(), std::vector<char>(width, 0));
          s.source.assign(s.atoms.size(), std::vector<int>(0));
          for (size_t row = 0; row < s.atoms.size(); ++row) {
              int const atom = s.atoms[row];
              for (int enn = 1; enn <= s.max_n; ++enn) {
                  for (int ell = 0; ell <= s.max_l; ++ell) {
                      auto const it = first.find(std::make_tuple(atom, enn, ell));
                      if (first.end() != it) {
                          int const offset = slot_offset(enn, ell, s.max_l);
                          for (int m = 0; m < 2*ell + 1; ++m) {
                              s.populated[row][offset + m] = 1;
                              s.source[row].push_back(it->second + m);
                          } // m
                      } else if (_strict && ell < enn && s.max_n_of_ell.count(ell) && enn <= s.max_n_of_ell[ell]) {
                          warn("atom #%i of species \"%s\" has no %d%c shell", atom, symbol.c_str(), enn, ell2letter(ell));
                          ++stat;
                      } // strict
                  } // ell
              } // enn
          } // row
          if (echo > 3) std::printf("# %s: species \"%s\" with %ld atoms, max_n= %d, max_l= %d, width %d\n",
                              __func__, symbol.c_str(), long(s.atoms.size()), s.max_n, s.max_l, width);
      } // ss
      if (stat) {
          _species.clear();
          return STATUS_SHAPE_ERROR | stat;
      } // incomplete
      return 0;
  } // initialize

  status_t BasisPadder::initialize(std::vector<std::string> const & texts, bool const strict, int const echo) {
      _species.clear();
      std::vector<atomic_orbital::ao_label_t> labels(texts.size());
      for (size_t i = 0; i < texts.size(); ++i) {
          auto const stat = atomic_orbital::parse(labels[i], texts[i].c_str(), echo);
          if (stat) return stat;
      } // i
      return initialize(labels, strict, echo);
  } // initialize

  status_t BasisPadder::pad_basis(coefficient_map::coefficient_map_t & padded, double const flat[], size_t const n_flat, int const echo) const {
      if (_species.empty()) {
          warn("padder is not initialized, %ld coefficients", long(n_flat));
          return STATUS_CONFIG_ERROR | 1;
      } // not initialized
      if (n_flat != _n_labels) {
          warn("expected %ld coefficients in label order, found %ld", long(_n_labels), long(n_flat));
          return STATUS_SHAPE_ERROR | 1;
      } // size mismatch
      padded.clear();
      for (auto const & ss : _species) {
          auto const & s = ss.second;
          int const width = s.max_n*(s.max_l + 1)*(s.max_l + 1);
          auto & out = padded[ss.first];
          out = coefficient_map::species_array_t(s.atoms.size(), width);
          for (size_t row = 0; row < s.atoms.size(); ++row) {
              size_t k{0};
              for (int slot = 0; slot < width; ++slot) {
                  if (s.populated[row][slot]) out(row, slot) = flat[s.source[row][k++]];
              } // slot
          } // row
      } // ss
      if (echo > 5) std::printf("# %s: %ld coefficients padded into %ld species\n", __func__, long(n_flat), padded.size());
      return 0;
  } // pad_basis

  status_t BasisPadder::unpad_basis(std::vector<double> & flat, coefficient_map::coefficient_map_t const & padded, int const echo) const {
      if (_species.empty()) {
          warn("padder is not initialized, %ld species given", long(padded.size()));
          return STATUS_CONFIG_ERROR | 1;
      } // not initialized
      status_t stat(0);
      for (auto const & sp : padded) {
          if (0 == _species.count(sp.first)) {
              warn("padded coefficients contain unknown species \"%s\"", sp.first.c_str());
              ++stat;
          } // unknown
      } // sp
      for (auto const & ss : _species) {
          auto const & s = ss.second;
          auto const it = padded.find(ss.first);
          size_t const width = s.max_n*(s.max_l + 1)*(s.max_l + 1);
          if (padded.end() == it) {
              warn("padded coefficients have no entry for species \"%s\"", ss.first.c_str());
              ++stat;
          } else if (it->second.rows() != s.atoms.size() || it->second.cols() != width) {
              warn("padded coefficients of species \"%s\" have shape [%ld, %ld], expected [%ld, %ld]", ss.first.c_str(),
                    long(it->second.rows()), long(it->second.cols()), long(s.atoms.size()), long(width));
              ++stat;
          } // shape
      } // ss
      if (stat) return STATUS_SHAPE_ERROR | stat;

      flat.assign(_n_labels, 0.0);
      for (auto const & ss : _species) {
          auto const & s = ss.second;
          auto const & in = padded.at(ss.first);
          for (size_t row = 0; row < s.atoms.size(); ++row) {
              size_t k{0};
              for (size_t slot = 0; slot < in.cols(); ++slot) {
                  if (s.populated[row][slot]) flat[s.source[row][k++]] = in(row, slot);
              } // slot
          } // row
      } // ss
      return 0;
  } // unpad_basis

  status_t BasisPadder::validate(basis_parser::basis_map_t const & basis, int const echo) const {
      status_t stat(0);
      for (auto const & ss : _species) {
          auto const & s = ss.second;
          auto const it = basis.find(ss.first);
          if (basis.end() == it) {
              warn("no basis for species \"%s\"", ss.first.c_str());
              stat |= STATUS_CONFIG_ERROR | 1;
              continue;
          } // no basis
          for (size_t row = 0; row < s.atoms.size(); ++row) {
              std::map<int,int> radials_per_ell;
              for (auto const & shell : it->second) {
                  for (size_t k = 0; k < shell.radial.size(); ++k) {
                      int const enn = shell.ell + 1 + radials_per_ell[shell.ell]++;
                      bool const found = (enn <= s.max_n && shell.ell <= s.max_l) &&
                                          s.populated[row][slot_offset(enn, shell.ell, s.max_l)];
                      if (!found) {
                          warn("labels of atom #%i lack the %d%c shell of species \"%s\"",
                                s.atoms[row], enn, ell2letter(shell.ell), ss.first.c_str());
                          stat |= STATUS_SHAPE_ERROR | 1;
                      } // not found
                  } // k
              } // shell
          } // row
      } // ss
      if (echo > 3) std::printf("# %s: status= %i\n", __func__, int(stat));
      return stat;
  } // validate

  std::map<std::string, shape_t> BasisPadder::basis_shape() const {
      std::map<std::string, shape_t> shape;
      for (auto const & ss : _species) {
          shape[ss.first].n = ss.second.max_n;
          shape[ss.first].l = ss.second.max_l + 1;
      } // ss
      return shape;
  } // basis_shape

  status_t concatenate(
        coefficient_map::coefficient_map_t & combined
      , partition_t & partition
      , coefficient_map::coefficient_map_t const & padded
      , int const echo
  ) {
      if (padded.empty()) {
          warn("nothing to concatenate, %ld species", long(padded.size()));
          return STATUS_SHAPE_ERROR | 1;
      } // empty
      size_t const width = padded.begin()->second.cols();
      size_t total{0};
      partition.clear();
      for (auto const & sp : padded) {
          if (sp.second.cols() != width) {
              warn("species \"%s\" has %ld features, \"%s\" has %ld", sp.first.c_str(), long(sp.second.cols()),
                    padded.begin()->first.c_str(), long(width));
              return STATUS_SHAPE_ERROR | 1;
          } // width differs
          partition.push_back(std::make_pair(sp.first, sp.second.rows()));
          total += sp.second.rows();
      } // sp
      coefficient_map::species_array_t all(total, width);
      size_t offset{0};
      for (auto const & sp : padded) {
          for (size_t row = 0; row < sp.second.rows(); ++row) {
              set(all[offset + row], width, sp.second[row]);
          } // row
          offset += sp.second.rows();
      } // sp
      combined.clear();
      combined[agnostic_key] = all;
      if (echo > 3) std::printf("# %s: %ld species into [%ld, %ld]\n", __func__, partition.size(), long(total), long(width));
      return 0;
  } // concatenate

  status_t split(
        coefficient_map::coefficient_map_t & padded
      , coefficient_map::coefficient_map_t const & combined
      , partition_t const & partition
      , int const echo
  ) {
      auto const it = combined.find(agnostic_key);
      if (combined.end() == it || 1 != combined.size()) {
          warn("expected a single entry \"%s\", found %ld entries", agnostic_key, long(combined.size()));
          return STATUS_SHAPE_ERROR | 1;
      } // no "X"
      auto const & all = it->second;
      size_t total{0};
      for (auto const & part : partition) { total += part.second; }
      if (total != all.rows()) {
          warn("partition covers %ld rows, \"%s\" has %ld", long(total), agnostic_key, long(all.rows()));
          return STATUS_SHAPE_ERROR | 1;
      } // mismatch
      padded.clear();
      size_t offset{0};
      for (auto const & part : partition) {
          auto & out = padded[part.first];
          out = coefficient_map::species_array_t(part.second, all.cols());
          for (size_t row = 0; row < part.second; ++row) {
              set(out[row], all.cols(), all[offset + row]);
          } // row
          offset += part.second;
      } // part
      return 0;
  } // split

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  basis_parser::basis_map_t test_basis() {
      basis_parser::basis_map_t basis;
      basis["O"].push_back(basis_parser::make_shell(0, {{1.0}, {0.3}}, {{1.0}, {1.0}}, {{2.0}, {3.0}}));
      basis["O"].push_back(basis_parser::make_shell(1, {{0.8}}, {{1.0}}, {{2.5}}));
      basis["O"].push_back(basis_parser::make_shell(2, {{0.6}}, {{1.0}}, {{2.5}}));
      basis["H"].push_back(basis_parser::make_shell(0, {{0.9}}, {{1.0}}, {{1.8}}));
      basis["H"].push_back(basis_parser::make_shell(1, {{0.7}}, {{1.0}}, {{1.8}}));
      return basis;
  } // test_basis

  status_t test_round_trip(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      auto const basis = test_basis();
      std::vector<atomic_orbital::ao_label_t> labels;
      stat += atomic_orbital::make_labels(labels, basis, {"O", "H", "O"}, echo);
      BasisPadder padder;
      stat += padder.initialize(labels, false, echo);
      stat += padder.validate(basis, echo);
      if (stat) return stat;
      std::vector<double> flat(labels.size());
      for (size_t i = 0; i < flat.size(); ++i) { flat[i] = 1 + i*0.1; }
      coefficient_map::coefficient_map_t padded;
      stat += padder.pad_basis(padded, flat, echo);
      coefficient_map::show(padded, "padded", echo);
      // O: n up to 3 and ell up to 2, H: n up to 2 and ell up to 1
      stat += (2 != padded["O"].rows()) + (27 != padded["O"].cols());
      stat += (1 != padded["H"].rows()) + ( 8 != padded["H"].cols());
      auto const shape = padder.basis_shape();
      stat += (3 != shape.at("O").n) + (3 != shape.at("O").l) + (27 != shape.at("O").width());
      stat += (2 != shape.at("H").n) + (2 != shape.at("H").l);
      if (stat) return stat;
      // label "0 O 2px" is at position 2, its slot is n=2, ell=1, m=0
      stat += (flat[2] != padded["O"](0, 9 + 1));
      for (size_t row = 0; row < 2; ++row) {
          int nonzero{0};
          for (size_t slot = 0; slot < 27; ++slot) { nonzero += (0.0 != padded["O"](row, slot)); }
          stat += (2 + 3 + 5 != nonzero); // unpopulated slots are exactly zero
      } // row
      std::vector<double> back;
      stat += padder.unpad_basis(back, padded, echo);
      stat += (back.size() != flat.size());
      for (size_t i = 0; i < flat.size() && i < back.size(); ++i) {
          stat += (back[i] != flat[i]); // bit for bit
      } // i
      if (echo > 3) std::printf("# %s: %ld labels, status= %i\n", __func__, long(labels.size()), int(stat));

      // the same from label strings
      BasisPadder from_text;
      stat += from_text.initialize(atomic_orbital::format(labels), false, echo);
      coefficient_map::coefficient_map_t padded2;
      stat += from_text.pad_basis(padded2, flat, echo);
      stat += !coefficient_map::identical(padded, padded2);
      return stat;
  } // test_round_trip

  status_t test_errors(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      BasisPadder padder;
      coefficient_map::coefficient_map_t padded;
      std::vector<double> flat(3, 1.0);
      stat += !is_config_error(padder.pad_basis(padded, flat, echo)); // not initialized
      stat += !is_shape_error(padder.initialize(std::vector<std::string>{"0 O 2px", "0 O 2py", "0 O 1s", "0 O 2pz"}, false, echo));
      stat += !is_shape_error(padder.initialize(std::vector<std::string>{"0 O 1s", "0 H 2s"}, false, echo));
      stat += !is_config_error(padder.initialize(std::vector<std::string>{"0 O 1s", "0 O"}, false, echo));

      stat += padder.initialize(std::vector<std::string>{"0 O 1s", "1 O 1s", "1 O 2s"}, false, echo);
      stat += !is_shape_error(padder.pad_basis(padded, flat.data(), 2, echo));
      stat += padder.pad_basis(padded, flat, echo);
      stat += (0.0 != padded["O"](0, 1)); // atom 0 has no 2s shell
      std::vector<double> back;
      padded["O"] = coefficient_map::species_array_t(2, 3);
      stat += !is_shape_error(padder.unpad_basis(back, padded, echo));
      padded["O"] = coefficient_map::species_array_t(2, 2);
      padded["X"] = coefficient_map::species_array_t(2, 2);
      stat += !is_shape_error(padder.unpad_basis(back, padded, echo)); // unknown species
      return stat;
  } // test_errors

  status_t test_strict(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      std::vector<std::string> const gap = {"0 O 1s", "0 O 2s", "0 O 2px", "0 O 2py", "0 O 2pz", "1 O 1s"};
      BasisPadder sparse, strict;
      stat += sparse.initialize(gap, false, echo);
      stat += !is_shape_error(strict.initialize(gap, true, echo)); // atom 1 lacks 2s and 2p
      std::vector<std::string> const complete = {"0 H 1s", "1 H 1s"};
      stat += strict.initialize(complete, true, echo);
      stat += !strict.strict();

      // labels lacking a shell of the basis
      auto const basis = test_basis();
      std::vector<atomic_orbital::ao_label_t> labels;
      stat += atomic_orbital::make_labels(labels, basis, {"O"}, echo);
      labels.resize(labels.size() - 5); // drop the d-shell
      BasisPadder short_labels;
      stat += short_labels.initialize(labels, false, echo);
      stat += !is_shape_error(short_labels.validate(basis, echo));
      return stat;
  } // test_strict

  status_t test_agnostic(int const echo=0) {
      if (echo > 2) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      auto basis = test_basis();
      basis["N"] = basis["O"];
      std::vector<atomic_orbital::ao_label_t> labels;
      stat += atomic_orbital::make_labels(labels, basis, {"O", "N", "O", "N", "N"}, echo);
      BasisPadder padder;
      stat += padder.initialize(labels, false, echo);
      std::vector<double> flat(labels.size());
      for (size_t i = 0; i < flat.size(); ++i) { flat[i] = std::sin(1.0 + i); }
      coefficient_map::coefficient_map_t padded, combined, separated;
      stat += padder.pad_basis(padded, flat, echo);
      partition_t partition;
      stat += concatenate(combined, partition, padded, echo);
      stat += (1 != combined.size()) + (5 != combined[agnostic_key].rows());
      stat += (2 != partition.size());
      stat += split(separated, combined, partition, echo);
      stat += !coefficient_map::identical(padded, separated);

      partition_t wrong(1, std::make_pair(std::string("N"), size_t(2)));
      stat += !is_shape_error(split(separated, combined, wrong, echo));
      padded["H"] = coefficient_map::species_array_t(1, 8); // different width
      stat += !is_shape_error(concatenate(combined, partition, padded, echo));
      return stat;
  } // test_agnostic

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_round_trip(echo);
      stat += test_errors(echo);
      stat += test_strict(echo);
      stat += test_agnostic(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace basis_padder
