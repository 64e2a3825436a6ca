// This file is part of bproj under MIT License

#include <cstdint> // uint64_t, uint32_t
#include <string> // std::string
#include <cstdio> // std::printf, ::snprintf
#include <cassert> // assert
#include <map> // std::map<K,V>
#include <vector> // std::vector<T>
#include <utility> // std::pair<T1, T2>, ::make_pair

#include "recorded_warnings.hxx" // MaxMessageLength

namespace recorded_warnings {

  // djb2 string hash
  inline uint64_t simple_string_hash(char const *string) {
      uint64_t hash{5381};
      for (char const *c = string; *c != '\0'; ++c) {
          hash = hash*33 + uint64_t(*c);
      } // c
      return hash;
  } // simple_string_hash

  inline uint64_t combined_hash(char const *file, int const line) {
      int constexpr LineBits = 14; // source lines are stored in the lowest 14 bits
      return (simple_string_hash(file) << LineBits) | (uint64_t(line) & ((1ul << LineBits) - 1));
  } // combined_hash

  class WarningRecord {
  private:
      std::vector<char> message_;
      std::string source_file_;
      std::string function_;
      uint64_t times_launched_;
      uint32_t times_printed_;
      uint32_t source_line_;
  public:

      WarningRecord(char const *file, int const line, char const *func)
        : message_(MaxMessageLength, '\0')
        , source_file_(file)
        , function_(func ? func : "")
        , times_launched_(0)
        , times_printed_(0)
        , source_line_(line)
      {} // constructor

      char* launch() { ++times_launched_; return message_.data(); }
      char const* message() const { return message_.data(); }
      char const* source_file() const { return source_file_.c_str(); }
      char const* function() const { return function_.c_str(); }
      int  source_line() const { return source_line_; }
      uint64_t times_launched() const { return times_launched_; }
      uint32_t times_printed() const { return times_printed_; }
      void increment_times_printed() { ++times_printed_; }

  }; // class WarningRecord

  typedef std::map<uint64_t, WarningRecord> record_map_t;

  record_map_t & _records() {
      static record_map_t map_; // all warnings of this process
      return map_;
  } // _records

  std::pair<char*,int> _new_warning(char const *file, int const line, char const *func) {
      assert(line > 0 && "line numbers created by the preprocessor start from 1");
      auto & map_ = _records();
      auto const short_file = after_last_slash(file);
      auto const hash = combined_hash(short_file, line);

      auto it = map_.find(hash);
      if (map_.end() == it) {
          it = map_.insert(std::make_pair(hash, WarningRecord(short_file, line, func))).first;
      } // new source location
      auto & w = it->second;

      int constexpr MaxWarningsToErr = 1; // repeat each warning at most once in stderr
      int constexpr MaxWarningsToLog = 3; // and at most 3 times in stdout
      int flags{0};
      int const printed = w.times_printed();
      if (printed < MaxWarningsToLog) {
          flags |= 0x1;
          if (MaxWarningsToLog - 1 == printed) flags |= 0x4;
      } // stdout
      if (printed < MaxWarningsToErr) flags |= 0x2;
      if (flags) w.increment_times_printed();

      return std::make_pair(w.launch(), flags);
  } // _new_warning

  status_t show_warnings(int const echo) {
      auto const & map_ = _records();
      auto const nw = map_.size();
      if (echo < 1) return 0;
      if (echo < 3 || nw < 1) {
          std::printf("# %ld warnings have been recorded.\n", long(nw));
          return 0;
      } // summary only
      std::printf("\n#\n# recorded %ld different warnings:\n", long(nw));
      uint64_t total{0};
      for (auto const & hw : map_) {
          auto const & w = hw.second;
          std::printf("# \tin %s:%d %s (%ld times)\n# \t\t%s\n", w.source_file(), w.source_line(),
                        w.function(), long(w.times_launched()), w.message());
          total += w.times_launched();
      } // hw
      std::printf("# %ld warnings in total\n", long(total));
      return 0;
  } // show_warnings

  status_t clear_warnings(int const echo) {
      auto & map_ = _records();
      if (echo > 1) std::printf("# clear all %ld warnings from records\n", long(map_.size()));
      map_.clear();
      return 0;
  } // clear_warnings

  size_t number_of_warnings() { return _records().size(); }

#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_hash_separates_lines(int const echo=0) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      return (combined_hash("basis_padder.cxx", 41) == combined_hash("basis_padder.cxx", 42));
  } // test_hash_separates_lines

  status_t test_preprocessor_macro(int const echo=0) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      auto const n_before = number_of_warnings();
      auto const nchars = warn("This is a test warning from %s:%d", __FILE__, __LINE__);
      status_t stat(0);
      stat += (nchars < 30); // the first launch must be printed
      stat += (number_of_warnings() != n_before + 1);
      return stat;
  } // test_preprocessor_macro

  status_t test_muting(int const echo=0) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      int nchars{0};
      for (int i = 0; i < 9; ++i) {
          nchars = warn("This is a test warning from inside a loop, iteration #%d", i);
      } // i
      return nchars; // 0 if the warning was muted before the 9th iteration
  } // test_muting

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_hash_separates_lines(echo);
      stat += test_preprocessor_macro(echo);
      stat += test_muting(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace recorded_warnings
