#pragma once
// This file is part of bproj under MIT License

#include <cstdio> // std::printf, ::snprintf
#include <vector> // std::vector<T>
#include <string> // std::string
#include <fstream> // std::ifstream
#include <sstream> // std::ostringstream

#include "rapidjson/document.h" // rapidjson::Document
#include "rapidjson/error/en.h" // rapidjson::GetParseError_En

#include "status.hxx" // status_t, STATUS_TEST_NOT_INCLUDED, STATUS_IO_ERROR
#include "recorded_warnings.hxx" // warn

namespace json_reading {

  template <class C>
  std::vector<double> read_json_array(C const & object, char const *const name="?", int const echo=0) {
      std::vector<double> vector(0);
      if (object.IsArray()) {
          auto const array = object.GetArray();
          auto const array_size = array.Size();
          vector.resize(array_size);
          for (unsigned i = 0; i < array_size; ++i) {
              if (array[i].IsNumber()) {
                  vector[i] = array[i].GetDouble();
              } else {
                  warn("%s[%i] is not a number", name, i);
                  return std::vector<double>(0);
              }
              if (echo > 5) std::printf("# %s %s[%i] = %g\n", __func__, name, i, vector[i]);
          } // i
          if (echo > 2) std::printf("# %s %s has %ld entries\n", __func__, name, long(array_size));
      } else {
          if (echo > 0) std::printf("# %s object(\"%s\") is not an array!\n", __func__, name);
      }
      return vector;
  } // read_json_array

  template <class C>
  std::vector<std::vector<double>> read_json_matrix(C const & object, char const *const name="?", int const echo=0) {
      std::vector<std::vector<double>> matrix(0);
      if (object.IsArray()) {
          auto const array = object.GetArray();
          auto const array_size = array.Size();
          matrix.resize(array_size);
          char row_name[64];
          for (unsigned i = 0; i < array_size; ++i) {
              std::snprintf(row_name, 64, "%s[%i]", name, i);
              matrix[i] = read_json_array(array[i], row_name, echo/2);
              if (echo > 5) std::printf("# %s %s has %ld entries\n", __func__, row_name, long(matrix[i].size()));
          } // i
          if (echo > 2) std::printf("# %s %s has %ld entries\n", __func__, name, long(array_size));
      } else {
          if (echo > 0) std::printf("# %s object(\"%s\") is not an array!\n", __func__, name);
      }
      return matrix;
  } // read_json_matrix

  inline status_t read_text_file(std::string & content, char const *const filename, int const echo=0) {
      std::ifstream const file_stream(filename); // taking file as inputstream
      if (file_stream) {
          if (echo > 7) std::printf("# %s: opening \"%s\"\n", __func__, filename);
      } else {
          warn("failed to open \"%s\"", filename);
          return STATUS_IO_ERROR;
      } // file_stream
      std::ostringstream ss;
      ss << file_stream.rdbuf(); // reading data
      content = ss.str();
      return 0;
  } // read_text_file

  inline status_t parse_document(rapidjson::Document & doc, std::string const & text, char const *const name="?", int const echo=0) {
      if (doc.Parse(text.c_str()).HasParseError()) {
          warn("rapidjson.Parse failed for %s at offset %ld: %s", name,
                long(doc.GetErrorOffset()), rapidjson::GetParseError_En(doc.GetParseError()));
          return STATUS_IO_ERROR;
      } // Parse
      if (!doc.IsObject()) {
          warn("%s does not contain a JSON object", name);
          return STATUS_IO_ERROR;
      } // not an object
      if (echo > 5) std::printf("# %s: parsed %s with %d members\n", __func__, name, int(doc.MemberCount()));
      return 0;
  } // parse_document

#ifdef  NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  inline status_t test_json_arrays(int const echo=0) {
      status_t stat(0);
      rapidjson::Document doc;
      stat += parse_document(doc, "{\"alpha\": [[1.5, 0.25], [3]], \"sigma\": 2.0, \"r\": [0, 1, 2]}", "inline", echo);
      if (stat) return stat;
      auto const r = read_json_array(doc["r"], "r", echo);
      stat += (3 != r.size());
      if (3 == r.size()) stat += (2.0 != r[2]);
      auto const alpha = read_json_matrix(doc["alpha"], "alpha", echo);
      stat += (2 != alpha.size());
      if (2 == alpha.size()) stat += (2 != alpha[0].size()) + (1 != alpha[1].size()) + (0.25 != alpha[0][1]);
      stat += !read_json_array(doc["sigma"], "sigma", echo).empty(); // not an array
      return stat;
  } // test_json_arrays

  inline status_t test_parse_errors(int const echo=0) {
      rapidjson::Document doc;
      status_t stat(0);
      stat += !is_io_error(parse_document(doc, "{\"unterminated\": [1, 2", "broken", echo));
      stat += !is_io_error(parse_document(doc, "[1, 2]", "array", echo));
      std::string content;
      stat += !is_io_error(read_text_file(content, "/non/existing/file.json", echo));
      return stat;
  } // test_parse_errors

  inline status_t all_tests(int const echo=0) {
      status_t stat(0);
      stat += test_json_arrays(echo);
      stat += test_parse_errors(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace json_reading
