#pragma once
// This file is part of bproj under MIT License

  typedef int status_t; // 0:success, non-zero:failure

  int constexpr STATUS_TEST_NOT_INCLUDED = -1;

  // failure categories, combined with a count in the low bits
  int constexpr STATUS_CONFIG_ERROR = 0x100; // malformed or inconsistent basis declaration
  int constexpr STATUS_SHAPE_ERROR  = 0x200; // array shapes, lengths or label lists do not match
  int constexpr STATUS_IO_ERROR     = 0x400; // file could not be opened or parsed

  inline bool is_config_error(status_t const stat) { return 0 != (stat & STATUS_CONFIG_ERROR); }
  inline bool is_shape_error (status_t const stat) { return 0 != (stat & STATUS_SHAPE_ERROR); }
  inline bool is_io_error    (status_t const stat) { return 0 != (stat & STATUS_IO_ERROR); }
