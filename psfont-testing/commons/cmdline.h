// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// Command line handling shared by psfont samples.
//
// Options are accepted as `--key=value` or `--key value`, flags as `--key`. Arguments that don't start with `--`
// and are not consumed as a value are positional.

#ifndef PSFONT_TESTING_CMDLINE_H_INCLUDED
#define PSFONT_TESTING_CMDLINE_H_INCLUDED

#include <stdlib.h>
#include <string.h>

class CmdLine {
public:
  int _argc;
  const char* const* _argv;
  // Null terminated list of options that never consume the following argument.
  const char* const* _flags;

  CmdLine(int argc, const char* const* argv, const char* const* flags = nullptr)
    : _argc(argc),
      _argv(argv),
      _flags(flags) {}

  static bool is_option(const char* arg) { return arg[0] == '-' && arg[1] == '-'; }

  // Returns the value of `key` if `arg` is `key=value`, nullptr otherwise.
  static const char* match_inline_value(const char* arg, const char* key, size_t key_size) {
    if (strncmp(arg, key, key_size) != 0 || arg[key_size] != '=')
      return nullptr;
    return arg + key_size + 1;
  }

  bool has_arg(const char* key) const {
    for (int i = 1; i < _argc; i++) {
      if (strcmp(_argv[i], key) == 0)
        return true;
    }
    return false;
  }

  const char* value_of(const char* key, const char* default_value) const {
    size_t key_size = strlen(key);

    for (int i = 1; i < _argc; i++) {
      const char* arg = _argv[i];

      if (const char* value = match_inline_value(arg, key, key_size))
        return value;

      if (strcmp(arg, key) == 0 && i + 1 < _argc && !is_option(_argv[i + 1]))
        return _argv[i + 1];
    }

    return default_value;
  }

  // Parses a decimal value of `key` in [min_value, max_value], returns `default_value` if it's missing or invalid.
  unsigned value_as_uint(const char* key, unsigned default_value, unsigned min_value, unsigned max_value) const {
    const char* str = value_of(key, nullptr);
    if (!str || !str[0])
      return default_value;

    char* end = nullptr;
    unsigned long v = strtoul(str, &end, 10);

    if (*end != '\0' || v < min_value || v > max_value)
      return default_value;

    return unsigned(v);
  }

  // Returns the positional argument at `index`, skipping options and their values.
  const char* positional(int index) const {
    for (int i = 1; i < _argc; i++) {
      const char* arg = _argv[i];

      if (is_option(arg)) {
        if (!strchr(arg, '=') && i + 1 < _argc && !is_option(_argv[i + 1]) && takes_value(arg))
          i++;
        continue;
      }

      if (index-- == 0)
        return arg;
    }

    return nullptr;
  }

  bool takes_value(const char* arg) const {
    if (!_flags)
      return true;

    for (const char* const* flag = _flags; *flag; flag++) {
      if (strcmp(*flag, arg) == 0)
        return false;
    }
    return true;
  }
};

#endif // PSFONT_TESTING_CMDLINE_H_INCLUDED
