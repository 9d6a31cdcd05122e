// Copyright Global Phasing Ltd.

// Thin, leaky wrapper around The Lean Mean C++ Option Parser.

#pragma once

#include <string>
#include <vector>
#include <optionparser.h>

#ifndef MOLTYPE_PROG
# error "define MOLTYPE_PROG before including options.h"
#endif

#define MOLTYPE_XSTRINGIZE(s) MOLTYPE_STRINGIZE(s)
#define MOLTYPE_STRINGIZE(s) #s
#define MOLTYPE_XCONCAT(a, b) MOLTYPE_CONCAT(a, b)
#define MOLTYPE_CONCAT(a, b) a##b
#define MOLTYPE_MAIN MOLTYPE_XCONCAT(MOLTYPE_PROG, _main)
#define EXE_NAME "moltype " MOLTYPE_XSTRINGIZE(MOLTYPE_PROG)

enum { NoOp=0, Help=1, Version=2, Verbose=3 };

extern const option::Descriptor CommonUsage[];

struct Arg: public option::Arg {
  static option::ArgStatus Required(const option::Option& option, bool msg);
  static option::ArgStatus AtomList(const option::Option& option, bool msg);
  static option::ArgStatus BondList(const option::Option& option, bool msg);
};

struct OptParser : option::Parser {
  const char* program_name;
  std::vector<option::Option> options;
  std::vector<option::Option> buffer;

  explicit OptParser(const char* prog) : program_name(prog) {}
  void simple_parse(int argc, char** argv, const option::Descriptor usage[]);
  void require_input_files_as_args(int other_args=0);
  [[noreturn]] void print_try_help_and_exit(const char* msg) const;
  [[noreturn]] void exit_exclusive(int opt1, int opt2) const;
  void check_exclusive_pair(int opt1, int opt2) {
    if (options[opt1] && options[opt2])
      exit_exclusive(opt1, opt2);
  }
  const char* given_name(int opt) const {  // sans one dash
    return options[opt].namelen > 1 ? options[opt].name + 1
                                    : options[opt].desc->shortopt;
  }
};

void print_version(const char* program_name, bool verbose=false);
