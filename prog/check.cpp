// Copyright Global Phasing Ltd.

#include <stdio.h>
#include <cstdlib>  // for EXIT_SUCCESS, EXIT_FAILURE
#include <stdexcept>
#include <moltype/forcefield.hpp>  // for read_forcefield_file
#include <moltype/pattern.hpp>     // for check_pattern_syntax

#define MOLTYPE_PROG check
#include "options.h"

namespace {

enum OptionIndex { Quiet=4 };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] FILE[...]"
    "\nReads atom-type tables and checks the definitions of atom types." },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Quiet, 0, "q", "quiet", Arg::None, "  -q, --quiet  \tShow only errors." },
  { 0, 0, 0, 0, 0, 0 }
};

bool check_file(const char* path, bool quiet, bool verbose) {
  moltype::ForceField ff;
  try {
    ff = moltype::read_forcefield_file(path);
  } catch (std::runtime_error& e) {
    printf("%s\n", e.what());
    return false;
  }
  bool ok = true;
  int n_defs = 0;
  for (const moltype::AtomTypeDef& def : ff.registry.types()) {
    if (!def.definition.empty()) {
      ++n_defs;
      std::string msg;
      if (!moltype::check_pattern_syntax(def.definition, &msg)) {
        printf("%s: %s %s\n  %s\n", path, def.name.c_str(), msg.c_str(),
               def.definition.c_str());
        ok = false;
      }
    }
    if (!quiet)
      for (const std::string& other : def.overrides)
        if (!ff.registry.find(other))
          printf("%s: %s overrides unknown type %s\n",
                 path, def.name.c_str(), other.c_str());
  }
  if (verbose)
    printf("%s: %s with %zu atom types, %d definitions%s\n",
           path, ff.name.c_str(), ff.registry.size(), n_defs,
           ok ? "" : " (with errors)");
  return ok;
}

} // anonymous namespace

int MOLTYPE_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.require_input_files_as_args();
  bool quiet = p.options[Quiet];
  bool verbose = p.options[Verbose];
  bool total_ok = true;
  for (int i = 0; i < p.nonOptionsCount(); ++i)
    total_ok = check_file(p.nonOption(i), quiet, verbose) && total_ok;
  return total_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
