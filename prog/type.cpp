// Copyright Global Phasing Ltd.

#include <stdio.h>
#include <cstdlib>  // for getenv, EXIT_SUCCESS, EXIT_FAILURE
#include <stdexcept>
#include <moltype/forcefield.hpp>
#include <moltype/util.hpp>  // for split_str, join_str

#define MOLTYPE_PROG type
#include "options.h"

namespace {

enum OptionIndex {
  Atoms=4, Bonds, Name, ForceFieldName, Lib, FfDir, Terms, Impropers, NoPairs, Rb
};

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] --atoms=LIST --bonds=LIST"
    "\nAssigns atom types to a molecule given as a list of elements and bonds."
    "\n\nOptions:" },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Atoms, 0, "a", "atoms", Arg::AtomList,
    "  -a, --atoms=LIST  \tComma-separated element symbols, e.g. C,O,H,H,H,H." },
  { Bonds, 0, "b", "bonds", Arg::BondList,
    "  -b, --bonds=LIST  \tBonds as pairs of 1-based atom numbers, e.g. 1-2,1-3." },
  { Name, 0, "", "name", Arg::Required,
    "  --name=NAME  \tName of the molecule (used in messages)." },
  { ForceFieldName, 0, "f", "ff", Arg::Required,
    "  -f, --ff=NAME  \tForce field name (default: oplsaa)." },
  { Lib, 0, "L", "lib", Arg::Required,
    "  -L FILE, --lib=FILE  \tAtom-type table to use instead of --ff." },
  { FfDir, 0, "", "ff-dir", Arg::Required,
    "  --ff-dir=DIR  \tDirectory with NAME.ff/ subdirectories"
    " (default: $MOLTYPE_FF_DIR)." },
  { NoOp, 0, "", "", Arg::None, "\nBonded terms:" },
  { Terms, 0, "t", "terms", Arg::None,
    "  -t, --terms  \tPrint angles, dihedrals and 1-4 pairs." },
  { Impropers, 0, "", "impropers", Arg::None,
    "  --impropers  \tGenerate also improper dihedrals." },
  { NoPairs, 0, "", "no-pairs", Arg::None,
    "  --no-pairs  \tDo not generate 1-4 pairs." },
  { Rb, 0, "", "rb", Arg::None,
    "  --rb  \tStore dihedrals as Ryckaert-Bellemans torsions." },
  { NoOp, 0, "", "", Arg::None,
    "\nExample (ethanol, atoms: C C O H H H H H H):"
    "\n " EXE_NAME " --atoms=C,C,O,H,H,H,H,H,H"
    " --bonds=1-2,2-3,1-4,1-5,1-6,2-7,2-8,3-9\n" },
  { 0, 0, 0, 0, 0, 0 }
};

template<typename T>
void print_terms(const char* label, const std::vector<T>& terms) {
  printf("%s: %zu\n", label, terms.size());
  for (const T& t : terms) {
    printf(" ");
    for (size_t idx : t.atoms)
      printf(" %zu", idx + 1);
    printf("\n");
  }
}

} // anonymous namespace

int MOLTYPE_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.check_exclusive_pair(ForceFieldName, Lib);
  if (!p.options[Atoms])
    p.print_try_help_and_exit("Option --atoms is required.");
  if (p.nonOptionsCount() != 0)
    p.print_try_help_and_exit("Unexpected arguments.");
  int verbose = p.options[Verbose].count();

  moltype::Structure st;
  if (p.options[Name])
    st.name = p.options[Name].arg;
  for (const std::string& sym : moltype::split_str(p.options[Atoms].arg, ','))
    st.add_atom(moltype::Element(sym),
                sym + std::to_string(st.atoms.size() + 1));
  if (p.options[Bonds])
    st.bonds = moltype::parse_bond_list(p.options[Bonds].arg);

  moltype::TermOptions term_options;
  term_options.impropers = p.options[Impropers];
  term_options.pairs = !p.options[NoPairs];
  if (p.options[Rb]) {
    term_options.rb_torsions = true;
    term_options.proper_dihedrals = false;
  }

  moltype::Logger logger{&moltype::Logger::to_stderr, 5 + verbose};
  try {
    std::string path;
    // empty if the table is given as a file
    std::string canonical;
    if (p.options[Lib]) {
      path = p.options[Lib].arg;
    } else {
      const char* ff_name = p.options[ForceFieldName] ? p.options[ForceFieldName].arg
                                                      : "oplsaa";
      const char* ff_dir = p.options[FfDir] ? p.options[FfDir].arg
                                            : std::getenv("MOLTYPE_FF_DIR");
      canonical = moltype::canonical_forcefield_name(ff_name);
      path = moltype::locate_forcefield(ff_name,
                                        moltype::default_forcefield_aliases(),
                                        ff_dir ? ff_dir : "");
    }
    if (verbose)
      fprintf(stderr, "Reading atom types from %s ...\n", path.c_str());
    moltype::ForceField ff = moltype::read_forcefield_file(path);
    if (!canonical.empty() && ff.name != canonical)
      logger.warn(path, " contains force field ", ff.name, ", not ", canonical);
    moltype::ApplyResult result = moltype::apply_forcefield(st, ff, term_options,
                                                            logger);
    if (verbose)
      fprintf(stderr, "Typing finished after %d passes, %d matches.\n",
              result.stats.passes, result.stats.matches);
    for (const moltype::Atom& atom : st.atoms) {
      auto str = [](const std::string& s) { return s; };
      printf("%3zu %-4s %-12s whitelist: %s", atom.idx + 1, atom.name.c_str(),
             atom.type.empty() ? "?" : atom.type.c_str(),
             moltype::join_str(atom.whitelist, ' ', str).c_str());
      if (!atom.blacklist.empty())
        printf("  blacklist: %s",
               moltype::join_str(atom.blacklist, ' ', str).c_str());
      printf("\n");
    }
    if (p.options[Terms]) {
      print_terms("angles", st.angles);
      print_terms("dihedrals", st.dihedrals);
      print_terms("rb_torsions", st.rb_torsions);
      print_terms("impropers", st.impropers);
      print_terms("pairs", st.adjusts);
    }
  } catch (std::runtime_error& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
