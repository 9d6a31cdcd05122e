// Copyright Global Phasing Ltd.
//
// Typing engine: applies rules to atoms until nothing changes,
// then resolves the final atom type of each atom.

#ifndef MOLTYPE_TYPING_HPP_
#define MOLTYPE_TYPING_HPP_

#include <set>
#include <string>
#include <vector>
#include "logger.hpp"
#include "rule.hpp"
#include "structure.hpp"  // for Atom

namespace moltype {

struct TypingStats {
  int passes = 0;   // including the last pass that found nothing
  int matches = 0;  // number of (atom, rule) matches recorded
};

/// Resets Atom::whitelist and Atom::blacklist and fills them in.
/// In each pass every rule that is neither in the whitelist nor in the
/// blacklist of an atom is tested against that atom. Matches found in
/// a pass are applied only when the pass ends, so all tests in a pass
/// see the same state. Stops after a pass without new matches.
/// Atom::neighbors must be set up (see setup_neighbors()).
/// UnsupportedFeature from the matcher is propagated.
TypingStats find_atomtypes(std::vector<Atom>& atoms, const std::vector<Rule>& rules,
                           const Logger& logger=Logger{});

struct AtomTypeSets {
  std::set<std::string> whitelist;
  std::set<std::string> blacklist;
};

/// Same as find_atomtypes(), but doesn't modify atoms.
std::vector<AtomTypeSets> compute_atomtypes(const std::vector<Atom>& atoms,
                                            const std::vector<Rule>& rules);

struct AtomTypeAssignment {
  std::string type;  // empty unless exactly one candidate
  std::vector<std::string> candidates;  // whitelist minus blacklist
  bool is_resolved() const { return candidates.size() == 1; }
  bool is_ambiguous() const { return candidates.size() > 1; }
};

/// Candidates for the type of each atom are rules from the whitelist
/// that are not in the blacklist. Atoms with no candidates or with
/// more than one are reported as notes and left without a type.
std::vector<AtomTypeAssignment> resolve_atomtypes(const std::vector<Atom>& atoms,
                                                  const Logger& logger=Logger{});

/// Fails on duplicated rule names. Overrides of rules that are not
/// in the list are reported as notes. Returns the number of such notes.
int check_rules(const std::vector<Rule>& rules, const Logger& logger=Logger{});

} // namespace moltype
#endif
