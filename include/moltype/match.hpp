// Copyright Global Phasing Ltd.
//
// Structural matching of a rule's pattern against an atom and its
// bonded neighborhood.

#ifndef MOLTYPE_MATCH_HPP_
#define MOLTYPE_MATCH_HPP_

#include <vector>
#include "rule.hpp"
#include "structure.hpp"  // for Atom

namespace moltype {

/// Checks if the pattern starting at pattern atom pa matches atoms[idx].
/// The neighbors of each atom (Atom::neighbors) must be set up.
/// Each continuation of pa (branches, then the next chain atom) must be
/// matched by a different bonded neighbor. All bonded neighbors are
/// candidates, including the one through which atoms[idx] was reached.
/// Throws UnsupportedFeature for ring-size and $(...) primitives.
bool match_pattern_atom(const PatternAtom& pa, const std::vector<Atom>& atoms,
                        size_t idx);

inline bool matches(const Rule& rule, const std::vector<Atom>& atoms,
                    size_t idx) {
  return rule.pattern->root && match_pattern_atom(*rule.pattern->root, atoms, idx);
}

} // namespace moltype
#endif
