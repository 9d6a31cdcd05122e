// Copyright Global Phasing Ltd.

#include <moltype/match.hpp>
#include <string>            // for to_string
#include <moltype/fail.hpp>  // for UnsupportedFeature

namespace moltype {

bool AndExpr::match(const Atom& a) const {
  return left->match(a) && right->match(a);
}

bool OrExpr::match(const Atom& a) const {
  return left->match(a) || right->match(a);
}

bool AtomicNumberExpr::match(const Atom& a) const {
  return a.atomic_number() == number;
}

bool ElementExpr::match(const Atom& a) const {
  return a.element.elem == elem;
}

bool LabelExpr::match(const Atom& a) const {
  return a.whitelist.count(label) != 0;
}

bool DegreeExpr::match(const Atom& a) const {
  return a.degree() == (size_t) degree;
}

bool RingSizeExpr::match(const Atom&) const {
  throw UnsupportedFeature("ring size primitive (R" + std::to_string(ring_size)
                           + ") is not supported in matching");
}

bool SubPatternExpr::match(const Atom&) const {
  throw UnsupportedFeature("recursive pattern " + str()
                           + " is not supported in matching");
}

namespace {

// Depth-first search for an injective assignment of bonded neighbors
// to continuations. Candidates are tried in the order of neighbors,
// so the first assignment found is the lexicographically smallest one.
bool assign_neighbors(const std::vector<const PatternAtom*>& conts, size_t k,
                      const std::vector<Atom>& atoms,
                      const std::vector<size_t>& neighbors,
                      std::vector<bool>& used) {
  if (k == conts.size())
    return true;
  for (size_t i = 0; i != neighbors.size(); ++i) {
    if (used[i] || !match_pattern_atom(*conts[k], atoms, neighbors[i]))
      continue;
    used[i] = true;
    if (assign_neighbors(conts, k + 1, atoms, neighbors, used))
      return true;
    used[i] = false;
  }
  return false;
}

} // anonymous namespace

bool match_pattern_atom(const PatternAtom& pa, const std::vector<Atom>& atoms,
                        size_t idx) {
  const Atom& atom = atoms.at(idx);
  if (!pa.expr->match(atom))
    return false;
  std::vector<const PatternAtom*> conts = pa.continuations();
  if (conts.empty())
    return true;
  if (atom.neighbors.size() < conts.size())
    return false;
  std::vector<bool> used(atom.neighbors.size(), false);
  return assign_neighbors(conts, 0, atoms, atom.neighbors, used);
}

} // namespace moltype
