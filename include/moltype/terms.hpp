// Copyright Global Phasing Ltd.
//
// Bonded terms (angles, dihedrals, impropers, 1-4 pairs) generated
// from the bond graph.

#ifndef MOLTYPE_TERMS_HPP_
#define MOLTYPE_TERMS_HPP_

#include <vector>
#include "structure.hpp"

namespace moltype {

struct TermOptions {
  bool angles = true;
  bool dihedrals = true;
  bool impropers = false;
  bool pairs = true;  // 1-4 pair for each generated dihedral
  // Which table a dihedral goes to; both flags may be set.
  bool proper_dihedrals = true;
  bool rb_torsions = false;
};

struct BondedTerms {
  std::vector<Angle> angles;
  std::vector<Dihedral> dihedrals;
  std::vector<Dihedral> rb_torsions;
  std::vector<Improper> impropers;
  std::vector<Pair> pairs;
};

/// Angles a-n-b for each unordered pair of neighbors of n.
/// Dihedrals a-n1-n2-b for each bond n1-n2 (n1 < n2) where a is a neighbor
/// of n1 other than n2, b is a neighbor of n2 other than n1 and a != b.
/// Impropers n-a-b-c for each unordered triple of neighbors of n.
/// Atoms are visited in index order, neighbors in the order of bonds.
BondedTerms generate_terms(const BondGraph& graph,
                           const TermOptions& options=TermOptions());

/// Appends terms to angles, dihedrals, rb_torsions, impropers and adjusts.
void add_terms_to_structure(BondedTerms&& terms, Structure& st);

} // namespace moltype
#endif
