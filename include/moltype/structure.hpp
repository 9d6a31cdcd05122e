// Copyright Global Phasing Ltd.
//
// Structure - atoms, bonds and the bonded terms derived from them.
// BondGraph - adjacency lists built from the bonds.

#ifndef MOLTYPE_STRUCTURE_HPP_
#define MOLTYPE_STRUCTURE_HPP_

#include <array>
#include <set>
#include <string>
#include <vector>
#include "elem.hpp"  // for Element

namespace moltype {

struct Atom {
  size_t idx = 0;               // position in Structure::atoms
  std::string name;
  std::string residue;
  Element element = El::X;
  std::vector<size_t> neighbors;  // indices of bonded atoms, set by setup_neighbors()
  // written by find_atomtypes()
  std::set<std::string> whitelist;
  std::set<std::string> blacklist;
  // final atom type, empty if not resolved
  std::string type;

  int atomic_number() const { return element.atomic_number(); }
  size_t degree() const { return neighbors.size(); }
};

struct Bond {
  std::array<size_t, 2> atoms;
};

struct Angle {
  std::array<size_t, 3> atoms;  // the middle atom is the vertex
};

struct Dihedral {
  std::array<size_t, 4> atoms;  // atoms[1]-atoms[2] is the central bond
};

struct Improper {
  std::array<size_t, 4> atoms;  // atoms[0] is the central atom
};

// 1-4 pair that gets nonbonded exception (scaled) parameters
struct Pair {
  std::array<size_t, 2> atoms;
};

struct Structure {
  std::string name;
  std::vector<Atom> atoms;
  std::vector<Bond> bonds;

  // bonded terms, appended by apply_forcefield()
  std::vector<Angle> angles;
  std::vector<Dihedral> dihedrals;
  std::vector<Dihedral> rb_torsions;
  std::vector<Improper> impropers;
  std::vector<Pair> adjusts;

  Atom& add_atom(Element el, const std::string& atom_name=std::string()) {
    atoms.emplace_back();
    Atom& atom = atoms.back();
    atom.idx = atoms.size() - 1;
    atom.element = el;
    atom.name = atom_name;
    return atom;
  }
  void add_bond(size_t a, size_t b) { bonds.push_back(Bond{{{a, b}}}); }
};

struct BondGraph {
  // neighbors[i] lists atoms bonded to atom i, in the order of bonds
  std::vector<std::vector<size_t>> neighbors;

  BondGraph() = default;
  // Duplicated bonds are ignored. Bonds to an atom index >= n_atoms
  // and bonds of an atom to itself are errors.
  BondGraph(size_t n_atoms, const std::vector<Bond>& bonds);
  explicit BondGraph(const Structure& st) : BondGraph(st.atoms.size(), st.bonds) {}

  size_t size() const { return neighbors.size(); }
  size_t degree(size_t n) const { return neighbors[n].size(); }
  bool are_bonded(size_t a, size_t b) const;
};

/// Sets Atom::idx and Atom::neighbors from Structure::bonds.
void setup_neighbors(Structure& st);

/// Reads bonds written as 1-based atom numbers: "1-2,2-3" -> {0,1}, {1,2}.
/// Throws std::runtime_error on syntax error or on atom number 0.
std::vector<Bond> parse_bond_list(const std::string& list);

} // namespace moltype
#endif
