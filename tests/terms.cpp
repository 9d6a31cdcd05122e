#include "doctest.h"

#include <array>
#include <moltype/terms.hpp>
#include "molecules.h"

using moltype::BondGraph;
using moltype::BondedTerms;
using moltype::TermOptions;

template<size_t N>
static bool same(const std::array<size_t, N>& a, std::array<size_t, N> b) {
  return a == b;
}

TEST_CASE("generate_terms: ethane") {
  moltype::Structure st = make_ethane();
  BondedTerms terms = moltype::generate_terms(BondGraph(st));
  CHECK_EQ(terms.angles.size(), 12);
  CHECK_EQ(terms.dihedrals.size(), 9);
  CHECK(terms.rb_torsions.empty());
  CHECK(terms.impropers.empty());
  CHECK_EQ(terms.pairs.size(), 9);
  // atoms in index order, neighbors in bond order
  CHECK(same(terms.angles[0].atoms, {{1, 0, 2}}));
  CHECK(same(terms.angles[6].atoms, {{0, 1, 5}}));
  CHECK(same(terms.dihedrals[0].atoms, {{2, 0, 1, 5}}));
  CHECK(same(terms.dihedrals[8].atoms, {{4, 0, 1, 7}}));
  CHECK(same(terms.pairs[0].atoms, {{2, 5}}));
}

TEST_CASE("generate_terms: angle count per atom") {
  moltype::Structure st = make_ethanol();
  BondGraph graph(st);
  BondedTerms terms = moltype::generate_terms(graph);
  for (size_t n = 0; n != graph.size(); ++n) {
    size_t d = graph.degree(n);
    size_t count = 0;
    for (const moltype::Angle& angle : terms.angles)
      if (angle.atoms[1] == n)
        ++count;
    CHECK_EQ(count, d * (d - 1) / 2);
  }
}

TEST_CASE("generate_terms: dihedrals") {
  // chain of 4 atoms gives exactly one dihedral
  moltype::Structure chain = make_molecule({"C", "C", "C", "C"},
                                           {{0, 1}, {1, 2}, {2, 3}});
  BondedTerms terms = moltype::generate_terms(BondGraph(chain));
  REQUIRE_EQ(terms.dihedrals.size(), 1);
  CHECK(same(terms.dihedrals[0].atoms, {{0, 1, 2, 3}}));
  REQUIRE_EQ(terms.pairs.size(), 1);
  CHECK(same(terms.pairs[0].atoms, {{0, 3}}));
  CHECK_EQ(terms.angles.size(), 2);

  // in a 3-membered ring a-n1-n2-b would have a == b
  moltype::Structure ring = make_molecule({"C", "C", "C"},
                                          {{0, 1}, {1, 2}, {2, 0}});
  BondedTerms ring_terms = moltype::generate_terms(BondGraph(ring));
  CHECK(ring_terms.dihedrals.empty());
  CHECK(ring_terms.pairs.empty());
  CHECK_EQ(ring_terms.angles.size(), 3);

  // bonds to terminal atoms do not give dihedrals
  BondedTerms methane_terms = moltype::generate_terms(BondGraph(make_methane()));
  CHECK(methane_terms.dihedrals.empty());
  CHECK_EQ(methane_terms.angles.size(), 6);
}

TEST_CASE("generate_terms: options") {
  moltype::Structure st = make_ethane();
  BondGraph graph(st);
  TermOptions opt;
  opt.rb_torsions = true;
  opt.proper_dihedrals = false;
  BondedTerms rb = moltype::generate_terms(graph, opt);
  CHECK(rb.dihedrals.empty());
  CHECK_EQ(rb.rb_torsions.size(), 9);
  CHECK_EQ(rb.pairs.size(), 9);

  opt.proper_dihedrals = true;
  opt.pairs = false;
  BondedTerms both = moltype::generate_terms(graph, opt);
  CHECK_EQ(both.dihedrals.size(), 9);
  CHECK_EQ(both.rb_torsions.size(), 9);
  CHECK(both.pairs.empty());

  opt = TermOptions();
  opt.angles = false;
  opt.dihedrals = false;
  opt.impropers = true;
  BondedTerms imp = moltype::generate_terms(graph, opt);
  CHECK(imp.angles.empty());
  CHECK(imp.dihedrals.empty());
  CHECK(imp.pairs.empty());
  // C(4,3) for each carbon
  REQUIRE_EQ(imp.impropers.size(), 8);
  CHECK(same(imp.impropers[0].atoms, {{0, 1, 2, 3}}));
  CHECK(same(imp.impropers[3].atoms, {{0, 2, 3, 4}}));
  CHECK(same(imp.impropers[4].atoms, {{1, 0, 5, 6}}));
}

TEST_CASE("add_terms_to_structure") {
  moltype::Structure st = make_ethane();
  moltype::add_terms_to_structure(moltype::generate_terms(BondGraph(st)), st);
  moltype::add_terms_to_structure(moltype::generate_terms(BondGraph(st)), st);
  CHECK_EQ(st.angles.size(), 24);
  CHECK_EQ(st.dihedrals.size(), 18);
  CHECK_EQ(st.adjusts.size(), 18);
}
