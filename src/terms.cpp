// Copyright Global Phasing Ltd.

#include <moltype/terms.hpp>
#include <iterator>  // for make_move_iterator

namespace moltype {

namespace {

template<typename T>
void append(std::vector<T>& dest, std::vector<T>&& src) {
  dest.insert(dest.end(), std::make_move_iterator(src.begin()),
              std::make_move_iterator(src.end()));
  src.clear();
}

} // anonymous namespace

BondedTerms generate_terms(const BondGraph& graph, const TermOptions& options) {
  BondedTerms terms;
  for (size_t n = 0; n != graph.size(); ++n) {
    const std::vector<size_t>& nb = graph.neighbors[n];
    size_t deg = nb.size();

    if (options.angles && deg >= 2)
      for (size_t i = 0; i + 1 < deg; ++i)
        for (size_t j = i + 1; j < deg; ++j)
          terms.angles.push_back(Angle{{{nb[i], n, nb[j]}}});

    // each bond is seen from both ends, take it from the lower index
    if (options.dihedrals && deg >= 2)
      for (size_t n2 : nb) {
        if (n2 <= n || graph.degree(n2) < 2)
          continue;
        for (size_t a : nb) {
          if (a == n2)
            continue;
          for (size_t b : graph.neighbors[n2]) {
            if (b == n || b == a)  // b == a in 3-membered rings
              continue;
            Dihedral dih{{{a, n, n2, b}}};
            if (options.proper_dihedrals)
              terms.dihedrals.push_back(dih);
            if (options.rb_torsions)
              terms.rb_torsions.push_back(dih);
            if (options.pairs)
              terms.pairs.push_back(Pair{{{a, b}}});
          }
        }
      }

    if (options.impropers && deg >= 3)
      for (size_t i = 0; i + 2 < deg; ++i)
        for (size_t j = i + 1; j + 1 < deg; ++j)
          for (size_t k = j + 1; k < deg; ++k)
            terms.impropers.push_back(Improper{{{n, nb[i], nb[j], nb[k]}}});
  }
  return terms;
}

void add_terms_to_structure(BondedTerms&& terms, Structure& st) {
  append(st.angles, std::move(terms.angles));
  append(st.dihedrals, std::move(terms.dihedrals));
  append(st.rb_torsions, std::move(terms.rb_torsions));
  append(st.impropers, std::move(terms.impropers));
  append(st.adjusts, std::move(terms.pairs));
}

} // namespace moltype
