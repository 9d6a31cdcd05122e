// Copyright Global Phasing Ltd.

#include <moltype/structure.hpp>
#include <algorithm>         // for find
#include <cstdlib>           // for strtoul
#include <string>            // for to_string
#include <moltype/fail.hpp>  // for fail
#include <moltype/util.hpp>  // for split_str

namespace moltype {

BondGraph::BondGraph(size_t n_atoms, const std::vector<Bond>& bonds)
  : neighbors(n_atoms) {
  for (const Bond& bond : bonds) {
    size_t a = bond.atoms[0];
    size_t b = bond.atoms[1];
    if (a >= n_atoms || b >= n_atoms)
      fail("bond " + std::to_string(a) + "-" + std::to_string(b),
           " refers to a non-existent atom (atom count: ",
           std::to_string(n_atoms), ")");
    if (a == b)
      fail("atom " + std::to_string(a) + " is bonded to itself");
    if (are_bonded(a, b))
      continue;
    neighbors[a].push_back(b);
    neighbors[b].push_back(a);
  }
}

bool BondGraph::are_bonded(size_t a, size_t b) const {
  const std::vector<size_t>& v = neighbors[a];
  return std::find(v.begin(), v.end(), b) != v.end();
}

void setup_neighbors(Structure& st) {
  BondGraph graph(st);
  for (size_t i = 0; i != st.atoms.size(); ++i) {
    Atom& atom = st.atoms[i];
    atom.idx = i;
    atom.neighbors = std::move(graph.neighbors[i]);
  }
}

std::vector<Bond> parse_bond_list(const std::string& list) {
  std::vector<Bond> result;
  for (const std::string& item : split_str(list, ',')) {
    std::array<size_t, 2> atoms;
    const char* start = item.c_str();
    for (int i = 0; i != 2; ++i) {
      char* endptr = nullptr;
      unsigned long n = std::strtoul(start, &endptr, 10);
      if (endptr == start || *start == '-' || *start == '+' || n == 0 ||
          *endptr != (i == 0 ? '-' : '\0'))
        fail("wrong bond '", item, "', expected two atom numbers (from 1)"
             " joined with '-', e.g. 1-2");
      atoms[i] = n - 1;
      start = endptr + 1;
    }
    result.push_back(Bond{atoms});
  }
  return result;
}

} // namespace moltype
