// Copyright Global Phasing Ltd.

// Microbenchmark of pattern parsing, atom typing and term generation
// on linear alkanes.
// Requires the google/benchmark library.

#include "moltype/pattern.hpp"
#include "moltype/terms.hpp"
#include "moltype/typing.hpp"
#include <benchmark/benchmark.h>

// CnH(2n+2): carbons first, then hydrogens
static moltype::Structure make_alkane(int n) {
  moltype::Structure st;
  for (int i = 0; i != n; ++i)
    st.add_atom(moltype::El::C);
  for (int i = 0; i != n; ++i) {
    if (i != 0)
      st.add_bond(i - 1, i);
    int n_h = (i == 0 || i == n - 1) ? 3 : 2;
    if (n == 1)
      n_h = 4;
    for (int j = 0; j != n_h; ++j) {
      st.add_atom(moltype::El::H);
      st.add_bond(i, st.atoms.size() - 1);
    }
  }
  moltype::setup_neighbors(st);
  return st;
}

static std::vector<moltype::Rule> alkane_rules() {
  return {
    moltype::Rule("opls_135", "[C;D4]([H])([H])([H])", {"opls_136", "opls_139"}),
    moltype::Rule("opls_136", "[C;D4]([H])([H])", {"opls_139"}),
    moltype::Rule("opls_138", "[C;D4]([H])([H])([H])[H]", {"opls_135", "opls_136", "opls_139"}),
    moltype::Rule("opls_139", "[C;D4]"),
    moltype::Rule("opls_140", "[H][C;%opls_135,%opls_136,%opls_138]"),
  };
}

static void parse_patterns(benchmark::State& state) {
  const char* patterns[] = {
    "[C;D4]([H])([H])([H])[H]", "[#6;D4](*)(*)(*)*", "[O;D2]([H])[C;%opls_157]",
    "[C,N;D3]([C]([H])[O])[H]", "[$([C][O])]",
  };
  for (auto _ : state)
    for (const char* p : patterns)
      benchmark::DoNotOptimize(moltype::parse_pattern(p));
}

static void find_atomtypes(benchmark::State& state) {
  moltype::Structure st = make_alkane((int) state.range(0));
  std::vector<moltype::Rule> rules = alkane_rules();
  for (auto _ : state)
    benchmark::DoNotOptimize(moltype::find_atomtypes(st.atoms, rules));
  state.SetItemsProcessed(state.iterations() * st.atoms.size());
}

static void generate_terms(benchmark::State& state) {
  moltype::Structure st = make_alkane((int) state.range(0));
  moltype::BondGraph graph(st);
  moltype::TermOptions options;
  options.impropers = true;
  for (auto _ : state)
    benchmark::DoNotOptimize(moltype::generate_terms(graph, options));
}

BENCHMARK(parse_patterns);
BENCHMARK(find_atomtypes)->Arg(4)->Arg(32)->Arg(256);
BENCHMARK(generate_terms)->Arg(4)->Arg(32)->Arg(256);
BENCHMARK_MAIN();
