// Copyright Global Phasing Ltd.
//
// Elements from the periodic table: symbols, atomic numbers and
// standard atomic weights.

#ifndef MOLTYPE_ELEM_HPP_
#define MOLTYPE_ELEM_HPP_

#include <cstring>  // for strcmp
#include <string>

namespace moltype {

enum class El : unsigned char {
  X=0,  // unknown
  H=1, He, Li, Be, B, C, N, O, F, Ne, Na, Mg, Al, Si, P, S, Cl, Ar,  // 1-3
  K, Ca, Sc, Ti, V, Cr, Mn, Fe, Co, Ni, Cu, Zn, Ga, Ge, As, Se, Br, Kr,  // 4
  Rb, Sr, Y, Zr, Nb, Mo, Tc, Ru, Rh, Pd, Ag, Cd, In, Sn, Sb, Te, I, Xe,  // 5
  Cs, Ba, La, Ce, Pr, Nd, Pm, Sm, Eu, Gd, Tb, Dy, Ho, Er, Tm, Yb, Lu,  // 6..
  Hf, Ta, W, Re, Os, Ir, Pt, Au, Hg, Tl, Pb, Bi, Po, At, Rn,  // ..6
  Fr, Ra, Ac, Th, Pa, U, Np, Pu, Am, Cm, Bk, Cf, Es, Fm, Md, No, Lr,  // 7..
  Rf, Db, Sg, Bh, Hs, Mt, Ds, Rg, Cn, Nh, Fl, Mc, Lv, Ts, Og, // ..7
  END
};

struct ElementInfo {
  char symbol[3];
  double weight;
};

inline const ElementInfo& element_info(El el) {
  static constexpr ElementInfo table[] = {
    {"X", 0.0},
    {"H", 1.00794}, {"He", 4.0026},
    {"Li", 6.941}, {"Be", 9.012182}, {"B", 10.811}, {"C", 12.0107},
    {"N", 14.0067}, {"O", 15.9994}, {"F", 18.998403}, {"Ne", 20.1797},
    {"Na", 22.98977}, {"Mg", 24.305}, {"Al", 26.981539}, {"Si", 28.0855},
    {"P", 30.973761}, {"S", 32.065}, {"Cl", 35.453}, {"Ar", 39.948},
    {"K", 39.0983}, {"Ca", 40.078}, {"Sc", 44.95591}, {"Ti", 47.867},
    {"V", 50.9415}, {"Cr", 51.9961}, {"Mn", 54.93805}, {"Fe", 55.845},
    {"Co", 58.9332}, {"Ni", 58.6934}, {"Cu", 63.546}, {"Zn", 65.38},
    {"Ga", 69.723}, {"Ge", 72.64}, {"As", 74.9216}, {"Se", 78.96},
    {"Br", 79.904}, {"Kr", 83.798}, {"Rb", 85.4678}, {"Sr", 87.62},
    {"Y", 88.90585}, {"Zr", 91.224}, {"Nb", 92.9064}, {"Mo", 95.95},
    {"Tc", 98}, {"Ru", 101.07}, {"Rh", 102.9055}, {"Pd", 106.42},
    {"Ag", 107.8682}, {"Cd", 112.411}, {"In", 114.818}, {"Sn", 118.71},
    {"Sb", 121.76}, {"Te", 127.6}, {"I", 126.90447}, {"Xe", 131.293},
    {"Cs", 132.905}, {"Ba", 137.327}, {"La", 138.905}, {"Ce", 140.116},
    {"Pr", 140.908}, {"Nd", 144.24}, {"Pm", 145}, {"Sm", 150.36},
    {"Eu", 151.964}, {"Gd", 157.25}, {"Tb", 158.925}, {"Dy", 162.5},
    {"Ho", 164.93}, {"Er", 167.259}, {"Tm", 168.934}, {"Yb", 173.05},
    {"Lu", 174.967}, {"Hf", 178.49}, {"Ta", 180.948}, {"W", 183.84},
    {"Re", 186.207}, {"Os", 190.23}, {"Ir", 192.217}, {"Pt", 195.084},
    {"Au", 196.967}, {"Hg", 200.59}, {"Tl", 204.383}, {"Pb", 207.2},
    {"Bi", 208.98}, {"Po", 209}, {"At", 210}, {"Rn", 222},
    {"Fr", 223}, {"Ra", 226}, {"Ac", 227}, {"Th", 232.038}, {"Pa", 231.036},
    {"U", 238.029}, {"Np", 237}, {"Pu", 244}, {"Am", 243}, {"Cm", 247},
    {"Bk", 247}, {"Cf", 251}, {"Es", 252}, {"Fm", 257}, {"Md", 258},
    {"No", 259}, {"Lr", 262}, {"Rf", 267}, {"Db", 268}, {"Sg", 271},
    {"Bh", 272}, {"Hs", 270}, {"Mt", 276}, {"Ds", 281}, {"Rg", 280},
    {"Cn", 285}, {"Nh", 284}, {"Fl", 289}, {"Mc", 288}, {"Lv", 293},
    {"Ts", 294}, {"Og", 294},
    {"", 0.0}  // END
  };
  static_assert(sizeof(table) / sizeof(table[0]) ==
                static_cast<int>(El::END) + 1, "element table size");
  return table[static_cast<int>(el)];
}

/// Finds element by its symbol. The symbol is case-sensitive ("Cl", not
/// "CL" or "cl"), which is what patterns and atom-type tables use.
/// Returns El::X if not found.
inline El find_element(const char* symbol) {
  if (symbol == nullptr || symbol[0] < 'A' || symbol[0] > 'Z')
    return El::X;
  for (int i = 1; i != static_cast<int>(El::END); ++i)
    if (std::strcmp(element_info(static_cast<El>(i)).symbol, symbol) == 0)
      return static_cast<El>(i);
  return El::X;
}

struct Element {
  El elem;

  /*implicit*/ Element(El e) noexcept : elem(e) {}
  explicit Element(const char* str) noexcept : elem(find_element(str)) {}
  explicit Element(const std::string& s) noexcept : Element(s.c_str()) {}
  explicit Element(int number) noexcept
    : elem(static_cast<El>(number > 0 && number < static_cast<int>(El::END)
                           ? number : 0)) {}
  /*implicit*/ operator El() const { return elem; }
  bool operator==(El e) const { return elem == e; }
  bool operator!=(El e) const { return elem != e; }

  int atomic_number() const { return static_cast<int>(elem); }
  double weight() const { return element_info(elem).weight; }
  const char* name() const { return element_info(elem).symbol; }
};

} // namespace moltype
#endif
// vim:sw=2:ts=2:et
