// Copyright Global Phasing Ltd.
//
// Atom patterns - a subset of SMARTS used to define atom types.
// Abstract syntax tree and the parser entry points.
//
// A pattern is a tree of atoms. Each atom has an expression in brackets,
// e.g. [#6;D4] or [C,N] (a bare * or element symbol is also accepted),
// and continues in zero or more directions: parenthesized branches and
// then the rest of the chain.
//   [C;D4]([H])([H])([H])[O]   - a carbon with three H and one O neighbor.
//   [#6;D4](*)(*)(*)*          - any carbon with four neighbors.

#ifndef MOLTYPE_PATTERN_HPP_
#define MOLTYPE_PATTERN_HPP_

#include <memory>
#include <string>
#include <vector>
#include "elem.hpp"  // for El

namespace moltype {

struct Atom;

/// Node of the Boolean expression inside brackets.
struct AtomExpr {
  virtual ~AtomExpr() = default;
  /// Checks the atom alone, without its neighbors.
  /// Throws UnsupportedFeature for primitives that cannot be evaluated.
  virtual bool match(const Atom& a) const = 0;
  virtual std::string str() const = 0;
};

// --- Pattern tree ---

struct PatternAtom {
  std::unique_ptr<AtomExpr> expr;
  int label = -1;  // the number after ']', -1 if absent; not used in matching
  std::vector<std::unique_ptr<PatternAtom>> branches;
  std::unique_ptr<PatternAtom> next;

  /// Pattern atoms bonded to this one, other than the one we came from:
  /// first atoms of the branches (in order) followed by the next atom.
  std::vector<const PatternAtom*> continuations() const {
    std::vector<const PatternAtom*> r;
    r.reserve(branches.size() + 1);
    for (const std::unique_ptr<PatternAtom>& b : branches)
      r.push_back(b.get());
    if (next)
      r.push_back(next.get());
    return r;
  }

  size_t count_atoms() const {
    size_t n = 1;
    for (const std::unique_ptr<PatternAtom>& b : branches)
      n += b->count_atoms();
    if (next)
      n += next->count_atoms();
    return n;
  }

  std::string str() const {
    std::string s = '[' + expr->str() + ']';
    if (label >= 0)
      s += std::to_string(label);
    for (const std::unique_ptr<PatternAtom>& b : branches)
      s += '(' + b->str() + ')';
    if (next)
      s += next->str();
    return s;
  }
};

// --- Logic Nodes ---

struct AndExpr : AtomExpr {
  std::unique_ptr<AtomExpr> left, right;
  bool match(const Atom& a) const override;
  std::string str() const override { return left->str() + ';' + right->str(); }
};

struct OrExpr : AtomExpr {
  std::unique_ptr<AtomExpr> left, right;
  bool match(const Atom& a) const override;
  std::string str() const override { return left->str() + ',' + right->str(); }
};

// --- Primitives ---

// *
struct AnyAtomExpr : AtomExpr {
  bool match(const Atom&) const override { return true; }
  std::string str() const override { return "*"; }
};

// #6
struct AtomicNumberExpr : AtomExpr {
  int number;
  explicit AtomicNumberExpr(int n) : number(n) {}
  bool match(const Atom& a) const override;
  std::string str() const override { return '#' + std::to_string(number); }
};

// C, Cl, ...
struct ElementExpr : AtomExpr {
  El elem;
  explicit ElementExpr(El el) : elem(el) {}
  bool match(const Atom& a) const override;
  std::string str() const override;
};

// %opls_135 - the atom has already been assigned this label (rule name)
struct LabelExpr : AtomExpr {
  std::string label;
  explicit LabelExpr(std::string s) : label(std::move(s)) {}
  bool match(const Atom& a) const override;
  std::string str() const override { return '%' + label; }
};

// D3 - number of bonded neighbors
struct DegreeExpr : AtomExpr {
  int degree;
  explicit DegreeExpr(int n) : degree(n) {}
  bool match(const Atom& a) const override;
  std::string str() const override { return 'D' + std::to_string(degree); }
};

// R6 - parsed, but matching is not implemented
struct RingSizeExpr : AtomExpr {
  int ring_size;
  explicit RingSizeExpr(int n) : ring_size(n) {}
  bool match(const Atom& a) const override;
  std::string str() const override { return 'R' + std::to_string(ring_size); }
};

// $(...) - parsed, but matching is not implemented
struct SubPatternExpr : AtomExpr {
  std::unique_ptr<PatternAtom> root;
  explicit SubPatternExpr(std::unique_ptr<PatternAtom> r) : root(std::move(r)) {}
  bool match(const Atom& a) const override;
  std::string str() const override;
};

struct Pattern {
  std::string text;  // the string that was parsed
  std::unique_ptr<PatternAtom> root;

  /// canonical spelling, with all atoms in brackets and ';' for AND
  std::string str() const { return root ? root->str() : std::string(); }
  size_t count_atoms() const { return root ? root->count_atoms() : 0; }
};

/// Throws SyntaxError if the text is not a valid pattern.
Pattern parse_pattern(const std::string& text);

/// Returns false and sets msg (if not null) instead of throwing.
bool check_pattern_syntax(const std::string& text, std::string* msg);

} // namespace moltype
#endif
