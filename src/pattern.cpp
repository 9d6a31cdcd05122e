// Copyright Global Phasing Ltd.
//
// Pattern parser (based on PEGTL).

#include <moltype/pattern.hpp>
#include <cstdlib>           // for strtol
#include <tao/pegtl.hpp>
#include <moltype/fail.hpp>  // for SyntaxError

namespace moltype {

namespace pegtl = tao::pegtl;

namespace {

enum class ItemKind { Atom, Pattern, Branch, Tail };

struct Item {
  ItemKind kind;
  std::unique_ptr<PatternAtom> node;
};

struct ParseState {
  std::vector<std::unique_ptr<AtomExpr>> exprs;
  std::vector<Item> items;
  std::vector<size_t> frames;  // items.size() when a (sub)pattern started
  int label = -1;
};

template<typename Input> int read_number(const Input& in) {
  std::string s = in.string();
  if (s.size() > 6)
    throw SyntaxError(in.iterator().byte, "number < 1000000");
  return (int) std::strtol(s.c_str(), nullptr, 10);
}

template<typename T>
void reduce_binary(ParseState& s) {
  std::unique_ptr<T> node = std::make_unique<T>();
  node->right = std::move(s.exprs.back());
  s.exprs.pop_back();
  node->left = std::move(s.exprs.back());
  s.exprs.pop_back();
  s.exprs.push_back(std::move(node));
}

} // anonymous namespace

namespace pattern_rules {

  using namespace pegtl;

  struct number : plus<digit> {};

  // Element symbol written as in the periodic table: C, Cl, Na, ...
  // A lowercase letter is taken only if it forms a known two-letter symbol.
  struct element_symbol {
    using analyze_t = analysis::generic<analysis::rule_type::ANY>;
    template<typename Input> static bool match(Input& in) {
      if (in.empty())
        return false;
      char sym[3] = { in.peek_char(), '\0', '\0' };
      if (sym[0] < 'A' || sym[0] > 'Z')
        return false;
      if (in.size(2) > 1) {
        sym[1] = in.peek_char(1);
        if (sym[1] >= 'a' && sym[1] <= 'z' && find_element(sym) != El::X) {
          in.bump_in_this_line(2);
          return true;
        }
        sym[1] = '\0';
      }
      if (find_element(sym) != El::X) {
        in.bump_in_this_line(1);
        return true;
      }
      return false;
    }
  };

  struct pattern;

  struct any_atom : one<'*'> {};
  struct atomic_num : number {};
  struct hash_num : if_must<one<'#'>, atomic_num> {};
  struct neighbor_count : number {};
  struct degree : seq<one<'D'>, neighbor_count> {};
  struct ring_size : number {};
  struct ring : seq<one<'R'>, ring_size> {};
  struct label_name : seq<ranges<'a', 'z', 'A', 'Z', '_'>,
                          star<ranges<'a', 'z', 'A', 'Z', '0', '9', '_'>>> {};
  struct has_label : if_must<one<'%'>, label_name> {};
  struct sub_pattern : if_must<one<'$'>, one<'('>, pattern, one<')'>> {};
  // D and R followed by a number must be tried before element symbols
  struct primitive : sor<any_atom, hash_num, degree, ring, has_label,
                         sub_pattern, element_symbol> {};

  // ',' (OR) binds looser than ';' and '&' (AND)
  struct and_rest : if_must<one<';', '&'>, primitive> {};
  struct and_expr : seq<primitive, star<and_rest>> {};
  struct or_rest : if_must<one<','>, and_expr> {};
  struct or_expr : seq<and_expr, star<or_rest>> {};

  struct bracket_expr : if_must<one<'['>, or_expr, one<']'>> {};
  struct bare_atom : sor<any_atom, element_symbol> {};
  struct atom_label : number {};
  struct atom : seq<sor<bracket_expr, bare_atom>, opt<atom_label>> {};
  struct atom_start : sor<one<'['>, bare_atom> {};

  struct chain : pegtl::plus<atom> {};
  struct branch : if_must<one<'('>, pattern, one<')'>> {};
  struct tail : seq<at<atom_start>, pattern> {};
  struct pattern_begin : success {};
  struct pattern : seq<pattern_begin, chain, star<branch>, opt<tail>> {};
  struct grammar : must<pattern, eof> {};


// **** error messages ****

template<typename Rule> const std::string& error_message() {
  static const std::string s = "valid syntax";
  return s;
}
#define error_msg(rule, msg) \
  template<> inline const std::string& error_message<rule>() { \
    static const std::string s = msg; \
    return s; \
  }
error_msg(pattern, "atom")
error_msg(or_expr, "atom primitive")
error_msg(and_expr, "atom primitive")
error_msg(primitive, "atom primitive")
error_msg(atomic_num, "atomic number")
error_msg(label_name, "label name")
error_msg(one<'('>, "'('")
error_msg(one<')'>, "')'")
error_msg(one<']'>, "']'")
error_msg(eof, "end of pattern")
#undef error_msg

template<typename Rule> struct Errors : public pegtl::normal<Rule> {
  template<typename Input, typename ... States>
  static void raise(const Input& in, States&& ...) {
    throw SyntaxError(in.position().byte, error_message<Rule>());
  }
};


// **** parsing actions that build the tree ****

template<typename Rule> struct Action : pegtl::nothing<Rule> {};

template<> struct Action<any_atom> {
  static void apply0(ParseState& s) {
    s.exprs.push_back(std::make_unique<AnyAtomExpr>());
  }
};
template<> struct Action<atomic_num> {
  template<typename Input> static void apply(const Input& in, ParseState& s) {
    s.exprs.push_back(std::make_unique<AtomicNumberExpr>(read_number(in)));
  }
};
template<> struct Action<neighbor_count> {
  template<typename Input> static void apply(const Input& in, ParseState& s) {
    s.exprs.push_back(std::make_unique<DegreeExpr>(read_number(in)));
  }
};
template<> struct Action<ring_size> {
  template<typename Input> static void apply(const Input& in, ParseState& s) {
    s.exprs.push_back(std::make_unique<RingSizeExpr>(read_number(in)));
  }
};
template<> struct Action<label_name> {
  template<typename Input> static void apply(const Input& in, ParseState& s) {
    s.exprs.push_back(std::make_unique<LabelExpr>(in.string()));
  }
};
template<> struct Action<element_symbol> {
  template<typename Input> static void apply(const Input& in, ParseState& s) {
    s.exprs.push_back(std::make_unique<ElementExpr>(find_element(in.string().c_str())));
  }
};
template<> struct Action<sub_pattern> {
  static void apply0(ParseState& s) {
    std::unique_ptr<PatternAtom> root = std::move(s.items.back().node);
    s.items.pop_back();
    s.exprs.push_back(std::make_unique<SubPatternExpr>(std::move(root)));
  }
};
template<> struct Action<and_rest> {
  static void apply0(ParseState& s) { reduce_binary<AndExpr>(s); }
};
template<> struct Action<or_rest> {
  static void apply0(ParseState& s) { reduce_binary<OrExpr>(s); }
};
template<> struct Action<atom_label> {
  template<typename Input> static void apply(const Input& in, ParseState& s) {
    s.label = read_number(in);
  }
};
template<> struct Action<atom> {
  static void apply0(ParseState& s) {
    std::unique_ptr<PatternAtom> node = std::make_unique<PatternAtom>();
    node->expr = std::move(s.exprs.back());
    s.exprs.pop_back();
    node->label = s.label;
    s.label = -1;
    s.items.push_back(Item{ItemKind::Atom, std::move(node)});
  }
};
template<> struct Action<pattern_begin> {
  static void apply0(ParseState& s) { s.frames.push_back(s.items.size()); }
};
// Items of a finished pattern: one or more atoms (the chain), branches,
// optional tail. Branches and the tail continue from the last chain atom.
template<> struct Action<pattern> {
  static void apply0(ParseState& s) {
    size_t start = s.frames.back();
    s.frames.pop_back();
    std::unique_ptr<PatternAtom> root;
    PatternAtom* last = nullptr;
    for (size_t i = start; i != s.items.size(); ++i) {
      Item& item = s.items[i];
      switch (item.kind) {
        case ItemKind::Atom:
          if (last == nullptr) {
            root = std::move(item.node);
            last = root.get();
          } else {
            last->next = std::move(item.node);
            last = last->next.get();
          }
          break;
        case ItemKind::Branch:
          last->branches.push_back(std::move(item.node));
          break;
        case ItemKind::Tail:
          last->next = std::move(item.node);
          break;
        case ItemKind::Pattern:
          unreachable();
      }
    }
    s.items.erase(s.items.begin() + start, s.items.end());
    s.items.push_back(Item{ItemKind::Pattern, std::move(root)});
  }
};
template<> struct Action<branch> {
  static void apply0(ParseState& s) { s.items.back().kind = ItemKind::Branch; }
};
template<> struct Action<tail> {
  static void apply0(ParseState& s) { s.items.back().kind = ItemKind::Tail; }
};

} // namespace pattern_rules

std::string ElementExpr::str() const {
  return element_info(elem).symbol;
}

std::string SubPatternExpr::str() const {
  return "$(" + root->str() + ")";
}

Pattern parse_pattern(const std::string& text) {
  ParseState state;
  pegtl::memory_input<> in(text, "pattern");
  pegtl::parse<pattern_rules::grammar, pattern_rules::Action,
               pattern_rules::Errors>(in, state);
  Pattern pattern;
  pattern.text = text;
  pattern.root = std::move(state.items.back().node);
  return pattern;
}

bool check_pattern_syntax(const std::string& text, std::string* msg) {
  try {
    ParseState state;
    pegtl::memory_input<> in(text, "pattern");
    return pegtl::parse<pattern_rules::grammar, pattern_rules::Action,
                        pattern_rules::Errors>(in, state);
  } catch (SyntaxError& e) {
    if (msg)
      *msg = e.what();
    return false;
  }
}

} // namespace moltype
