#include "doctest.h"

#include <moltype/pattern.hpp>
#include <moltype/fail.hpp>  // for SyntaxError

using moltype::parse_pattern;

static std::string canonical(const std::string& text) {
  return parse_pattern(text).str();
}

static moltype::SyntaxError syntax_error(const std::string& text) {
  try {
    parse_pattern(text);
  } catch (moltype::SyntaxError& e) {
    return e;
  }
  FAIL("no SyntaxError for " + text);
  return moltype::SyntaxError(0, "");
}

TEST_CASE("parse_pattern: tree shape") {
  moltype::Pattern p = parse_pattern("[C;D4]([H])([H])([H])[O]");
  REQUIRE(p.root);
  CHECK_EQ(p.count_atoms(), 5);
  CHECK_EQ(p.root->branches.size(), 3);
  REQUIRE(p.root->next);
  CHECK_EQ(p.root->next->expr->str(), "O");
  CHECK_EQ(p.root->continuations().size(), 4);
  CHECK_EQ(p.root->continuations().back(), p.root->next.get());
  CHECK(dynamic_cast<const moltype::AndExpr*>(p.root->expr.get()));

  // branches and the tail continue from the last atom of the chain
  moltype::Pattern q = parse_pattern("[C][C]([H])[O]");
  CHECK(q.root->branches.empty());
  const moltype::PatternAtom* second = q.root->next.get();
  REQUIRE(second);
  CHECK_EQ(second->branches.size(), 1);
  REQUIRE(second->next);
  CHECK_EQ(second->next->expr->str(), "O");

  moltype::Pattern single = parse_pattern("[#6]");
  CHECK_EQ(single.count_atoms(), 1);
  CHECK(single.root->continuations().empty());
  CHECK_EQ(single.text, "[#6]");
}

TEST_CASE("parse_pattern: primitives") {
  CHECK_EQ(canonical("[*]"), "[*]");
  CHECK_EQ(canonical("[#17]"), "[#17]");
  CHECK_EQ(canonical("[Cl]"), "[Cl]");
  CHECK_EQ(canonical("[Co]"), "[Co]");
  CHECK_EQ(canonical("[D3]"), "[D3]");
  CHECK_EQ(canonical("[Dy]"), "[Dy]");
  CHECK_EQ(canonical("[R5]"), "[R5]");
  CHECK_EQ(canonical("[%opls_135]"), "[%opls_135]");
  CHECK_EQ(canonical("[$([C][O])]"), "[$([C][O])]");
  CHECK_EQ(canonical("[C&D4]"), "[C;D4]");
  auto elem = dynamic_cast<const moltype::ElementExpr*>(
                  parse_pattern("[Cl]").root->expr.get());
  REQUIRE(elem);
  CHECK_EQ(elem->elem, moltype::El::Cl);
  auto num = dynamic_cast<const moltype::AtomicNumberExpr*>(
                  parse_pattern("[#6]").root->expr.get());
  REQUIRE(num);
  CHECK_EQ(num->number, 6);
}

TEST_CASE("parse_pattern: ',' binds looser than ';'") {
  moltype::Pattern p = parse_pattern("[C,N;D3]");
  auto top = dynamic_cast<const moltype::OrExpr*>(p.root->expr.get());
  REQUIRE(top);
  CHECK_EQ(top->left->str(), "C");
  CHECK(dynamic_cast<const moltype::AndExpr*>(top->right.get()));
  CHECK_EQ(p.str(), "[C,N;D3]");
}

TEST_CASE("parse_pattern: bare atoms and labels") {
  CHECK_EQ(canonical("[#6;D4](*)(*)(*)*"), "[#6;D4]([*])([*])([*])[*]");
  CHECK_EQ(canonical("CO"), "[C][O]");
  CHECK_EQ(canonical("[C]1[O]23"), "[C]1[O]23");
  CHECK_EQ(parse_pattern("[C]12").root->label, 12);
  CHECK_EQ(parse_pattern("[C]").root->label, -1);
  CHECK_EQ(canonical("[C]([C]([H])[H])[O]"), "[C]([C]([H])[H])[O]");
}

TEST_CASE("parse_pattern: syntax errors") {
  struct Case { const char* text; size_t position; const char* expected; };
  const Case cases[] = {
    {"", 0, "atom"},
    {"[C", 2, "']'"},
    {"[]", 1, "atom primitive"},
    {"[D]", 1, "atom primitive"},
    {"[C;]", 3, "atom primitive"},
    {"[C,]", 3, "atom primitive"},
    {"[#]", 2, "atomic number"},
    {"[%1]", 2, "label name"},
    {"[C](", 4, "atom"},
    {"[C]([H]", 7, "')'"},
    {"[C]x", 3, "end of pattern"},
    {"[C])", 3, "end of pattern"},
    {"[$[C]]", 2, "'('"},
  };
  for (const Case& c : cases) {
    CAPTURE(c.text);
    moltype::SyntaxError e = syntax_error(c.text);
    CHECK_EQ(e.position, c.position);
    CHECK_EQ(e.expected, c.expected);
  }
}

TEST_CASE("check_pattern_syntax") {
  std::string msg;
  CHECK(moltype::check_pattern_syntax("[C;D4]([H])[O]", &msg));
  CHECK(msg.empty());
  CHECK(!moltype::check_pattern_syntax("[C;D4", &msg));
  CHECK_EQ(msg, "pattern syntax error at position 5: expected ']'");
  CHECK(!moltype::check_pattern_syntax("[C](", nullptr));
}
