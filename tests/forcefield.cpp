#include "doctest.h"

#include <stdexcept>
#include <moltype/forcefield.hpp>
#include <moltype/fail.hpp>  // for SyntaxError
#include "molecules.h"

#ifndef MOLTYPE_TEST_DATA_DIR
# define MOLTYPE_TEST_DATA_DIR "data"
#endif

static const char* mini_table = R"(data_mini
# a few types from OPLS-AA
loop_
_atomtype.name
_atomtype.class
_atomtype.element
_atomtype.def
_atomtype.overrides
_atomtype.desc
opls_135 CT C '[C;D4]([H])([H])([H])' opls_136 "alkane CH3"
opls_136 CT C [C;D4]([H])([H]) . ?
opls_140 HC H [H][C] .  'alkane H'  # trailing comment
dummy    ?  ? .      .  .
)";

template<typename F>
static std::string error_of(F func) {
  try {
    func();
  } catch (std::runtime_error& e) {
    return e.what();
  }
  return "";
}

static bool contains(const std::string& str, const char* sub) {
  return str.find(sub) != std::string::npos;
}

TEST_CASE("read_forcefield_string") {
  moltype::ForceField ff = moltype::read_forcefield_string(mini_table);
  CHECK_EQ(ff.name, "mini");
  REQUIRE_EQ(ff.registry.size(), 4);
  const moltype::AtomTypeDef* ch3 = ff.registry.find("opls_135");
  REQUIRE(ch3);
  CHECK_EQ(ch3->atom_class, "CT");
  CHECK_EQ(ch3->element.elem, moltype::El::C);
  CHECK_EQ(ch3->mass, doctest::Approx(12.0107));
  CHECK_EQ(ch3->definition, "[C;D4]([H])([H])([H])");
  CHECK_EQ(ch3->overrides, std::set<std::string>{"opls_136"});
  CHECK_EQ(ch3->description, "alkane CH3");
  const moltype::AtomTypeDef* ch2 = ff.registry.find("opls_136");
  REQUIRE(ch2);
  CHECK(ch2->overrides.empty());
  CHECK(ch2->description.empty());
  CHECK_EQ(ff.registry.find("opls_140")->description, "alkane H");
  const moltype::AtomTypeDef* dummy = ff.registry.find("dummy");
  REQUIRE(dummy);
  CHECK_EQ(dummy->element.elem, moltype::El::X);
  CHECK_EQ(dummy->mass, 0.0);
  CHECK(dummy->definition.empty());
  CHECK(ff.registry.find("opls_999") == nullptr);

  CHECK_EQ(ff.registry.class_members("CT"),
           (std::vector<std::string>{"opls_135", "opls_136"}));
  CHECK_EQ(ff.registry.class_members("").size(), 4);
  CHECK(ff.registry.class_members("OH").empty());

  std::vector<moltype::Rule> rules = ff.make_rules();
  REQUIRE_EQ(rules.size(), 3);
  CHECK_EQ(rules[0].name, "opls_135");
  CHECK(rules[0].does_override("opls_136"));
  CHECK_EQ(rules[2].pattern->str(), "[H][C]");
}

TEST_CASE("read_forcefield_string: options of the format") {
  // no data_ line, multiple overrides, explicit mass
  moltype::ForceField ff = moltype::read_forcefield_string(
      "loop_ _atomtype.name _atomtype.mass _atomtype.overrides\n"
      "a 1.5 'b, c'\n"
      "b 2 ?\n"
      "c ? a,b\n", "table.cif");
  CHECK_EQ(ff.name, "table");
  CHECK_EQ(ff.registry.find("a")->mass, 1.5);
  CHECK_EQ(ff.registry.find("a")->overrides, (std::set<std::string>{"b", "c"}));
  CHECK_EQ(ff.registry.find("c")->overrides, (std::set<std::string>{"a", "b"}));
  CHECK_EQ(ff.registry.find("c")->mass, 0.0);
}

TEST_CASE("read_forcefield_string: errors") {
  auto read = [](const char* text) {
    return [text]() { moltype::read_forcefield_string(text); };
  };
  const char* head = "loop_ _atomtype.name _atomtype.element _atomtype.mass\n";
  CHECK(contains(error_of(read("loop_ _atomtype.name _atomtype.def a")),
                 "Wrong number of values"));
  CHECK(contains(error_of(read("loop_ _atomtype.def [C]")),
                 "missing tag _atomtype.name"));
  CHECK(contains(error_of(read("loop_ _atom_site.id 1")),
                 "unexpected tag _atom_site.id"));
  CHECK(contains(error_of(read("loop_ _atomtype.name 'abc")),
                 "unterminated 'string'"));
  CHECK(contains(error_of(read("data_x")), "expected loop_"));
  std::string dup = error_of(read((std::string(head) + "x C 12\ny H 1\nx O 16\n").c_str()));
  CHECK(contains(dup, "string:4: atom type registered twice: x"));
  CHECK(contains(error_of(read((std::string(head) + "x Xx 1\n").c_str())),
                 "unknown element Xx"));
  CHECK(contains(error_of(read((std::string(head) + "x C 1a\n").c_str())),
                 "invalid mass 1a"));
}

TEST_CASE("ForceField::make_rules: syntax error names the atom type") {
  moltype::ForceField ff;
  ff.name = "test";
  moltype::AtomTypeDef def;
  def.name = "bad";
  def.definition = "[C";
  ff.registry.register_atom_type(def);
  try {
    ff.make_rules();
    FAIL("no exception");
  } catch (moltype::SyntaxError& e) {
    CHECK_EQ(e.position, 2);
    CHECK_EQ(std::string(e.what()),
             "atom type bad: pattern syntax error at position 2: expected ']'");
  }
  CHECK_THROWS_AS(ff.registry.register_atom_type(def), std::runtime_error);
}

TEST_CASE("canonical_forcefield_name") {
  CHECK_EQ(moltype::canonical_forcefield_name("OPLS-AA"), "oplsaa");
  CHECK_EQ(moltype::canonical_forcefield_name("oplsaa"), "oplsaa");
  CHECK_EQ(moltype::canonical_forcefield_name("opls"), "oplsaa");
  CHECK_EQ(moltype::canonical_forcefield_name("trappeua"), "trappeua");
  CHECK_EQ(moltype::canonical_forcefield_name("my-opls-aa-2005"), "oplsaa");
  CHECK_EQ(moltype::canonical_forcefield_name("TraPPE-UA"), "");
  CHECK_EQ(moltype::canonical_forcefield_name("gaff"), "");
  std::vector<moltype::ForceFieldAlias> custom = {{"gaff2", "gaff"}};
  CHECK_EQ(moltype::canonical_forcefield_name("GAFF2", custom), "gaff");
  CHECK_EQ(moltype::canonical_forcefield_name("opls", custom), "");
}

TEST_CASE("locate_forcefield") {
  const auto& aliases = moltype::default_forcefield_aliases();
  CHECK_EQ(moltype::locate_forcefield("OPLS", aliases, MOLTYPE_TEST_DATA_DIR),
           MOLTYPE_TEST_DATA_DIR "/oplsaa.ff/atomtypes.cif");
  CHECK_EQ(moltype::locate_forcefield("trappeua", aliases, "/nonexistent/"),
           "/nonexistent/trappeua.ff/atomtypes.cif");
  CHECK_EQ(moltype::locate_forcefield("my/types.cif", aliases, "/ff"),
           "my/types.cif");
}

TEST_CASE("apply_forcefield") {
  std::string path = moltype::locate_forcefield(
      "opls-aa", moltype::default_forcefield_aliases(), MOLTYPE_TEST_DATA_DIR);
  moltype::ForceField ff = moltype::read_forcefield_file(path);
  CHECK_EQ(ff.name, "oplsaa");

  SUBCASE("ethanol") {
    moltype::Structure st = make_ethanol();
    moltype::ApplyResult result = moltype::apply_forcefield(st, ff);
    const char* expected[] = {"opls_135", "opls_157", "opls_154",
                              "opls_140", "opls_140", "opls_140",
                              "opls_140", "opls_140", "opls_155"};
    for (size_t i = 0; i != st.atoms.size(); ++i)
      CHECK_EQ(st.atoms[i].type, expected[i]);
    CHECK_EQ(result.assignments.size(), 9);
    CHECK_EQ(result.stats.passes, 2);
    CHECK_EQ(st.angles.size(), 13);
    CHECK_EQ(st.dihedrals.size(), 12);
    CHECK_EQ(st.adjusts.size(), 12);
    CHECK(st.impropers.empty());
  }
  SUBCASE("methane, ethane") {
    moltype::Structure methane = make_methane();
    moltype::apply_forcefield(methane, ff);
    CHECK_EQ(methane.atoms[0].type, "opls_138");
    CHECK_EQ(methane.atoms[1].type, "opls_140");
    moltype::Structure ethane = make_ethane();
    moltype::apply_forcefield(ethane, ff);
    CHECK_EQ(ethane.atoms[0].type, "opls_135");
    CHECK_EQ(ethane.atoms[1].type, "opls_135");
  }
  SUBCASE("no bonds") {
    moltype::Structure st = make_methane();
    st.name = "CH4";
    st.bonds.clear();
    std::vector<std::string> messages;
    moltype::Logger logger{[&](const std::string& s) { messages.push_back(s); }, 3};
    moltype::ApplyResult result = moltype::apply_forcefield(st, ff, moltype::TermOptions(),
                                                            logger);
    REQUIRE_EQ(messages.size(), 1);
    CHECK(contains(messages[0], "Warning: structure CH4 has no bonds"));
    CHECK(st.atoms[0].type.empty());
    CHECK(st.atoms[0].neighbors.empty());
    CHECK(st.angles.empty());
    CHECK_EQ(result.stats.matches, 0);
  }
}
