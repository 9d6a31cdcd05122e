// Copyright Global Phasing Ltd.

#include <moltype/forcefield.hpp>
#include <moltype/fail.hpp>      // for fail, SyntaxError
#include <moltype/fileutil.hpp>  // for join_path, file_exists
#include <moltype/util.hpp>      // for to_lower

namespace moltype {

void AtomTypeRegistry::register_atom_type(AtomTypeDef def) {
  if (def.name.empty())
    fail("atom type without a name");
  if (index_.count(def.name))
    fail("atom type registered twice: ", def.name);
  index_.emplace(def.name, types_.size());
  classes_[""].push_back(def.name);
  if (!def.atom_class.empty())
    classes_[def.atom_class].push_back(def.name);
  types_.push_back(std::move(def));
}

const AtomTypeDef* AtomTypeRegistry::find(const std::string& name) const {
  auto it = index_.find(name);
  return it != index_.end() ? &types_[it->second] : nullptr;
}

const std::vector<std::string>&
AtomTypeRegistry::class_members(const std::string& cls) const {
  static const std::vector<std::string> empty;
  auto it = classes_.find(cls);
  return it != classes_.end() ? it->second : empty;
}

std::vector<Rule> ForceField::make_rules(const Logger& logger) const {
  std::vector<Rule> rules;
  for (const AtomTypeDef& def : registry.types()) {
    if (def.definition.empty())
      continue;
    try {
      rules.emplace_back(def.name, def.definition, def.overrides);
    } catch (SyntaxError& e) {
      throw SyntaxError(e.position, e.expected, "atom type " + def.name);
    }
  }
  check_rules(rules, logger);
  return rules;
}

const std::vector<ForceFieldAlias>& default_forcefield_aliases() {
  static const std::vector<ForceFieldAlias> aliases = {
    {"opls-aa", "oplsaa"},
    {"oplsaa", "oplsaa"},
    {"opls", "oplsaa"},
    {"trappeua", "trappeua"},
  };
  return aliases;
}

std::string canonical_forcefield_name(const std::string& name,
                                      const std::vector<ForceFieldAlias>& aliases) {
  std::string lname = to_lower(name);
  for (const ForceFieldAlias& a : aliases)
    if (lname == a.alias)
      return a.canonical;
  // e.g. opls-aa-2005
  for (const ForceFieldAlias& a : aliases)
    if (std::string(a.canonical) == "oplsaa" &&
        lname.find(a.alias) != std::string::npos)
      return a.canonical;
  return std::string();
}

std::string locate_forcefield(const std::string& name,
                              const std::vector<ForceFieldAlias>& aliases,
                              const std::string& data_dir) {
  for (const ForceFieldAlias& a : aliases)
    if (to_lower(name) == a.alias) {
      std::string rel_path = std::string(a.canonical) + ".ff/atomtypes.cif";
      if (file_exists(rel_path) || data_dir.empty())
        return rel_path;
      return join_path(data_dir, rel_path);
    }
  return name;
}

ApplyResult apply_forcefield(Structure& st, const ForceField& ff,
                             const TermOptions& options, const Logger& logger) {
  ApplyResult result;
  if (st.bonds.empty())
    logger.warn("structure ", st.name.empty() ? std::string("(unnamed)") : st.name,
                " has no bonds, atom typing will likely fail");
  setup_neighbors(st);
  std::vector<Rule> rules = ff.make_rules(logger);
  logger.mesg("Typing ", std::to_string(st.atoms.size()), " atoms with ",
              std::to_string(rules.size()), " rules from ", ff.name);
  result.stats = find_atomtypes(st.atoms, rules, logger);
  result.assignments = resolve_atomtypes(st.atoms, logger);
  for (size_t i = 0; i != st.atoms.size(); ++i)
    st.atoms[i].type = result.assignments[i].type;
  BondGraph graph(st);
  add_terms_to_structure(generate_terms(graph, options), st);
  return result;
}

} // namespace moltype
