// Copyright Global Phasing Ltd.

#include <moltype/typing.hpp>
#include <string>             // for to_string
#include <utility>            // for pair
#include <moltype/fail.hpp>   // for fail
#include <moltype/match.hpp>  // for matches
#include <moltype/util.hpp>   // for join_str

namespace moltype {

namespace {

std::string atom_str(const Atom& atom) {
  return "atom " + std::to_string(atom.idx + 1) + " ("
         + (atom.name.empty() ? atom.element.name() : atom.name) + ")";
}

} // anonymous namespace

TypingStats find_atomtypes(std::vector<Atom>& atoms, const std::vector<Rule>& rules,
                           const Logger& logger) {
  TypingStats stats;
  for (Atom& atom : atoms) {
    atom.whitelist.clear();
    atom.blacklist.clear();
  }
  // (atom index, rule index) matched in the current pass
  std::vector<std::pair<size_t, size_t>> found;
  for (;;) {
    ++stats.passes;
    found.clear();
    for (size_t i = 0; i != atoms.size(); ++i) {
      const Atom& atom = atoms[i];
      for (size_t j = 0; j != rules.size(); ++j) {
        const Rule& rule = rules[j];
        if (atom.whitelist.count(rule.name) || atom.blacklist.count(rule.name))
          continue;
        if (matches(rule, atoms, i))
          found.emplace_back(i, j);
      }
    }
    logger.debug("typing pass ", std::to_string(stats.passes), ": ",
                 std::to_string(found.size()), " new matches");
    if (found.empty())
      break;
    for (const std::pair<size_t, size_t>& p : found) {
      Atom& atom = atoms[p.first];
      const Rule& rule = rules[p.second];
      atom.whitelist.insert(rule.name);
      atom.blacklist.insert(rule.overrides.begin(), rule.overrides.end());
    }
    stats.matches += (int) found.size();
  }
  return stats;
}

std::vector<AtomTypeSets> compute_atomtypes(const std::vector<Atom>& atoms,
                                            const std::vector<Rule>& rules) {
  std::vector<Atom> copy = atoms;
  find_atomtypes(copy, rules);
  std::vector<AtomTypeSets> result;
  result.reserve(copy.size());
  for (Atom& atom : copy)
    result.push_back(AtomTypeSets{std::move(atom.whitelist),
                                  std::move(atom.blacklist)});
  return result;
}

std::vector<AtomTypeAssignment> resolve_atomtypes(const std::vector<Atom>& atoms,
                                                  const Logger& logger) {
  std::vector<AtomTypeAssignment> result(atoms.size());
  for (size_t i = 0; i != atoms.size(); ++i) {
    const Atom& atom = atoms[i];
    AtomTypeAssignment& assignment = result[i];
    for (const std::string& name : atom.whitelist)
      if (atom.blacklist.count(name) == 0)
        assignment.candidates.push_back(name);
    if (assignment.is_resolved())
      assignment.type = assignment.candidates[0];
    else if (assignment.candidates.empty())
      logger.note(atom_str(atom), " was not assigned any atom type");
    else
      logger.note(atom_str(atom), " has ambiguous atom type: ",
                  join_str(assignment.candidates, ' '));
  }
  return result;
}

int check_rules(const std::vector<Rule>& rules, const Logger& logger) {
  std::set<std::string> names;
  for (const Rule& rule : rules)
    if (!names.insert(rule.name).second)
      fail("duplicated rule: ", rule.name);
  int n = 0;
  for (const Rule& rule : rules)
    for (const std::string& other : rule.overrides)
      if (names.count(other) == 0) {
        logger.note(rule.name, " overrides unknown rule ", other);
        ++n;
      }
  return n;
}

} // namespace moltype
