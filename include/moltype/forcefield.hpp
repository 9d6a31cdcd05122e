// Copyright Global Phasing Ltd.
//
// Force field: a registry of atom types (with their pattern definitions),
// reading it from an atom-type table, resolving force-field names,
// and apply_forcefield() that types a structure and generates bonded terms.

#ifndef MOLTYPE_FORCEFIELD_HPP_
#define MOLTYPE_FORCEFIELD_HPP_

#include <map>
#include <set>
#include <string>
#include <vector>
#include "elem.hpp"       // for Element
#include "logger.hpp"
#include "rule.hpp"
#include "structure.hpp"
#include "terms.hpp"      // for TermOptions, BondedTerms
#include "typing.hpp"     // for TypingStats

namespace moltype {

struct AtomTypeDef {
  std::string name;          // e.g. opls_135
  std::string atom_class;    // e.g. CT, may be empty
  Element element = El::X;
  double mass = 0.;
  std::string definition;    // pattern; types with empty definition are not matched
  std::set<std::string> overrides;
  std::string description;
};

class AtomTypeRegistry {
public:
  /// Fails if a type with the same name is already registered.
  void register_atom_type(AtomTypeDef def);

  const AtomTypeDef* find(const std::string& name) const;
  /// Names of types in the class, in the order of registration.
  /// The class "" contains all types.
  const std::vector<std::string>& class_members(const std::string& cls) const;
  const std::vector<AtomTypeDef>& types() const { return types_; }
  size_t size() const { return types_.size(); }
  bool empty() const { return types_.empty(); }

private:
  std::vector<AtomTypeDef> types_;
  std::map<std::string, size_t> index_;
  std::map<std::string, std::vector<std::string>> classes_;
};

struct ForceField {
  std::string name;
  AtomTypeRegistry registry;

  /// Rules for all types that have a definition, in registry order,
  /// checked with check_rules(). A SyntaxError in a definition
  /// is re-thrown with the type name prepended to the message.
  std::vector<Rule> make_rules(const Logger& logger=Logger{}) const;
};

/// Reads a table of atom types: an optional data_NAME line and a single
/// loop_ with _atomtype.name and optional _atomtype.class, .element, .mass,
/// .def, .overrides (comma-separated) and .desc columns.
/// Throws tao::pegtl::parse_error (a std::runtime_error) on syntax errors
/// and std::runtime_error on invalid content.
ForceField read_forcefield_file(const std::string& path);
ForceField read_forcefield_string(const std::string& text,
                                  const std::string& source="string");

struct ForceFieldAlias {
  const char* alias;
  const char* canonical;
};

/// opls-aa, oplsaa, opls -> oplsaa; trappeua -> trappeua
const std::vector<ForceFieldAlias>& default_forcefield_aliases();

/// Returns the canonical name, or an empty string if the name is not known.
/// Names that contain one of the OPLS aliases map to oplsaa.
std::string canonical_forcefield_name(
    const std::string& name,
    const std::vector<ForceFieldAlias>& aliases=default_forcefield_aliases());

/// Path of the atom-type table for a force field name:
/// <canonical>.ff/atomtypes.cif in the current directory, if present,
/// otherwise in data_dir. Names that are not aliases are taken as paths.
std::string locate_forcefield(const std::string& name,
                              const std::vector<ForceFieldAlias>& aliases,
                              const std::string& data_dir);

struct ApplyResult {
  TypingStats stats;
  std::vector<AtomTypeAssignment> assignments;
};

/// Sets up neighbors, types all atoms (Atom::whitelist, blacklist and type)
/// and appends bonded terms to the structure. Structures without bonds
/// are typed with a warning.
ApplyResult apply_forcefield(Structure& st, const ForceField& ff,
                             const TermOptions& options=TermOptions(),
                             const Logger& logger=Logger{});

} // namespace moltype
#endif
