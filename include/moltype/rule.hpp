// Copyright Global Phasing Ltd.
//
// Rule - named atom-type pattern with the set of rules it overrides.

#ifndef MOLTYPE_RULE_HPP_
#define MOLTYPE_RULE_HPP_

#include <memory>
#include <set>
#include <string>
#include "pattern.hpp"

namespace moltype {

struct Rule {
  std::string name;
  // shared, so that copies of rule lists do not re-parse patterns
  std::shared_ptr<const Pattern> pattern;
  // names of rules whose match is revoked when this rule matches
  std::set<std::string> overrides;

  Rule(const std::string& name_, const std::string& pattern_text,
       std::set<std::string> overrides_={})
    : name(name_),
      pattern(std::make_shared<const Pattern>(parse_pattern(pattern_text))),
      overrides(std::move(overrides_)) {}

  bool does_override(const std::string& other) const {
    return overrides.count(other) != 0;
  }
};

} // namespace moltype
#endif
