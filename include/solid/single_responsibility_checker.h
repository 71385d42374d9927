#pragma once

#include <solid/interfaces.h>

#include <string>

namespace solid {

// Persistence, messaging and remote-access suffix families; any other
// dependency name counts as "domain".
SuffixCategories DefaultResponsibilitySuffixes();

// Returns the category whose suffix is the longest case-insensitive match for
// `type_name`, or "domain" when none matches.
std::string ResponsibilityCategory(const SuffixCategories &categories,
                                   const std::string &type_name);

// Flags types whose dependencies span two or more responsibility categories.
// Categories come from dependency type names only, so this approximates a
// semantic judgement and will miss or over-report some designs.
class SingleResponsibilityChecker : public Checker {
public:
  explicit SingleResponsibilityChecker(SuffixCategories categories = {});

  Principle Covers() const override { return Principle::kSrp; }
  std::vector<Finding> Check(const Graph &graph) const override;

private:
  SuffixCategories categories_;
};

} // namespace solid
