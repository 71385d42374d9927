#pragma once

#include <solid/interfaces.h>

namespace solid {

class LiskovSubstitutionChecker : public Checker {
public:
  Principle Covers() const override { return Principle::kLsp; }
  std::vector<Finding> Check(const Graph &graph) const override;
};

} // namespace solid
