#pragma once

#include <solid/interfaces.h>

namespace solid {

class InterfaceSegregationChecker : public Checker {
public:
  Principle Covers() const override { return Principle::kIsp; }
  std::vector<Finding> Check(const Graph &graph) const override;
};

} // namespace solid
