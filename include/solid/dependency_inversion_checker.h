#pragma once

#include <solid/interfaces.h>

namespace solid {

class DependencyInversionChecker : public Checker {
public:
  Principle Covers() const override { return Principle::kDip; }
  std::vector<Finding> Check(const Graph &graph) const override;
};

} // namespace solid
