#pragma once

#include <solid/interfaces.h>

namespace solid {

class OpenClosedChecker : public Checker {
public:
  Principle Covers() const override { return Principle::kOcp; }
  std::vector<Finding> Check(const Graph &graph) const override;
};

} // namespace solid
