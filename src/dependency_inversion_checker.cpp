#include <solid/dependency_inversion_checker.h>

namespace solid {

std::vector<Finding>
DependencyInversionChecker::Check(const Graph &graph) const {
  std::vector<Finding> findings;
  for (const auto &edge : graph.DependencyEdges()) {
    if (edge.target == edge.owner) {
      continue;
    }
    const auto *owner = graph.FindType(edge.owner);
    if (owner == nullptr || owner->layer != TypeLayer::kService) {
      continue;
    }
    const auto *target = graph.FindType(edge.target);
    if (target == nullptr || target->kind != TypeKind::kClass) {
      continue;
    }

    Finding finding{};
    finding.principle = Principle::kDip;
    finding.severity = Severity::kWarning;
    finding.type_name = owner->name;
    finding.member = target->name;
    finding.message = "High-level type '" + owner->name +
                      "' depends on concrete low-level type '" +
                      target->name + "' instead of an abstraction.";
    findings.push_back(finding);
  }
  return findings;
}

} // namespace solid
