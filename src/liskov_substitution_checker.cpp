#include <solid/liskov_substitution_checker.h>

namespace solid {

std::vector<Finding>
LiskovSubstitutionChecker::Check(const Graph &graph) const {
  std::vector<Finding> findings;
  for (const auto &edge : graph.InheritanceEdges()) {
    const auto *child = graph.FindType(edge.child);
    const auto *parent = graph.FindType(edge.parent);
    if (child == nullptr || parent == nullptr) {
      continue;
    }
    for (const auto &method : child->methods) {
      if (method.behavior != BodyBehavior::kThrowsUnsupported) {
        continue;
      }
      const auto contract =
          graph.ResolveMethod(*parent, method.name, method.arity);
      if (contract.method == nullptr) {
        continue;
      }
      // A contract that already refuses the operation promised nothing.
      if (contract.method->behavior == BodyBehavior::kThrowsUnsupported) {
        continue;
      }

      Finding finding{};
      finding.principle = Principle::kLsp;
      finding.severity = Severity::kError;
      finding.type_name = child->name;
      finding.member = method.name;
      finding.message = "'" + child->name + "' cannot honor the contract of '" +
                        contract.owner->name + "' for method '" + method.name +
                        "': the override signals an unsupported operation.";
      findings.push_back(finding);
    }
  }
  return findings;
}

} // namespace solid
