#include <solid/open_closed_checker.h>

#include <algorithm>

namespace solid {
namespace {

bool HasClassImplementer(const Graph &graph, const TypeNode &abstraction) {
  const auto implementers = graph.Implementers(abstraction);
  return std::any_of(implementers.begin(), implementers.end(),
                     [](const TypeNode *implementer) {
                       return implementer->kind == TypeKind::kClass;
                     });
}

} // namespace

std::vector<Finding> OpenClosedChecker::Check(const Graph &graph) const {
  std::vector<Finding> findings;
  for (const auto &type : graph.Types()) {
    // An interface implemented by some class already dispatches
    // polymorphically; the tag on its method describes the contract only.
    if (type.kind == TypeKind::kInterface && HasClassImplementer(graph, type)) {
      continue;
    }
    for (const auto &method : type.methods) {
      if (method.behavior != BodyBehavior::kTypeSwitch) {
        continue;
      }
      Finding finding{};
      finding.principle = Principle::kOcp;
      finding.severity = Severity::kWarning;
      finding.type_name = type.name;
      finding.member = method.name;
      finding.message = "'" + type.name + "." + method.name +
                        "' branches on type; consider polymorphic dispatch "
                        "via an interface.";
      findings.push_back(finding);
    }
  }
  return findings;
}

} // namespace solid
