#include <solid/interface_segregation_checker.h>
#include <solid/model_names.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace {

using MethodKey = std::pair<std::string, int>;

std::vector<MethodKey> InterfaceMethods(const solid::Graph &graph,
                                        const solid::TypeNode &abstraction) {
  std::vector<MethodKey> keys;
  const auto add = [&](const solid::TypeNode &type) {
    for (const auto &method : type.methods) {
      MethodKey key{method.name, method.arity};
      if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(std::move(key));
      }
    }
  };
  add(abstraction);
  for (const auto *ancestor : graph.Ancestors(abstraction)) {
    if (ancestor->kind == solid::TypeKind::kInterface) {
      add(*ancestor);
    }
  }
  return keys;
}

bool Honors(solid::BodyBehavior behavior) {
  return behavior == solid::BodyBehavior::kNormal ||
         behavior == solid::BodyBehavior::kTypeSwitch;
}

bool Refuses(solid::BodyBehavior behavior) {
  return behavior == solid::BodyBehavior::kThrowsUnsupported ||
         behavior == solid::BodyBehavior::kNoOp;
}

} // namespace

namespace solid {

std::vector<Finding>
InterfaceSegregationChecker::Check(const Graph &graph) const {
  std::vector<Finding> findings;
  for (const auto &abstraction : graph.Types()) {
    if (abstraction.kind != TypeKind::kInterface) {
      continue;
    }

    std::vector<const TypeNode *> implementers;
    for (const auto *type : graph.Implementers(abstraction)) {
      if (type->kind == TypeKind::kClass) {
        implementers.push_back(type);
      }
    }
    if (implementers.size() < 2) {
      continue;
    }

    for (const auto &key : InterfaceMethods(graph, abstraction)) {
      const auto &name = key.first;
      const auto arity = key.second;
      const bool used_by_sibling = std::any_of(
          implementers.begin(), implementers.end(), [&](const TypeNode *type) {
            const auto *own = graph.FindMethod(*type, name, arity);
            return own != nullptr && Honors(own->behavior);
          });
      if (!used_by_sibling) {
        continue;
      }

      for (const auto *type : implementers) {
        const auto *own = graph.FindMethod(*type, name, arity);
        if (own == nullptr || !Refuses(own->behavior)) {
          continue;
        }
        Finding finding{};
        finding.principle = Principle::kIsp;
        finding.severity = Severity::kWarning;
        finding.type_name = type->name;
        finding.member = name;
        finding.message = "'" + type->name + "' is forced to implement '" +
                          abstraction.name + "." + name +
                          "' which it does not use (" +
                          BodyBehaviorName(own->behavior) + ").";
        findings.push_back(finding);
      }
    }
  }
  return findings;
}

} // namespace solid
