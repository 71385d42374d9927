#include <solid/graph.h>

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

namespace solid {

Graph::Graph(std::vector<TypeNode> types) : types_(std::move(types)) {
  std::sort(types_.begin(), types_.end(),
            [](const TypeNode &left, const TypeNode &right) {
              return left.name < right.name;
            });
  for (std::size_t i = 0; i < types_.size(); ++i) {
    index_.emplace(types_[i].name, i);
  }
  for (std::size_t i = 0; i < types_.size(); ++i) {
    for (const auto &supertype : types_[i].supertypes) {
      subtypes_[supertype].push_back(i);
    }
  }
}

const TypeNode *Graph::FindType(const std::string &name) const {
  const auto found = index_.find(name);
  if (found == index_.end()) {
    return nullptr;
  }
  return &types_[found->second];
}

const MethodNode *Graph::FindMethod(const TypeNode &type,
                                    const std::string &name,
                                    int arity) const {
  const auto found =
      std::find_if(type.methods.begin(), type.methods.end(),
                   [&](const MethodNode &method) {
                     return method.name == name && method.arity == arity;
                   });
  if (found == type.methods.end()) {
    return nullptr;
  }
  return &*found;
}

ResolvedMethod Graph::ResolveMethod(const TypeNode &type,
                                    const std::string &name,
                                    int arity) const {
  if (const auto *own = FindMethod(type, name, arity)) {
    return ResolvedMethod{&type, own};
  }
  for (const auto *ancestor : Ancestors(type)) {
    if (const auto *inherited = FindMethod(*ancestor, name, arity)) {
      return ResolvedMethod{ancestor, inherited};
    }
  }
  return ResolvedMethod{};
}

std::vector<const TypeNode *> Graph::Ancestors(const TypeNode &type) const {
  std::vector<const TypeNode *> ancestors;
  std::unordered_set<std::string> seen{type.name};
  std::deque<const TypeNode *> pending{&type};
  while (!pending.empty()) {
    const auto *current = pending.front();
    pending.pop_front();
    for (const auto &supertype : current->supertypes) {
      if (!seen.insert(supertype).second) {
        continue;
      }
      const auto *parent = FindType(supertype);
      if (parent == nullptr) {
        continue;
      }
      ancestors.push_back(parent);
      pending.push_back(parent);
    }
  }
  return ancestors;
}

std::vector<const TypeNode *>
Graph::Implementers(const TypeNode &abstraction) const {
  std::vector<std::size_t> found;
  std::unordered_set<std::size_t> seen;
  std::deque<std::string> pending{abstraction.name};
  while (!pending.empty()) {
    const auto subtypes = subtypes_.find(pending.front());
    pending.pop_front();
    if (subtypes == subtypes_.end()) {
      continue;
    }
    for (const auto index : subtypes->second) {
      if (seen.insert(index).second) {
        found.push_back(index);
        pending.push_back(types_[index].name);
      }
    }
  }
  std::sort(found.begin(), found.end());

  std::vector<const TypeNode *> implementers;
  implementers.reserve(found.size());
  for (const auto index : found) {
    implementers.push_back(&types_[index]);
  }
  return implementers;
}

std::vector<InheritanceEdge> Graph::InheritanceEdges() const {
  std::vector<InheritanceEdge> edges;
  for (const auto &type : types_) {
    for (const auto &supertype : type.supertypes) {
      edges.push_back(InheritanceEdge{type.name, supertype});
    }
  }
  return edges;
}

std::vector<DependencyEdge> Graph::DependencyEdges() const {
  std::vector<DependencyEdge> edges;
  for (const auto &type : types_) {
    for (const auto &target : type.dependencies) {
      edges.push_back(DependencyEdge{type.name, target});
    }
  }
  return edges;
}

GraphStatistics Graph::Statistics() const {
  GraphStatistics statistics;
  statistics.types = types_.size();
  for (const auto &type : types_) {
    if (type.kind == TypeKind::kInterface) {
      ++statistics.interfaces;
    }
    statistics.methods += type.methods.size();
    statistics.inheritance_edges += type.supertypes.size();
    statistics.dependency_edges += type.dependencies.size();
  }
  return statistics;
}

} // namespace solid
