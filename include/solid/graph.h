#pragma once

#include <solid/models.h>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace solid {

struct MethodNode {
  std::string name;
  int arity = 0;
  std::string return_kind;
  BodyBehavior behavior = BodyBehavior::kNormal;
  std::string location;
};

struct FieldNode {
  std::string name;
  std::string type_name;
};

struct TypeNode {
  std::string name;
  TypeKind kind = TypeKind::kClass;
  TypeLayer layer = TypeLayer::kUnspecified;
  std::string location;
  std::vector<MethodNode> methods;
  std::vector<FieldNode> fields;
  std::vector<std::string> supertypes;
  std::vector<std::string> dependencies;
};

struct InheritanceEdge {
  std::string child;
  std::string parent;
};

struct DependencyEdge {
  std::string owner;
  std::string target;
};

struct ResolvedMethod {
  const TypeNode *owner = nullptr;
  const MethodNode *method = nullptr;
};

// Read-only type table. Types are kept sorted by name so every traversal is
// deterministic; supertypes and dependencies are weak references by name and
// are resolved against the table on lookup.
class Graph {
public:
  Graph() = default;
  explicit Graph(std::vector<TypeNode> types);

  const std::vector<TypeNode> &Types() const { return types_; }
  const TypeNode *FindType(const std::string &name) const;

  const MethodNode *FindMethod(const TypeNode &type, const std::string &name,
                               int arity) const;

  // Looks up the declaration on `type` first, then on its ancestors nearest
  // first. Returns an empty result when no type in the chain declares it.
  ResolvedMethod ResolveMethod(const TypeNode &type, const std::string &name,
                               int arity) const;

  // Breadth-first, nearest first, each ancestor listed once.
  std::vector<const TypeNode *> Ancestors(const TypeNode &type) const;
  // Every direct or indirect subtype of `abstraction`, in name order.
  std::vector<const TypeNode *> Implementers(const TypeNode &abstraction) const;

  std::vector<InheritanceEdge> InheritanceEdges() const;
  std::vector<DependencyEdge> DependencyEdges() const;
  GraphStatistics Statistics() const;

private:
  std::vector<TypeNode> types_;
  std::unordered_map<std::string, std::size_t> index_;
  std::unordered_map<std::string, std::vector<std::size_t>> subtypes_;
};

} // namespace solid
