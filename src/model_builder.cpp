#include <solid/model_builder.h>

#include <algorithm>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace solid {
namespace {

using TypeTable = std::map<std::string, TypeNode>;

std::string At(const std::string &location) {
  if (location.empty()) {
    return {};
  }
  return " at " + location;
}

std::string Join(const std::vector<std::string> &names,
                 const std::string &delimiter) {
  std::string path;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      path += delimiter;
    }
    path += names[i];
  }
  return path;
}

TypeNode &RequireOwner(TypeTable &types, const std::string &owner,
                       const std::string &record, const std::string &name,
                       const std::string &location) {
  const auto found = types.find(owner);
  if (found == types.end()) {
    throw MalformedInputError(record + " '" + name +
                                  "' refers to unknown owner '" + owner + "'" +
                                  At(location),
                              {owner});
  }
  return found->second;
}

void AddTypes(const std::vector<TypeDeclaration> &declarations,
              TypeTable &types) {
  for (const auto &declaration : declarations) {
    if (declaration.name.empty()) {
      throw MalformedInputError("Type declaration without a name" +
                                    At(declaration.location),
                                {});
    }
    TypeNode node;
    node.name = declaration.name;
    node.kind = declaration.kind;
    node.layer = declaration.layer;
    node.location = declaration.location;
    const auto [existing, inserted] = types.emplace(declaration.name, node);
    if (!inserted) {
      throw MalformedInputError("Duplicate type '" + declaration.name + "'" +
                                    At(declaration.location) +
                                    " (first declared" +
                                    At(existing->second.location) + ")",
                                {declaration.name});
    }
  }
}

void AddMethods(const std::vector<MethodDeclaration> &declarations,
                TypeTable &types) {
  for (const auto &declaration : declarations) {
    auto &owner = RequireOwner(types, declaration.owner, "Method",
                               declaration.name, declaration.location);
    if (declaration.name.empty()) {
      throw MalformedInputError("Method without a name on '" + owner.name +
                                    "'" + At(declaration.location),
                                {owner.name});
    }
    if (declaration.arity < 0) {
      throw MalformedInputError("Method '" + owner.name + "." +
                                    declaration.name +
                                    "' has a negative arity" +
                                    At(declaration.location),
                                {owner.name, declaration.name});
    }
    const bool duplicate = std::any_of(
        owner.methods.begin(), owner.methods.end(), [&](const MethodNode &m) {
          return m.name == declaration.name && m.arity == declaration.arity;
        });
    if (duplicate) {
      throw MalformedInputError(
          "Duplicate method '" + owner.name + "." + declaration.name + "/" +
              std::to_string(declaration.arity) + "'" +
              At(declaration.location),
          {owner.name, declaration.name});
    }
    owner.methods.push_back(MethodNode{declaration.name, declaration.arity,
                                       declaration.return_kind,
                                       declaration.behavior,
                                       declaration.location});
  }
}

void AddFields(const std::vector<FieldDeclaration> &declarations,
               TypeTable &types) {
  for (const auto &declaration : declarations) {
    auto &owner = RequireOwner(types, declaration.owner, "Field",
                               declaration.name, declaration.location);
    owner.fields.push_back(FieldNode{declaration.name, declaration.type_name});
  }
}

void AddInheritance(const std::vector<InheritanceDeclaration> &declarations,
                    TypeTable &types) {
  for (const auto &declaration : declarations) {
    auto &child = RequireOwner(types, declaration.child, "Supertype",
                               declaration.parent, declaration.location);
    if (types.find(declaration.parent) == types.end()) {
      throw MalformedInputError("Type '" + child.name +
                                    "' extends unknown type '" +
                                    declaration.parent + "'" +
                                    At(declaration.location),
                                {declaration.parent});
    }
    if (std::find(child.supertypes.begin(), child.supertypes.end(),
                  declaration.parent) != child.supertypes.end()) {
      continue;
    }
    child.supertypes.push_back(declaration.parent);
  }
}

void ValidateInheritanceKinds(const TypeTable &types) {
  for (const auto &[name, type] : types) {
    std::vector<std::string> class_parents;
    for (const auto &supertype : type.supertypes) {
      const auto &parent = types.at(supertype);
      if (parent.kind != TypeKind::kClass) {
        continue;
      }
      if (type.kind == TypeKind::kInterface) {
        throw MalformedInputError("Interface '" + name +
                                      "' cannot extend class '" + supertype +
                                      "'" + At(type.location),
                                  {name, supertype});
      }
      class_parents.push_back(supertype);
    }
    if (class_parents.size() > 1) {
      std::vector<std::string> offending{name};
      offending.insert(offending.end(), class_parents.begin(),
                       class_parents.end());
      throw MalformedInputError("Class '" + name +
                                    "' extends more than one class: " +
                                    Join(class_parents, ", ") +
                                    At(type.location),
                                offending);
    }
  }
}

// Depth-first traversal with visiting/visited colouring over supertype edges.
class CycleDetector {
public:
  explicit CycleDetector(const TypeTable &types) : types_(types) {}

  void Run() {
    for (const auto &entry : types_) {
      if (colors_[entry.first] == Color::kUnvisited) {
        Visit(entry.second);
      }
    }
  }

private:
  enum class Color { kUnvisited, kVisiting, kVisited };

  void Visit(const TypeNode &type) {
    colors_[type.name] = Color::kVisiting;
    path_.push_back(type.name);
    for (const auto &supertype : type.supertypes) {
      const auto color = colors_[supertype];
      if (color == Color::kVisiting) {
        ReportCycle(supertype);
      }
      if (color == Color::kUnvisited) {
        Visit(types_.at(supertype));
      }
    }
    path_.pop_back();
    colors_[type.name] = Color::kVisited;
  }

  [[noreturn]] void ReportCycle(const std::string &entry) const {
    const auto start = std::find(path_.begin(), path_.end(), entry);
    std::vector<std::string> members(start, path_.end());
    auto cycle = members;
    cycle.push_back(entry);
    throw MalformedInputError("Inheritance cycle: " + Join(cycle, " -> "),
                              members);
  }

  const TypeTable &types_;
  std::unordered_map<std::string, Color> colors_;
  std::vector<std::string> path_;
};

} // namespace

ModelBuilder::ModelBuilder(ModelBuilderOptions options,
                           std::shared_ptr<Logger> logger)
    : options_(options), logger_(EnsureLogger(std::move(logger))) {}

Graph ModelBuilder::Build(const DeclarationListing &listing) const {
  TypeTable types;
  AddTypes(listing.types, types);
  AddMethods(listing.methods, types);
  AddFields(listing.fields, types);
  AddInheritance(listing.inheritance, types);
  ValidateInheritanceKinds(types);
  CycleDetector(types).Run();

  for (const auto &declaration : listing.dependencies) {
    auto &owner = RequireOwner(types, declaration.owner, "Dependency",
                               declaration.target, declaration.location);
    if (declaration.target.empty()) {
      throw MalformedInputError("Dependency without a target on '" +
                                    owner.name + "'" +
                                    At(declaration.location),
                                {owner.name});
    }
    if (types.find(declaration.target) == types.end()) {
      if (options_.strict_dependencies) {
        throw MalformedInputError("Type '" + owner.name +
                                      "' depends on unknown type '" +
                                      declaration.target + "'" +
                                      At(declaration.location),
                                  {declaration.target});
      }
      logger_->Log(LogLevel::kDebug, "model.dependency.external",
                   {{"owner", owner.name}, {"target", declaration.target}});
    }
    if (std::find(owner.dependencies.begin(), owner.dependencies.end(),
                  declaration.target) == owner.dependencies.end()) {
      owner.dependencies.push_back(declaration.target);
    }
  }

  std::vector<TypeNode> nodes;
  nodes.reserve(types.size());
  for (auto &entry : types) {
    nodes.push_back(std::move(entry.second));
  }
  Graph graph(std::move(nodes));
  const auto statistics = graph.Statistics();
  logger_->Log(LogLevel::kInfo, "model.built",
               {{"source", listing.source},
                {"types", std::to_string(statistics.types)},
                {"methods", std::to_string(statistics.methods)},
                {"inheritance_edges",
                 std::to_string(statistics.inheritance_edges)}});
  return graph;
}

} // namespace solid
