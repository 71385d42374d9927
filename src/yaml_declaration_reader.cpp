#include <solid/errors.h>
#include <solid/model_names.h>
#include <solid/yaml_declaration_reader.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace solid {
namespace {

class ListingParser {
public:
  ListingParser(std::string source, DeclarationListing &listing)
      : source_(std::move(source)), listing_(listing) {}

  void ParseRoot(const YAML::Node &root) {
    if (root.IsNull()) {
      return;
    }
    if (!root.IsMap()) {
      Fail("Listing must contain a mapping at the root", root);
    }
    for (const auto &entry : root) {
      const auto key = NormalizeToken(entry.first.as<std::string>());
      const auto &value = entry.second;
      if (key == "types") {
        ForEach(value, key, [&](const YAML::Node &node) { ParseType(node); });
      } else if (key == "methods") {
        ForEach(value, key, [&](const YAML::Node &node) {
          ParseMethod(node, RequireString(node, "owner"));
        });
      } else if (key == "fields") {
        ForEach(value, key, [&](const YAML::Node &node) {
          ParseField(node, RequireString(node, "owner"));
        });
      } else if (key == "inheritance") {
        ForEach(value, key, [&](const YAML::Node &node) {
          listing_.inheritance.push_back(InheritanceDeclaration{
              RequireString(node, "child"), RequireString(node, "parent"),
              Location(node)});
        });
      } else if (key == "dependencies") {
        ForEach(value, key, [&](const YAML::Node &node) {
          listing_.dependencies.push_back(DependencyDeclaration{
              RequireString(node, "owner"), RequireString(node, "target"),
              Location(node)});
        });
      } else {
        Fail("Unknown listing section '" + entry.first.as<std::string>() +
                 "'. Supported sections: types, methods, fields, "
                 "inheritance, dependencies",
             entry.first);
      }
    }
  }

private:
  template <typename Handler>
  void ForEach(const YAML::Node &node, const std::string &section,
               Handler handler) {
    if (node.IsNull()) {
      return;
    }
    if (!node.IsSequence()) {
      Fail("Section '" + section + "' must be a list", node);
    }
    for (const auto &child : node) {
      handler(child);
    }
  }

  void ParseType(const YAML::Node &node) {
    if (!node.IsMap()) {
      Fail("Type entries must be mappings", node);
    }
    TypeDeclaration type;
    type.name = RequireString(node, "name");
    type.location = Location(node);
    type.kind = Converted(node, "kind", ParseTypeKind);
    type.layer = Converted(node, "layer", ParseTypeLayer);
    listing_.types.push_back(type);

    for (const auto *key : {"extends", "implements"}) {
      for (const auto &parent : StringList(node[key], key)) {
        listing_.inheritance.push_back(
            InheritanceDeclaration{type.name, parent, Location(node[key])});
      }
    }

    if (const auto methods = node["methods"]) {
      ForEach(methods, "methods", [&](const YAML::Node &method) {
        ParseMethod(method, type.name);
      });
    }
    if (const auto fields = node["fields"]) {
      ForEach(fields, "fields", [&](const YAML::Node &field) {
        ParseField(field, type.name);
      });
    }
    if (const auto dependencies = node["dependencies"]) {
      ForEach(dependencies, "dependencies", [&](const YAML::Node &dependency) {
        const auto target = dependency.IsScalar()
                                ? dependency.as<std::string>()
                                : RequireString(dependency, "target");
        listing_.dependencies.push_back(
            DependencyDeclaration{type.name, target, Location(dependency)});
      });
    }
  }

  void ParseMethod(const YAML::Node &node, const std::string &owner) {
    MethodDeclaration method;
    method.owner = owner;
    method.location = Location(node);
    if (node.IsScalar()) {
      method.name = node.as<std::string>();
      listing_.methods.push_back(method);
      return;
    }
    if (!node.IsMap()) {
      Fail("Method entries must be names or mappings", node);
    }
    method.name = RequireString(node, "name");
    if (const auto arity = node["arity"]) {
      method.arity = arity.as<int>();
    }
    if (const auto returns = node["returns"]) {
      method.return_kind = returns.as<std::string>();
    }
    method.behavior = Converted(node, "body", ParseBodyBehavior);
    listing_.methods.push_back(method);
  }

  void ParseField(const YAML::Node &node, const std::string &owner) {
    if (!node.IsMap()) {
      Fail("Field entries must be mappings", node);
    }
    listing_.fields.push_back(FieldDeclaration{owner,
                                               RequireString(node, "name"),
                                               RequireString(node, "type"),
                                               Location(node)});
  }

  std::vector<std::string> StringList(const YAML::Node &node,
                                      const std::string &key) {
    std::vector<std::string> values;
    if (!node || node.IsNull()) {
      return values;
    }
    if (node.IsScalar()) {
      values.push_back(node.as<std::string>());
      return values;
    }
    if (!node.IsSequence()) {
      Fail("'" + key + "' must be a name or a list of names", node);
    }
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        Fail("'" + key + "' must be a list of names", child);
      }
      values.push_back(child.as<std::string>());
    }
    return values;
  }

  template <typename Parser>
  auto Converted(const YAML::Node &node, const std::string &key, Parser parse)
      -> decltype(parse(std::string{})) {
    const auto value = node[key];
    const auto raw = value ? value.as<std::string>() : std::string{};
    try {
      return parse(raw);
    } catch (const std::invalid_argument &ex) {
      Fail(ex.what(), value ? value : node);
    }
  }

  std::string RequireString(const YAML::Node &node, const std::string &key) {
    if (!node.IsMap()) {
      Fail("Expected a mapping with '" + key + "'", node);
    }
    const auto value = node[key];
    if (!value || !value.IsScalar() || value.as<std::string>().empty()) {
      Fail("Missing required key '" + key + "'", node);
    }
    return value.as<std::string>();
  }

  std::string Location(const YAML::Node &node) const {
    const auto mark = node.Mark();
    if (mark.is_null()) {
      return source_;
    }
    return source_ + ":" + std::to_string(mark.line + 1);
  }

  [[noreturn]] void Fail(const std::string &message,
                         const YAML::Node &node) const {
    throw MalformedInputError(message + " at " + Location(node), {});
  }

  std::string source_;
  DeclarationListing &listing_;
};

} // namespace

YamlDeclarationReader::YamlDeclarationReader(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

DeclarationListing YamlDeclarationReader::Read(const AnalysisConfig &config) {
  const std::filesystem::path path(config.input_path);
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open declaration listing: " +
                             path.string());
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  return Parse(content, path.string());
}

DeclarationListing
YamlDeclarationReader::Parse(const std::string &content,
                             const std::string &source) const {
  DeclarationListing listing;
  listing.source = source;
  try {
    ListingParser(source, listing).ParseRoot(YAML::Load(content));
  } catch (const YAML::Exception &ex) {
    throw MalformedInputError("Invalid YAML in " + source + ": " + ex.what(),
                              {});
  }
  logger_->Log(LogLevel::kDebug, "reader.complete",
               {{"reader", "yaml"},
                {"source", source},
                {"types", std::to_string(listing.types.size())},
                {"methods", std::to_string(listing.methods.size())}});
  return listing;
}

} // namespace solid
