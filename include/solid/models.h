#pragma once

#include <solid/logging.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace solid {

enum class TypeKind { kClass, kInterface };

enum class TypeLayer { kUnspecified, kService, kTechnical };

enum class BodyBehavior { kNormal, kThrowsUnsupported, kNoOp, kTypeSwitch };

enum class Principle { kSrp, kOcp, kLsp, kIsp, kDip };

enum class Severity { kInfo = 0, kWarning = 1, kError = 2 };

enum class Verdict { kClean, kViolations };

struct TypeDeclaration {
  std::string name;
  TypeKind kind = TypeKind::kClass;
  TypeLayer layer = TypeLayer::kUnspecified;
  std::string location;
};

struct MethodDeclaration {
  std::string owner;
  std::string name;
  int arity = 0;
  std::string return_kind;
  BodyBehavior behavior = BodyBehavior::kNormal;
  std::string location;
};

struct FieldDeclaration {
  std::string owner;
  std::string name;
  std::string type_name;
  std::string location;
};

struct InheritanceDeclaration {
  std::string child;
  std::string parent;
  std::string location;
};

struct DependencyDeclaration {
  std::string owner;
  std::string target;
  std::string location;
};

struct DeclarationListing {
  std::string source;
  std::vector<TypeDeclaration> types;
  std::vector<MethodDeclaration> methods;
  std::vector<FieldDeclaration> fields;
  std::vector<InheritanceDeclaration> inheritance;
  std::vector<DependencyDeclaration> dependencies;
};

struct Finding {
  Principle principle = Principle::kSrp;
  Severity severity = Severity::kWarning;
  std::string type_name;
  std::string member;
  std::string message;
};

struct GraphStatistics {
  std::size_t types = 0;
  std::size_t interfaces = 0;
  std::size_t methods = 0;
  std::size_t inheritance_edges = 0;
  std::size_t dependency_edges = 0;
};

struct AnalysisResult {
  std::vector<Finding> findings;
  Verdict verdict = Verdict::kClean;
  GraphStatistics statistics;
  std::vector<std::string> rules;
};

struct Report {
  std::string text;
  std::string markdown;
  std::string json;
};

using SuffixCategories = std::map<std::string, std::vector<std::string>>;

struct RuleOptions {
  SuffixCategories responsibility_suffixes;
  std::map<Principle, Severity> severity_overrides;
  bool parallel = false;
};

struct AnalysisConfig {
  std::string input_path;
  std::vector<std::string> formats;
  std::string scope_notes;
  std::vector<std::string> rules;
  bool strict_dependencies = false;
  RuleOptions rule_options;
  std::shared_ptr<Logger> logger;
  std::string config_file;
};

struct PipelineResult {
  Report report;
  AnalysisResult analysis;
};

} // namespace solid
