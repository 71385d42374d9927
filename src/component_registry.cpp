#include <solid/component_registry.h>

#include <solid/dependency_inversion_checker.h>
#include <solid/interface_segregation_checker.h>
#include <solid/liskov_substitution_checker.h>
#include <solid/model_names.h>
#include <solid/open_closed_checker.h>
#include <solid/single_responsibility_checker.h>
#include <solid/standard_reporter.h>
#include <solid/tabular_declaration_reader.h>
#include <solid/yaml_declaration_reader.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace {

constexpr const char kYamlReader[] = "yaml";
constexpr const char kTabularReader[] = "tabular";
constexpr const char kDefaultReporter[] = "standard";

} // namespace

namespace solid {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind) {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterReader(const std::string &name,
                                       ReaderFactory factory,
                                       bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, readers_);
}

void ComponentRegistry::RegisterChecker(const std::string &name,
                                        CheckerFactory factory) {
  RegisterComponent(name, std::move(factory), false, checkers_);
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

std::unique_ptr<DeclarationReader>
ComponentRegistry::CreateReader(const std::string &name,
                                std::shared_ptr<Logger> logger) const {
  auto reader = FindFactory(name, readers_, "reader")(std::move(logger));
  if (!reader) {
    throw std::runtime_error("Factory for reader '" + name +
                             "' returned null");
  }
  return reader;
}

std::unique_ptr<Checker>
ComponentRegistry::CreateChecker(const std::string &name,
                                 const RuleOptions &options) const {
  if (name.empty()) {
    throw std::invalid_argument("Rule name cannot be empty");
  }
  auto checker = FindFactory(name, checkers_, "rule")(options);
  if (!checker) {
    throw std::runtime_error("Factory for rule '" + name + "' returned null");
  }
  return checker;
}

std::vector<std::unique_ptr<Checker>>
ComponentRegistry::CreateCheckers(const std::vector<std::string> &names,
                                  const RuleOptions &options) const {
  const auto selected = names.empty() ? CheckerNames() : names;
  std::unordered_set<std::string> seen;
  std::vector<std::unique_ptr<Checker>> checkers;
  for (const auto &name : selected) {
    if (!seen.insert(name).second) {
      continue;
    }
    checkers.push_back(CreateChecker(name, options));
  }
  return checkers;
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  auto reporter = FindFactory(name, reporters_, "reporter")();
  if (!reporter) {
    throw std::runtime_error("Factory for reporter '" + name +
                             "' returned null");
  }
  return reporter;
}

std::vector<std::string> ComponentRegistry::ReaderNames() const {
  return RegisteredNames(readers_);
}

std::vector<std::string> ComponentRegistry::CheckerNames() const {
  return RegisteredNames(checkers_);
}

const std::string &ComponentRegistry::DefaultReaderName() const {
  return readers_.default_name;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

std::string ReaderNameForInput(const std::string &path) {
  const auto extension =
      NormalizeToken(std::filesystem::path(path).extension().string());
  if (extension == ".yaml" || extension == ".yml") {
    return kYamlReader;
  }
  return kTabularReader;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterReader(
      kYamlReader,
      [](std::shared_ptr<Logger> logger) {
        return std::make_unique<YamlDeclarationReader>(std::move(logger));
      },
      true);
  registry.RegisterReader(kTabularReader, [](std::shared_ptr<Logger> logger) {
    return std::make_unique<TabularDeclarationReader>(std::move(logger));
  });

  registry.RegisterChecker(RuleName(Principle::kSrp),
                           [](const RuleOptions &options) {
                             return std::make_unique<
                                 SingleResponsibilityChecker>(
                                 options.responsibility_suffixes);
                           });
  registry.RegisterChecker(RuleName(Principle::kOcp), [](const RuleOptions &) {
    return std::make_unique<OpenClosedChecker>();
  });
  registry.RegisterChecker(RuleName(Principle::kLsp), [](const RuleOptions &) {
    return std::make_unique<LiskovSubstitutionChecker>();
  });
  registry.RegisterChecker(RuleName(Principle::kIsp), [](const RuleOptions &) {
    return std::make_unique<InterfaceSegregationChecker>();
  });
  registry.RegisterChecker(RuleName(Principle::kDip), [](const RuleOptions &) {
    return std::make_unique<DependencyInversionChecker>();
  });

  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<StandardReporter>(); },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace solid
