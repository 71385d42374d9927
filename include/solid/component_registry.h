#pragma once

#include <solid/interfaces.h>
#include <solid/logging.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace solid {

class ComponentRegistry {
public:
  using ReaderFactory = std::function<std::unique_ptr<DeclarationReader>(
      std::shared_ptr<Logger>)>;
  using CheckerFactory =
      std::function<std::unique_ptr<Checker>(const RuleOptions &)>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  void RegisterReader(const std::string &name, ReaderFactory factory,
                      bool set_as_default = false);
  void RegisterChecker(const std::string &name, CheckerFactory factory);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<DeclarationReader>
  CreateReader(const std::string &name = "",
               std::shared_ptr<Logger> logger = nullptr) const;
  std::unique_ptr<Checker> CreateChecker(const std::string &name,
                                         const RuleOptions &options) const;
  // Every registered checker when `names` is empty; duplicates are ignored.
  std::vector<std::unique_ptr<Checker>>
  CreateCheckers(const std::vector<std::string> &names,
                 const RuleOptions &options) const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> ReaderNames() const;
  std::vector<std::string> CheckerNames() const;

  const std::string &DefaultReaderName() const;
  const std::string &DefaultReporterName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static const Factory &FindFactory(const std::string &name,
                                    const ComponentSet<Factory> &set,
                                    const std::string &kind);

  template <typename Factory>
  static void RegisterComponent(const std::string &name, Factory factory,
                                bool set_as_default,
                                ComponentSet<Factory> &set);

  ComponentSet<ReaderFactory> readers_;
  ComponentSet<CheckerFactory> checkers_;
  ComponentSet<ReporterFactory> reporters_;
};

// "yaml" for .yaml/.yml listings, "tabular" for everything else.
std::string ReaderNameForInput(const std::string &path);

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace solid
