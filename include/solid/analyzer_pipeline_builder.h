#pragma once

#include <solid/component_registry.h>
#include <solid/interfaces.h>
#include <solid/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace solid {

class DefaultAnalyzerPipeline;

struct PipelineComponents {
  std::unique_ptr<DeclarationReader> reader;
  std::unique_ptr<DesignAnalyzer> analyzer;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
};

class AnalyzerPipelineBuilder {
public:
  explicit AnalyzerPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  AnalyzerPipelineBuilder &
  WithReader(std::unique_ptr<DeclarationReader> reader);
  AnalyzerPipelineBuilder &
  WithAnalyzer(std::unique_ptr<DesignAnalyzer> analyzer);
  AnalyzerPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalyzerPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalyzerPipelineBuilder &WithReaderName(std::string name);
  AnalyzerPipelineBuilder &WithReporterName(std::string name);
  AnalyzerPipelineBuilder &WithRules(std::vector<std::string> rules);
  AnalyzerPipelineBuilder &WithRuleOptions(RuleOptions options);

  DefaultAnalyzerPipeline Build();

private:
  const ComponentRegistry *registry_;
  struct ComponentSelections {
    std::string reader;
    std::string reporter;
    std::vector<std::string> rules;
  } selections_;
  RuleOptions rule_options_;
  PipelineComponents components_;
};

} // namespace solid
