#include <solid/analyzer_pipeline_builder.h>

#include <solid/default_analyzer_pipeline.h>
#include <solid/rule_engine.h>

#include <utility>

namespace solid {

AnalyzerPipelineBuilder::AnalyzerPipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry) {
  selections_.reader = registry_->DefaultReaderName();
  selections_.reporter = registry_->DefaultReporterName();
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReader(std::unique_ptr<DeclarationReader> reader) {
  components_.reader = std::move(reader);
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithAnalyzer(
    std::unique_ptr<DesignAnalyzer> analyzer) {
  components_.analyzer = std::move(analyzer);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReaderName(std::string name) {
  selections_.reader = std::move(name);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporterName(std::string name) {
  selections_.reporter = std::move(name);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithRules(std::vector<std::string> rules) {
  selections_.rules = std::move(rules);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithRuleOptions(RuleOptions options) {
  rule_options_ = std::move(options);
  return *this;
}

DefaultAnalyzerPipeline AnalyzerPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.reader =
      components_.reader
          ? std::move(components_.reader)
          : registry_->CreateReader(selections_.reader, components_.logger);
  components_.analyzer =
      components_.analyzer
          ? std::move(components_.analyzer)
          : std::make_unique<RuleEngine>(
                registry_->CreateCheckers(selections_.rules, rule_options_),
                rule_options_, components_.logger);
  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : registry_->CreateReporter(selections_.reporter);
  return DefaultAnalyzerPipeline(std::move(components_));
}

} // namespace solid
