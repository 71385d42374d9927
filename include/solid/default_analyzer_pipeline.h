#pragma once

#include <solid/analyzer_pipeline_builder.h>
#include <solid/finding_aggregator.h>

#include <memory>

namespace solid {

class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  PipelineResult Run(const AnalysisConfig &config) override;

private:
  std::unique_ptr<DeclarationReader> reader_;
  std::unique_ptr<DesignAnalyzer> analyzer_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  FindingAggregator aggregator_;
};

} // namespace solid
