#include <solid/default_analyzer_pipeline.h>
#include <solid/model_builder.h>

#include <chrono>
#include <utility>

namespace solid {

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : reader_(std::move(components.reader)),
      analyzer_(std::move(components.analyzer)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))) {}

PipelineResult DefaultAnalyzerPipeline::Run(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"input", config.input_path},
                {"formats", std::to_string(config.formats.size())}});
  const auto pipeline_start = std::chrono::steady_clock::now();

  DeclarationListing listing;
  {
    StageTimer timer(logger_, "read");
    listing = reader_->Read(config);
    timer.AddField("types", std::to_string(listing.types.size()));
  }

  Graph graph;
  {
    StageTimer timer(logger_, "build");
    const ModelBuilder builder(
        ModelBuilderOptions{config.strict_dependencies}, logger_);
    graph = builder.Build(listing);
  }

  AnalysisResult analysis;
  {
    StageTimer timer(logger_, "analyze");
    analysis = aggregator_.Aggregate(analyzer_->Analyze(graph));
    timer.AddField("findings", std::to_string(analysis.findings.size()));
  }

  Report report;
  {
    StageTimer timer(logger_, "render");
    report = reporter_->Render(analysis, config);
  }

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"findings", std::to_string(analysis.findings.size())}});

  return PipelineResult{report, analysis};
}

} // namespace solid
