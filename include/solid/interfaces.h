#pragma once

#include <solid/graph.h>
#include <solid/models.h>

#include <string>
#include <vector>

namespace solid {

class DeclarationReader {
public:
  virtual ~DeclarationReader() = default;
  virtual DeclarationListing Read(const AnalysisConfig &config) = 0;
};

// A checker inspects the graph for one principle. Implementations keep no
// mutable state so several checkers can share one graph across threads.
class Checker {
public:
  virtual ~Checker() = default;
  virtual Principle Covers() const = 0;
  virtual std::vector<Finding> Check(const Graph &graph) const = 0;
};

class DesignAnalyzer {
public:
  virtual ~DesignAnalyzer() = default;
  virtual AnalysisResult Analyze(const Graph &graph) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const AnalysisResult &analysis,
                        const AnalysisConfig &config) = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual PipelineResult Run(const AnalysisConfig &config) = 0;
};

} // namespace solid
