#pragma once

#include <solid/interfaces.h>
#include <solid/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace solid {

// Runs every configured checker over one graph. With `parallel` set each
// checker runs as its own task writing to a private buffer; buffers are
// merged in checker order after all tasks have finished, so the output does
// not depend on scheduling.
class RuleEngine : public DesignAnalyzer {
public:
  explicit RuleEngine(std::vector<std::unique_ptr<Checker>> checkers,
                      RuleOptions options = {},
                      std::shared_ptr<Logger> logger = nullptr);

  AnalysisResult Analyze(const Graph &graph) override;

  std::vector<std::string> RuleNames() const;

private:
  std::vector<std::vector<Finding>> RunSequential(const Graph &graph) const;
  std::vector<std::vector<Finding>> RunParallel(const Graph &graph) const;

  std::vector<std::unique_ptr<Checker>> checkers_;
  RuleOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace solid
