#include <solid/model_names.h>
#include <solid/rule_engine.h>

#include <future>
#include <stdexcept>
#include <utility>

namespace solid {

RuleEngine::RuleEngine(std::vector<std::unique_ptr<Checker>> checkers,
                       RuleOptions options, std::shared_ptr<Logger> logger)
    : checkers_(std::move(checkers)), options_(std::move(options)),
      logger_(EnsureLogger(std::move(logger))) {
  for (const auto &checker : checkers_) {
    if (!checker) {
      throw std::invalid_argument("RuleEngine received a null checker");
    }
  }
}

std::vector<std::string> RuleEngine::RuleNames() const {
  std::vector<std::string> names;
  names.reserve(checkers_.size());
  for (const auto &checker : checkers_) {
    names.push_back(RuleName(checker->Covers()));
  }
  return names;
}

std::vector<std::vector<Finding>>
RuleEngine::RunSequential(const Graph &graph) const {
  std::vector<std::vector<Finding>> buffers;
  buffers.reserve(checkers_.size());
  for (const auto &checker : checkers_) {
    buffers.push_back(checker->Check(graph));
  }
  return buffers;
}

std::vector<std::vector<Finding>>
RuleEngine::RunParallel(const Graph &graph) const {
  std::vector<std::future<std::vector<Finding>>> tasks;
  tasks.reserve(checkers_.size());
  for (const auto &checker : checkers_) {
    const Checker *task_checker = checker.get();
    tasks.push_back(std::async(std::launch::async, [task_checker, &graph]() {
      return task_checker->Check(graph);
    }));
  }

  std::vector<std::vector<Finding>> buffers;
  buffers.reserve(tasks.size());
  for (auto &task : tasks) {
    buffers.push_back(task.get());
  }
  return buffers;
}

AnalysisResult RuleEngine::Analyze(const Graph &graph) {
  const auto buffers =
      options_.parallel ? RunParallel(graph) : RunSequential(graph);

  AnalysisResult result{};
  result.statistics = graph.Statistics();
  result.rules = RuleNames();
  for (std::size_t i = 0; i < buffers.size(); ++i) {
    logger_->Log(LogLevel::kDebug, "rule.complete",
                 {{"rule", result.rules[i]},
                  {"findings", std::to_string(buffers[i].size())}});
    for (auto finding : buffers[i]) {
      const auto override_severity =
          options_.severity_overrides.find(finding.principle);
      if (override_severity != options_.severity_overrides.end()) {
        finding.severity = override_severity->second;
      }
      result.findings.push_back(std::move(finding));
    }
  }
  if (!result.findings.empty()) {
    result.verdict = Verdict::kViolations;
  }
  return result;
}

} // namespace solid
