#pragma once

#include <solid/logging.h>
#include <solid/models.h>

#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace solid {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> input;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> scope_notes;
  std::vector<std::string> formats;
  std::vector<std::string> rules;
  std::optional<std::string> reader;
  std::optional<std::string> reporter;
  std::optional<LogLevel> log_level;
  std::optional<bool> parallel;
  std::optional<bool> strict_dependencies;
  std::map<Principle, Severity> severities;
  SuffixCategories responsibility_suffixes;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options);
RuleOptions BuildRuleOptions(const AnalyzeOptions &options);
AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   std::shared_ptr<Logger> logger);

int RunAnalyze(const std::vector<std::string> &arguments,
               std::ostream &output = std::cout);
int RunRules(const std::vector<std::string> &arguments,
             std::ostream &output = std::cout);

} // namespace solid
