#include <solid/analyzer_pipeline_builder.h>
#include <solid/cli_exit_codes.h>
#include <solid/component_registry.h>
#include <solid/default_analyzer_pipeline.h>
#include <solid/model_names.h>
#include <solid/solid_lint.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using solid::AnalyzeOptions;

void PrintAnalyzeUsage(std::ostream &output) {
  output
      << "Usage: solid-lint [analyze] <listing> [options]\n"
      << "Options:\n"
      << "  --input <path>        Declaration listing (.yaml/.yml or tabular)\n"
      << "  --format <list>       Comma-separated list of output formats\n"
      << "                        (supported: text,markdown,json; default: "
         "text)\n"
      << "  --out <path>          Write solid_report.* files to this "
         "directory\n"
      << "                        instead of printing to stdout\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --rules <list>        Comma-separated rules to run (default: all;\n"
      << "                        see 'solid-lint rules')\n"
      << "  --reader <name>       Listing reader (yaml, tabular; default: by\n"
      << "                        file extension)\n"
      << "  --reporter <name>     Report renderer (default: standard)\n"
      << "  --parallel            Run each rule as its own task\n"
      << "  --strict-dependencies Reject dependencies on undeclared types\n"
      << "  --scope-notes <text>  Scope notes to embed in the report header\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n"
      << "Exit codes: 0 no findings, 1 findings reported, 2 error.\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const unsigned char character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(static_cast<char>(std::tolower(character)));
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = Trim(format);
    if (format != "text" && format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        solid::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = solid::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = solid::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleComponentSelection(const std::vector<std::string> &arguments,
                              std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--reader") {
    options.reader = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--rules") {
    AppendValues(RequireValue(arguments, index, argument), options.rules);
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--input") {
    options.input = RequireValue(arguments, index, "--input");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--scope-notes") {
    options.scope_notes = RequireValue(arguments, index, "--scope-notes");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  if (argument == "--parallel") {
    options.parallel = true;
    return true;
  }
  if (argument == "--strict-dependencies") {
    options.strict_dependencies = true;
    return true;
  }
  if (HandleLoggingOption(arguments, index, options)) {
    return true;
  }
  if (HandleComponentSelection(arguments, index, options)) {
    return true;
  }
  if (argument.rfind('-', 0) != 0) {
    if (options.input) {
      throw std::invalid_argument("Unexpected argument: " + argument +
                                  " (input listing already set)");
    }
    options.input = argument;
    return true;
  }
  return false;
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.input) {
    throw std::invalid_argument(
        "An input listing is required (positional, --input or config "
        "'input')");
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root,
                  const solid::Report &report) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "solid_report.txt", report.text);
  WriteFileIfContent(root / "solid_report.md", report.markdown);
  WriteFileIfContent(root / "solid_report.json", report.json);
}

void PrintReports(std::ostream &output, const solid::Report &report) {
  for (const auto *content : {&report.text, &report.markdown, &report.json}) {
    output << *content;
  }
}

std::string RuleSummary(solid::Principle principle) {
  switch (principle) {
  case solid::Principle::kSrp:
    return "Types whose dependencies span several responsibility categories";
  case solid::Principle::kOcp:
    return "Methods that switch on concrete types instead of dispatching";
  case solid::Principle::kLsp:
    return "Overrides that refuse an operation their supertype promises";
  case solid::Principle::kIsp:
    return "Implementers forced to stub interface methods they do not use";
  case solid::Principle::kDip:
    return "Service-layer types constructing concrete classes";
  }
  return "";
}

} // namespace

namespace solid {

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

using SeverityMap = std::map<Principle, Severity>;
using ConfigValue = std::variant<std::string, bool, std::vector<std::string>,
                                 SeverityMap, SuffixCategories>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"input",
                                                "out",
                                                "formats",
                                                "rules",
                                                "reader",
                                                "reporter",
                                                "log_level",
                                                "scope_notes",
                                                "parallel",
                                                "strict_dependencies",
                                                "severities",
                                                "responsibility_suffixes"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"listing", "input"},
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"severity", "severities"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

SeverityMap ExtractSeverities(const YAML::Node &node,
                              const std::string &key_name) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must map principles to severities");
  }
  SeverityMap severities;
  for (const auto &entry : node) {
    severities[ParsePrinciple(entry.first.as<std::string>())] =
        ParseSeverity(ExtractStringScalar(entry.second, key_name));
  }
  return severities;
}

SuffixCategories ExtractSuffixCategories(const YAML::Node &node,
                                         const std::string &key_name) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must map categories to suffix lists");
  }
  SuffixCategories categories;
  for (const auto &entry : node) {
    const auto category = ToLower(Trim(entry.first.as<std::string>()));
    if (category.empty()) {
      throw std::invalid_argument("Config key '" + key_name +
                                  "' contains an empty category name");
    }
    auto &suffixes = categories[category];
    const auto append = [&](const YAML::Node &suffix) {
      const auto value = Trim(ExtractStringScalar(suffix, key_name));
      if (!value.empty()) {
        suffixes.push_back(value);
      }
    };
    if (entry.second.IsSequence()) {
      for (const auto &suffix : entry.second) {
        append(suffix);
      }
    } else {
      append(entry.second);
    }
  }
  return categories;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "formats") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "rules") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "parallel" || key == "strict_dependencies") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "severities") {
    return ExtractSeverities(node, key);
  }
  if (key == "responsibility_suffixes") {
    return ExtractSuffixCategories(node, key);
  }
  if (key == "input" || key == "out" || key == "scope_notes" ||
      key == "log_level" || key == "reader" || key == "reporter") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &ex) {
    throw std::invalid_argument("Invalid YAML in config file " +
                                path.string() + ": " + ex.what());
  }
  if (root.IsNull()) {
    return {};
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "input") {
      options.input = std::get<std::string>(value);
      continue;
    }
    if (key == "out") {
      options.output_directory = std::get<std::string>(value);
      continue;
    }
    if (key == "scope_notes") {
      options.scope_notes = std::get<std::string>(value);
      continue;
    }
    if (key == "formats") {
      options.formats = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "rules") {
      options.rules = std::get<std::vector<std::string>>(value);
      continue;
    }
    if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
      continue;
    }
    if (key == "reader") {
      options.reader = std::get<std::string>(value);
      continue;
    }
    if (key == "reporter") {
      options.reporter = std::get<std::string>(value);
      continue;
    }
    if (key == "parallel") {
      options.parallel = std::get<bool>(value);
      continue;
    }
    if (key == "strict_dependencies") {
      options.strict_dependencies = std::get<bool>(value);
      continue;
    }
    if (key == "severities") {
      options.severities = std::get<SeverityMap>(value);
      continue;
    }
    if (key == "responsibility_suffixes") {
      options.responsibility_suffixes = std::get<SuffixCategories>(value);
      continue;
    }
    ThrowUnknownKey(key);
  }
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  options.config_file = path;
  RawConfig config = ParseYamlConfig(path);
  ApplyConfig(config, options);

  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.input, cli_options.input);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.scope_notes, cli_options.scope_notes);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.reader, cli_options.reader);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.parallel, cli_options.parallel);
  override_value(merged.strict_dependencies, cli_options.strict_dependencies);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  if (!cli_options.rules.empty()) {
    merged.rules = cli_options.rules;
  }
  for (const auto &[principle, severity] : cli_options.severities) {
    merged.severities[principle] = severity;
  }
  if (!cli_options.responsibility_suffixes.empty()) {
    merged.responsibility_suffixes = cli_options.responsibility_suffixes;
  }
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

RuleOptions BuildRuleOptions(const AnalyzeOptions &options) {
  RuleOptions rule_options;
  rule_options.responsibility_suffixes = options.responsibility_suffixes;
  rule_options.severity_overrides = options.severities;
  rule_options.parallel = options.parallel.value_or(false);
  return rule_options;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   std::shared_ptr<Logger> logger) {
  AnalysisConfig config;
  config.input_path = options.input ? options.input->string() : "";
  config.formats = options.formats.empty() ? std::vector<std::string>{"text"}
                                           : options.formats;
  config.scope_notes = options.scope_notes.value_or("");
  config.rules = options.rules;
  config.strict_dependencies = options.strict_dependencies.value_or(false);
  config.rule_options = BuildRuleOptions(options);
  config.logger = std::move(logger);
  config.config_file = options.config_file ? options.config_file->string() : "";
  return config;
}

DefaultAnalyzerPipeline
BuildAnalyzePipeline(const AnalysisConfig &config,
                     const AnalyzeOptions &options,
                     const std::shared_ptr<Logger> &logger) {
  AnalyzerPipelineBuilder builder;
  builder.WithLogger(logger);
  builder.WithReaderName(options.reader.value_or(
      ReaderNameForInput(config.input_path)));
  if (options.reporter) {
    builder.WithReporterName(*options.reporter);
  }
  builder.WithRules(config.rules);
  builder.WithRuleOptions(config.rule_options);
  return builder.Build();
}

int RunAnalyze(const std::vector<std::string> &arguments,
               std::ostream &output) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(output);
    return kCleanExitCode;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);
  const auto config = BuildAnalysisConfig(merged, logger);
  auto pipeline = BuildAnalyzePipeline(config, merged, logger);

  const auto result = pipeline.Run(config);
  if (merged.output_directory) {
    WriteReports(*merged.output_directory, result.report);
  } else {
    PrintReports(output, result.report);
  }
  return ExitCodeFor(result.analysis);
}

int RunRules(const std::vector<std::string> &arguments, std::ostream &output) {
  for (const auto &argument : arguments) {
    if (argument == "--help" || argument == "-h") {
      output << "Usage: solid-lint rules\n"
             << "Lists the rules accepted by --rules.\n";
      return kCleanExitCode;
    }
    throw std::invalid_argument("Unknown rules argument: " + argument);
  }

  const auto &registry = GlobalComponentRegistry();
  for (const auto &name : registry.CheckerNames()) {
    const auto checker = registry.CreateChecker(name, RuleOptions{});
    output << name << "\t" << PrincipleName(checker->Covers()) << "\t"
           << RuleSummary(checker->Covers()) << "\n";
  }
  return kCleanExitCode;
}

} // namespace solid
