#include <solid/analyzer_pipeline_builder.h>
#include <solid/component_registry.h>
#include <solid/default_analyzer_pipeline.h>
#include <solid/logging.h>
#include <solid/models.h>
#include <solid/single_responsibility_checker.h>
#include <solid/standard_reporter.h>
#include <solid/tabular_declaration_reader.h>
#include <solid/yaml_declaration_reader.h>

#include <sstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace solid {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class StubReader : public DeclarationReader {
public:
  DeclarationListing Read(const AnalysisConfig &config) override {
    DeclarationListing listing;
    listing.source = config.input_path;
    listing.types = {
        {"Bird", TypeKind::kClass, TypeLayer::kUnspecified, ""},
        {"Ostrich", TypeKind::kClass, TypeLayer::kUnspecified, ""}};
    listing.methods = {
        {"Bird", "fly", 0, "void", BodyBehavior::kNormal, ""},
        {"Ostrich", "fly", 0, "void", BodyBehavior::kThrowsUnsupported, ""}};
    listing.inheritance = {{"Ostrich", "Bird", ""}};
    return listing;
  }
};

class CustomAnalyzer : public DesignAnalyzer {
public:
  AnalysisResult Analyze(const Graph &graph) override {
    AnalysisResult result;
    result.statistics = graph.Statistics();
    result.rules = {"custom"};
    result.findings.push_back(Finding{.principle = Principle::kOcp,
                                      .type_name = "custom-analyzer"});
    return result;
  }
};

class CustomReporter : public Reporter {
public:
  Report Render(const AnalysisResult &, const AnalysisConfig &) override {
    return Report{.text = "custom-report", .json = "custom-json"};
  }
};

AnalysisConfig MinimalConfig() {
  AnalysisConfig config;
  config.input_path = "stub";
  config.formats = {"text"};
  config.logger = std::make_shared<NullLogger>();
  return config;
}

TEST(ComponentRegistryTest,
     ProvidesDefaultsAndKeepsThemAfterCustomRegistration) {
  auto registry = MakeComponentRegistryWithDefaults();

  auto default_reader = registry.CreateReader();
  EXPECT_NE(dynamic_cast<YamlDeclarationReader *>(default_reader.get()),
            nullptr);
  auto tabular_reader = registry.CreateReader("tabular");
  EXPECT_NE(dynamic_cast<TabularDeclarationReader *>(tabular_reader.get()),
            nullptr);
  auto default_reporter = registry.CreateReporter();
  EXPECT_NE(dynamic_cast<StandardReporter *>(default_reporter.get()), nullptr);

  registry.RegisterReader("stub", [](std::shared_ptr<Logger>) {
    return std::make_unique<StubReader>();
  });
  registry.RegisterReporter(
      "custom-reporter", []() { return std::make_unique<CustomReporter>(); });

  auto still_default = registry.CreateReader();
  EXPECT_NE(dynamic_cast<YamlDeclarationReader *>(still_default.get()),
            nullptr);

  auto custom_instance = registry.CreateReporter("custom-reporter");
  EXPECT_NE(dynamic_cast<CustomReporter *>(custom_instance.get()), nullptr);
  EXPECT_THAT(registry.ReaderNames(), ElementsAre("stub", "tabular", "yaml"));
}

TEST(ComponentRegistryTest, ListsRulesInNameOrder) {
  const auto &registry = GlobalComponentRegistry();

  EXPECT_THAT(registry.CheckerNames(),
              ElementsAre("dip", "isp", "lsp", "ocp", "srp"));
  const auto checker = registry.CreateChecker("srp", RuleOptions{});
  EXPECT_EQ(checker->Covers(), Principle::kSrp);
}

TEST(ComponentRegistryTest, RejectsUnknownAndDuplicateNames) {
  auto registry = MakeComponentRegistryWithDefaults();

  try {
    registry.CreateReporter("pdf");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown reporter 'pdf'"));
    EXPECT_THAT(error.what(), HasSubstr("Registered: standard"));
  }
  EXPECT_THROW(registry.RegisterReporter(
                   "standard",
                   []() { return std::make_unique<StandardReporter>(); }),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterChecker("", nullptr), std::invalid_argument);
}

TEST(ComponentRegistryTest, SelectsReaderFromFileExtension) {
  EXPECT_EQ(ReaderNameForInput("design.yaml"), "yaml");
  EXPECT_EQ(ReaderNameForInput("design.YML"), "yaml");
  EXPECT_EQ(ReaderNameForInput("design.tsv"), "tabular");
  EXPECT_EQ(ReaderNameForInput("listing"), "tabular");
}

TEST(ComponentRegistryTest, PipelineBuilderUsesCustomComponentsWhenSelected) {
  auto registry = MakeComponentRegistryWithDefaults();
  registry.RegisterReader("stub", [](std::shared_ptr<Logger>) {
    return std::make_unique<StubReader>();
  });
  registry.RegisterReporter(
      "custom-reporter", []() { return std::make_unique<CustomReporter>(); });

  AnalyzerPipelineBuilder builder(registry);
  builder.WithLogger(std::make_shared<NullLogger>());
  builder.WithAnalyzer(std::make_unique<CustomAnalyzer>());
  builder.WithReaderName("stub").WithReporterName("custom-reporter");

  auto pipeline = builder.Build();
  const auto result = pipeline.Run(MinimalConfig());

  EXPECT_THAT(result.analysis.rules, ElementsAre("custom"));
  ASSERT_EQ(result.analysis.findings.size(), 1u);
  EXPECT_EQ(result.analysis.findings[0].type_name, "custom-analyzer");
  EXPECT_EQ(result.analysis.statistics.types, 2u);
  EXPECT_EQ(result.report.text, "custom-report");
  EXPECT_EQ(result.report.json, "custom-json");
}

TEST(ComponentRegistryTest, PipelineRunsSelectedRulesAndLogsStages) {
  auto registry = MakeComponentRegistryWithDefaults();
  registry.RegisterReader("stub", [](std::shared_ptr<Logger>) {
    return std::make_unique<StubReader>();
  });
  std::stringstream log;

  AnalyzerPipelineBuilder builder(registry);
  builder.WithLogger(MakeLogger({LogLevel::kDebug}, log))
      .WithReaderName("stub")
      .WithRules({"lsp", "ocp"});

  auto pipeline = builder.Build();
  const auto result = pipeline.Run(MinimalConfig());

  EXPECT_THAT(result.analysis.rules, ElementsAre("lsp", "ocp"));
  ASSERT_EQ(result.analysis.findings.size(), 1u);
  EXPECT_EQ(result.analysis.verdict, Verdict::kViolations);
  EXPECT_EQ(result.report.text,
            "LSP\terror\tOstrich\tfly\t'Ostrich' cannot honor the contract of "
            "'Bird' for method 'fly': the override signals an unsupported "
            "operation.\n# findings: 1\n");

  const auto output = log.str();
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.start\""));
  for (const auto *stage : {"read", "build", "analyze", "render"}) {
    EXPECT_THAT(output, HasSubstr(std::string("\"stage\": \"") + stage + "\""));
  }
  EXPECT_THAT(output, HasSubstr("message=\"pipeline.complete\""));
}

} // namespace
} // namespace solid
