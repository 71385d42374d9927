#include <solid/component_registry.h>
#include <solid/finding_aggregator.h>
#include <solid/model_names.h>
#include <solid/rule_engine.h>

#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/listing_builder.h"

namespace solid {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;

class MockChecker : public Checker {
public:
  MOCK_METHOD(Principle, Covers, (), (const, override));
  MOCK_METHOD(std::vector<Finding>, Check, (const Graph &), (const, override));
};

Graph SampleGraph() {
  return test::ListingBuilder()
      .Class("Bird")
      .Method("Bird", "fly")
      .Class("Ostrich")
      .Method("Ostrich", "fly", BodyBehavior::kThrowsUnsupported)
      .Extends("Ostrich", "Bird")
      .Interface("VideoActions")
      .Method("VideoActions", "playRandomAd")
      .Class("Video")
      .Method("Video", "playRandomAd")
      .Extends("Video", "VideoActions")
      .Depends("Video", "MailSender")
      .Depends("Video", "VideoRepository")
      .Class("PremiumVideo")
      .Method("PremiumVideo", "playRandomAd", BodyBehavior::kThrowsUnsupported)
      .Extends("PremiumVideo", "VideoActions")
      .Class("OrderService", TypeLayer::kService)
      .Class("MySQLOrderRepository")
      .Depends("OrderService", "MySQLOrderRepository")
      .Class("Shapes")
      .Method("Shapes", "area", BodyBehavior::kTypeSwitch)
      .Build();
}

std::vector<std::string> Ids(const AnalysisResult &result) {
  std::vector<std::string> ids;
  for (const auto &finding : result.findings) {
    ids.push_back(FindingId(finding) + "/" + SeverityName(finding.severity));
  }
  return ids;
}

RuleEngine DefaultEngine(RuleOptions options = {}) {
  return RuleEngine(GlobalComponentRegistry().CreateCheckers({}, options),
                    options);
}

TEST(RuleEngineTest, RunsEveryRuleAndRecordsStatistics) {
  const auto graph = SampleGraph();
  auto engine = DefaultEngine();

  const auto result = FindingAggregator().Aggregate(engine.Analyze(graph));

  EXPECT_THAT(result.rules, ElementsAre("dip", "isp", "lsp", "ocp", "srp"));
  EXPECT_EQ(result.statistics.types, graph.Statistics().types);
  EXPECT_EQ(result.verdict, Verdict::kViolations);
  EXPECT_THAT(Ids(result),
              ElementsAre("DIP:OrderService:MySQLOrderRepository/warning",
                          "ISP:PremiumVideo:playRandomAd/warning",
                          "LSP:Ostrich:fly/error",
                          "LSP:PremiumVideo:playRandomAd/error",
                          "OCP:Shapes:area/warning", "SRP:Video:/info"));
}

TEST(RuleEngineTest, ParallelRunMatchesSequentialRun) {
  const auto graph = SampleGraph();
  auto sequential = DefaultEngine();
  RuleOptions parallel_options;
  parallel_options.parallel = true;
  auto parallel = DefaultEngine(parallel_options);

  const auto expected = sequential.Analyze(graph);
  for (int run = 0; run < 5; ++run) {
    const auto actual = parallel.Analyze(graph);
    EXPECT_EQ(Ids(actual), Ids(expected));
    EXPECT_EQ(actual.rules, expected.rules);
  }
}

TEST(RuleEngineTest, AppliesSeverityOverrides) {
  RuleOptions options;
  options.severity_overrides[Principle::kLsp] = Severity::kWarning;
  options.severity_overrides[Principle::kSrp] = Severity::kError;
  auto engine = DefaultEngine(options);

  const auto result =
      FindingAggregator().Aggregate(engine.Analyze(SampleGraph()));

  for (const auto &finding : result.findings) {
    if (finding.principle == Principle::kLsp) {
      EXPECT_EQ(finding.severity, Severity::kWarning);
    }
    if (finding.principle == Principle::kSrp) {
      EXPECT_EQ(finding.severity, Severity::kError);
    }
  }
}

TEST(RuleEngineTest, RunsOnlySelectedRules) {
  auto engine = RuleEngine(
      GlobalComponentRegistry().CreateCheckers({"lsp", "lsp"}, RuleOptions{}));

  const auto result = engine.Analyze(SampleGraph());

  EXPECT_THAT(result.rules, ElementsAre("lsp"));
  for (const auto &finding : result.findings) {
    EXPECT_EQ(finding.principle, Principle::kLsp);
  }
}

TEST(RuleEngineTest, RejectsUnknownRuleName) {
  EXPECT_THROW(
      GlobalComponentRegistry().CreateCheckers({"kiss"}, RuleOptions{}),
      std::invalid_argument);
}

TEST(RuleEngineTest, MergesCheckerOutputInCheckerOrderAndLogs) {
  auto first = std::make_unique<MockChecker>();
  auto second = std::make_unique<MockChecker>();
  EXPECT_CALL(*first, Covers()).WillRepeatedly(Return(Principle::kOcp));
  EXPECT_CALL(*second, Covers()).WillRepeatedly(Return(Principle::kDip));
  EXPECT_CALL(*first, Check(::testing::_))
      .WillOnce(Return(std::vector<Finding>{
          {Principle::kOcp, Severity::kWarning, "Shapes", "area", "switch"}}));
  EXPECT_CALL(*second, Check(::testing::_))
      .WillOnce(Return(std::vector<Finding>{}));

  std::vector<std::unique_ptr<Checker>> checkers;
  checkers.push_back(std::move(first));
  checkers.push_back(std::move(second));
  std::stringstream log;
  RuleEngine engine(std::move(checkers), RuleOptions{},
                    MakeLogger({LogLevel::kDebug}, log));

  const auto result = engine.Analyze(Graph{});

  EXPECT_THAT(result.rules, ElementsAre("ocp", "dip"));
  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.verdict, Verdict::kViolations);
  EXPECT_THAT(log.str(), HasSubstr("\"rule\": \"dip\", \"findings\": \"0\""));
}

TEST(RuleEngineTest, RejectsNullChecker) {
  std::vector<std::unique_ptr<Checker>> checkers;
  checkers.push_back(nullptr);
  EXPECT_THROW({ RuleEngine engine(std::move(checkers)); },
               std::invalid_argument);
}

} // namespace
} // namespace solid
