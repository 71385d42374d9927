#include <solid/finding_aggregator.h>

#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace solid {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

Finding Make(Principle principle, std::string type, std::string member,
             std::string message = "message") {
  return Finding{principle, Severity::kWarning, std::move(type),
                 std::move(member), std::move(message)};
}

std::vector<std::string> Ids(const AnalysisResult &result) {
  std::vector<std::string> ids;
  for (const auto &finding : result.findings) {
    ids.push_back(FindingId(finding));
  }
  return ids;
}

TEST(FindingAggregatorTest, BuildsStableIdentifiers) {
  EXPECT_EQ(FindingId(Make(Principle::kLsp, "Ostrich", "fly")),
            "LSP:Ostrich:fly");
  EXPECT_EQ(FindingId(Make(Principle::kSrp, "Video", "")), "SRP:Video:");
}

TEST(FindingAggregatorTest, SortsByPrincipleTypeAndMember) {
  AnalysisResult raw;
  raw.findings = {Make(Principle::kSrp, "Video", ""),
                  Make(Principle::kLsp, "Penguin", "swim"),
                  Make(Principle::kDip, "OrderService", "MySQLOrderRepository"),
                  Make(Principle::kLsp, "Ostrich", "fly"),
                  Make(Principle::kLsp, "Ostrich", "dive")};

  const auto result = FindingAggregator().Aggregate(raw);

  EXPECT_THAT(Ids(result),
              ElementsAre("DIP:OrderService:MySQLOrderRepository",
                          "LSP:Ostrich:dive", "LSP:Ostrich:fly",
                          "LSP:Penguin:swim", "SRP:Video:"));
  EXPECT_EQ(result.verdict, Verdict::kViolations);
}

TEST(FindingAggregatorTest, KeepsOneFindingPerIdentifier) {
  AnalysisResult raw;
  raw.findings = {Make(Principle::kIsp, "PrivateVideo", "share", "via Media"),
                  Make(Principle::kIsp, "PrivateVideo", "share",
                       "via VideoActions")};

  const auto result = FindingAggregator().Aggregate(raw);

  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].message, "via Media");
}

TEST(FindingAggregatorTest, OrderDoesNotDependOnInputOrder) {
  AnalysisResult forward;
  forward.findings = {Make(Principle::kOcp, "Shapes", "area", "b"),
                      Make(Principle::kOcp, "Shapes", "area", "a"),
                      Make(Principle::kLsp, "Ostrich", "fly")};
  AnalysisResult backward;
  backward.findings.assign(forward.findings.rbegin(), forward.findings.rend());

  const auto first = FindingAggregator().Aggregate(forward);
  const auto second = FindingAggregator().Aggregate(backward);

  ASSERT_EQ(first.findings.size(), 2u);
  EXPECT_EQ(Ids(first), Ids(second));
  EXPECT_EQ(first.findings[1].message, "a");
  EXPECT_EQ(second.findings[1].message, "a");
}

TEST(FindingAggregatorTest, EmptyInputIsClean) {
  AnalysisResult raw;
  raw.verdict = Verdict::kViolations;

  const auto result = FindingAggregator().Aggregate(raw);

  EXPECT_THAT(result.findings, IsEmpty());
  EXPECT_EQ(result.verdict, Verdict::kClean);
}

} // namespace
} // namespace solid
