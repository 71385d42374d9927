#include <solid/single_responsibility_checker.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/listing_builder.h"

namespace solid {
namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

TEST(SingleResponsibilityCheckerTest, FlagsTypeMixingResponsibilities) {
  const auto graph = test::ListingBuilder()
                         .Class("Video")
                         .Depends("Video", "MailSender")
                         .Depends("Video", "VideoRepository")
                         .Build();

  const auto findings = SingleResponsibilityChecker().Check(graph);

  ASSERT_THAT(findings,
              ElementsAre(AllOf(Field(&Finding::principle, Principle::kSrp),
                                Field(&Finding::type_name, "Video"),
                                Field(&Finding::member, ""),
                                Field(&Finding::severity, Severity::kInfo))));
  EXPECT_THAT(findings[0].message, HasSubstr("messaging (MailSender)"));
  EXPECT_THAT(findings[0].message, HasSubstr("persistence (VideoRepository)"));
}

TEST(SingleResponsibilityCheckerTest, SingleCategoryIsNotAFinding) {
  const auto graph = test::ListingBuilder()
                         .Class("Video")
                         .Depends("Video", "MailSender")
                         .Class("Newsletter")
                         .Depends("Newsletter", "MailSender")
                         .Depends("Newsletter", "SmsSender")
                         .Build();

  EXPECT_THAT(SingleResponsibilityChecker().Check(graph), IsEmpty());
}

TEST(SingleResponsibilityCheckerTest, CountsFieldsOfDeclaredTypes) {
  const auto graph = test::ListingBuilder()
                         .Class("Invoice")
                         .Class("OrderRepository")
                         .Class("Checkout")
                         .Field("Checkout", "invoice", "Invoice")
                         .Field("Checkout", "orders", "OrderRepository")
                         .Field("Checkout", "retries", "int")
                         .Build();

  const auto findings = SingleResponsibilityChecker().Check(graph);

  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].type_name, "Checkout");
  EXPECT_THAT(findings[0].message, HasSubstr("domain (Invoice)"));
}

TEST(SingleResponsibilityCheckerTest, UsesConfiguredSuffixFamilies) {
  const auto graph = test::ListingBuilder()
                         .Class("Report")
                         .Depends("Report", "PdfWriter")
                         .Depends("Report", "Invoice")
                         .Build();

  EXPECT_THAT(SingleResponsibilityChecker().Check(graph), IsEmpty());

  const SingleResponsibilityChecker custom(
      SuffixCategories{{"output", {"Writer"}}});
  EXPECT_EQ(custom.Check(graph).size(), 1u);
}

TEST(ResponsibilityCategoryTest, MatchesLongestSuffixCaseInsensitively) {
  const auto categories = DefaultResponsibilitySuffixes();

  EXPECT_EQ(ResponsibilityCategory(categories, "UserDao"), "persistence");
  EXPECT_EQ(ResponsibilityCategory(categories, "HttpClient"), "remote");
  EXPECT_EQ(ResponsibilityCategory(categories, "Video"), "domain");

  const SuffixCategories overlapping{{"generic", {"Sender"}},
                                     {"mail", {"MailSender"}}};
  EXPECT_EQ(ResponsibilityCategory(overlapping, "BulkMailSender"), "mail");
}

} // namespace
} // namespace solid
