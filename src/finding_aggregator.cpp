#include <solid/finding_aggregator.h>
#include <solid/model_names.h>

#include <algorithm>
#include <tuple>
#include <unordered_set>
#include <utility>

namespace solid {

std::string FindingId(const Finding &finding) {
  return PrincipleName(finding.principle) + ":" + finding.type_name + ":" +
         finding.member;
}

AnalysisResult FindingAggregator::Aggregate(AnalysisResult result) const {
  auto &findings = result.findings;
  std::stable_sort(findings.begin(), findings.end(),
                   [](const Finding &left, const Finding &right) {
                     const auto left_principle = PrincipleName(left.principle);
                     const auto right_principle =
                         PrincipleName(right.principle);
                     return std::tie(left_principle, left.type_name,
                                     left.member, left.message) <
                            std::tie(right_principle, right.type_name,
                                     right.member, right.message);
                   });

  std::unordered_set<std::string> seen;
  std::vector<Finding> unique;
  unique.reserve(findings.size());
  for (auto &finding : findings) {
    if (seen.insert(FindingId(finding)).second) {
      unique.push_back(std::move(finding));
    }
  }
  findings = std::move(unique);
  result.verdict =
      findings.empty() ? Verdict::kClean : Verdict::kViolations;
  return result;
}

} // namespace solid
