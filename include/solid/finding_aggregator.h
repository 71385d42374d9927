#pragma once

#include <solid/models.h>

#include <string>
#include <vector>

namespace solid {

// "LSP:Ostrich:fly"; the member part is empty for type-level findings.
std::string FindingId(const Finding &finding);

class FindingAggregator {
public:
  // Sorts by (principle name, type, member, message) and keeps the first
  // finding of every identifier. Sets the verdict from what remains.
  AnalysisResult Aggregate(AnalysisResult result) const;
};

} // namespace solid
