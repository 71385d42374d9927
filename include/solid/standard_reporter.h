#pragma once

#include <solid/interfaces.h>

namespace solid {

// Renders the formats listed in the config ("text" when none are listed).
class StandardReporter : public Reporter {
public:
  Report Render(const AnalysisResult &analysis,
                const AnalysisConfig &config) override;
};

} // namespace solid
