#pragma once

#include <solid/models.h>

namespace solid {

constexpr int kCleanExitCode = 0;
constexpr int kFindingsExitCode = 1;
constexpr int kErrorExitCode = 2;

int ExitCodeFor(const AnalysisResult &analysis);

} // namespace solid
