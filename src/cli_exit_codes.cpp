#include <solid/cli_exit_codes.h>

namespace solid {

int ExitCodeFor(const AnalysisResult &analysis) {
  switch (analysis.verdict) {
  case Verdict::kClean:
    return analysis.findings.empty() ? kCleanExitCode : kFindingsExitCode;
  case Verdict::kViolations:
    return kFindingsExitCode;
  }
  return kErrorExitCode;
}

} // namespace solid
