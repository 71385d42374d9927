#include <solid/escaping.h>
#include <solid/finding_aggregator.h>
#include <solid/model_names.h>
#include <solid/standard_reporter.h>

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <unordered_map>

namespace solid {
namespace {

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      char code[7];
      std::snprintf(code, sizeof(code), "\\u%04x",
                    static_cast<unsigned int>(
                        static_cast<unsigned char>(character)));
      escaped.append(code);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.append("<br>");
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  return Join(values, ",", [](const std::string &value) {
    return "\"" + EscapeJsonString(value) + "\"";
  });
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "text";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string ValueOrNone(const std::string &value) {
  return value.empty() ? "None" : value;
}

std::string RenderText(const AnalysisResult &analysis) {
  std::ostringstream output;
  for (const auto &finding : analysis.findings) {
    output << JoinRecord({PrincipleName(finding.principle),
                          SeverityName(finding.severity), finding.type_name,
                          finding.member, finding.message})
           << "\n";
  }
  output << "# findings: " << analysis.findings.size() << "\n";
  return output.str();
}

std::string BuildAnalysisHeaderMarkdown(const AnalysisResult &analysis,
                                        const AnalysisConfig &config) {
  std::ostringstream section;
  section << "## Analysis Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Source | " << EscapeMarkdownCell(ValueOrNone(config.input_path))
          << " |\n";
  section << "| Scope Notes | "
          << EscapeMarkdownCell(ValueOrNone(config.scope_notes)) << " |\n";
  section << "| Config | "
          << EscapeMarkdownCell(ValueOrNone(config.config_file)) << " |\n";
  section << "| Rules | "
          << Join(analysis.rules, ", ",
                  [](const std::string &rule) { return rule; })
          << " |\n\n";
  return section.str();
}

std::string BuildStatisticsMarkdown(const GraphStatistics &statistics) {
  std::ostringstream section;
  section << "## Model Statistics\n\n";
  section << "| Types | Interfaces | Methods | Inheritance Edges | "
             "Dependency Edges |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  section << "| " << statistics.types << " | " << statistics.interfaces
          << " | " << statistics.methods << " | "
          << statistics.inheritance_edges << " | "
          << statistics.dependency_edges << " |\n\n";
  return section.str();
}

std::string BuildFindingsMarkdown(const AnalysisResult &analysis) {
  std::ostringstream section;
  section << "## Findings\n\n";
  section << "| Principle | Severity | Type | Member | Message |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  if (analysis.findings.empty()) {
    section << "| None | - | - | - | - |\n\n";
    return section.str();
  }

  for (const auto &finding : analysis.findings) {
    std::string member = "-";
    if (!finding.member.empty()) {
      member = EscapeMarkdownCell(finding.member);
    }
    section << "| " << PrincipleName(finding.principle) << " | "
            << SeverityName(finding.severity) << " | "
            << EscapeMarkdownCell(finding.type_name) << " | " << member
            << " | " << EscapeMarkdownCell(finding.message) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildNotesMarkdown() {
  std::ostringstream section;
  section << "## Notes\n\n";
  section << "- SRP categories are inferred from dependency type-name "
             "suffixes and approximate a design judgement.\n";
  section << "- OCP findings rely on methods declared with the type-switch "
             "body tag.\n";
  return section.str();
}

std::string BuildAnalysisHeaderJson(const AnalysisResult &analysis,
                                    const AnalysisConfig &config) {
  std::ostringstream json;
  json << "\"analysis_header\": {";
  json << "\"source\": \"" << EscapeJsonString(config.input_path) << "\",";
  json << "\"scope_notes\": \"" << EscapeJsonString(config.scope_notes)
       << "\",";
  json << "\"config_file\": \"" << EscapeJsonString(config.config_file)
       << "\",";
  json << "\"rules\": [" << JoinJsonArray(analysis.rules) << "]}";
  return json.str();
}

std::string BuildStatisticsJson(const GraphStatistics &statistics) {
  std::ostringstream json;
  json << "\"statistics\": {";
  json << "\"types\": " << statistics.types << ",";
  json << "\"interfaces\": " << statistics.interfaces << ",";
  json << "\"methods\": " << statistics.methods << ",";
  json << "\"inheritance_edges\": " << statistics.inheritance_edges << ",";
  json << "\"dependency_edges\": " << statistics.dependency_edges << "}";
  return json.str();
}

std::string BuildFindingsJson(const AnalysisResult &analysis) {
  std::ostringstream json;
  json << "\"findings\": [";
  for (std::size_t i = 0; i < analysis.findings.size(); ++i) {
    const auto &finding = analysis.findings[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"id\": \"" << EscapeJsonString(FindingId(finding)) << "\",";
    json << "\"principle\": \"" << PrincipleName(finding.principle) << "\",";
    json << "\"severity\": \"" << SeverityName(finding.severity) << "\",";
    json << "\"type\": \"" << EscapeJsonString(finding.type_name) << "\",";
    json << "\"member\": \"" << EscapeJsonString(finding.member) << "\",";
    json << "\"message\": \"" << EscapeJsonString(finding.message) << "\"}";
  }
  json << "]";
  return json.str();
}

} // namespace

Report StandardReporter::Render(const AnalysisResult &analysis,
                                const AnalysisConfig &config) {
  Report report;

  if (ShouldRenderFormat(config.formats, "text")) {
    report.text = RenderText(analysis);
  }

  if (ShouldRenderFormat(config.formats, "markdown")) {
    std::ostringstream output;
    output << "# Design Principle Report\n\n";
    output << BuildAnalysisHeaderMarkdown(analysis, config);
    output << BuildStatisticsMarkdown(analysis.statistics);
    output << BuildFindingsMarkdown(analysis);
    output << BuildNotesMarkdown();
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(config.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildAnalysisHeaderJson(analysis, config) << ",";
    output << BuildStatisticsJson(analysis.statistics) << ",";
    output << "\"verdict\": \""
           << (analysis.verdict == Verdict::kClean ? "clean" : "violations")
           << "\",";
    output << BuildFindingsJson(analysis);
    output << "}\n";
    report.json = output.str();
  }

  return report;
}

} // namespace solid
