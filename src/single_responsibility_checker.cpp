#include <solid/single_responsibility_checker.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace {

constexpr const char kDomainCategory[] = "domain";

bool EndsWithInsensitive(const std::string &value, const std::string &suffix) {
  if (suffix.empty() || value.size() < suffix.size()) {
    return false;
  }
  const auto offset = value.size() - suffix.size();
  for (std::size_t index = 0; index < suffix.size(); ++index) {
    if (std::tolower(static_cast<unsigned char>(value[offset + index])) !=
        std::tolower(static_cast<unsigned char>(suffix[index]))) {
      return false;
    }
  }
  return true;
}

std::string DescribeCategories(
    const std::map<std::string, std::set<std::string>> &categories) {
  std::string description;
  for (const auto &[category, names] : categories) {
    if (!description.empty()) {
      description += ", ";
    }
    description += category + " (";
    bool first = true;
    for (const auto &name : names) {
      if (!first) {
        description += ", ";
      }
      description += name;
      first = false;
    }
    description += ")";
  }
  return description;
}

} // namespace

namespace solid {

SuffixCategories DefaultResponsibilitySuffixes() {
  return SuffixCategories{
      {"persistence", {"Repository", "DAO", "Connection"}},
      {"messaging", {"Sender"}},
      {"remote", {"Client"}},
  };
}

std::string ResponsibilityCategory(const SuffixCategories &categories,
                                   const std::string &type_name) {
  std::string best_category = kDomainCategory;
  std::size_t best_length = 0;
  for (const auto &[category, suffixes] : categories) {
    for (const auto &suffix : suffixes) {
      if (suffix.size() > best_length &&
          EndsWithInsensitive(type_name, suffix)) {
        best_category = category;
        best_length = suffix.size();
      }
    }
  }
  return best_category;
}

SingleResponsibilityChecker::SingleResponsibilityChecker(
    SuffixCategories categories)
    : categories_(categories.empty() ? DefaultResponsibilitySuffixes()
                                     : std::move(categories)) {}

std::vector<Finding>
SingleResponsibilityChecker::Check(const Graph &graph) const {
  std::vector<Finding> findings;
  for (const auto &type : graph.Types()) {
    std::set<std::string> collaborators(type.dependencies.begin(),
                                        type.dependencies.end());
    // Fields only count when they hold a modelled type; primitives and
    // library types say nothing about responsibilities.
    for (const auto &field : type.fields) {
      if (graph.FindType(field.type_name) != nullptr) {
        collaborators.insert(field.type_name);
      }
    }
    collaborators.erase(type.name);

    std::map<std::string, std::set<std::string>> by_category;
    for (const auto &collaborator : collaborators) {
      by_category[ResponsibilityCategory(categories_, collaborator)].insert(
          collaborator);
    }
    if (by_category.size() < 2) {
      continue;
    }

    Finding finding{};
    finding.principle = Principle::kSrp;
    finding.severity = Severity::kInfo;
    finding.type_name = type.name;
    finding.message = "'" + type.name + "' mixes " +
                      std::to_string(by_category.size()) +
                      " responsibility categories: " +
                      DescribeCategories(by_category) +
                      ". Categories are inferred from type-name suffixes.";
    findings.push_back(finding);
  }
  return findings;
}

} // namespace solid
