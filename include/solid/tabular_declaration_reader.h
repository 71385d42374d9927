#pragma once

#include <solid/interfaces.h>
#include <solid/logging.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace solid {

// One tab-separated record per line:
//   type <name> <class|interface> [layer]
//   method <owner> <name> <arity> <return-kind> <body-tag>
//   field <owner> <name> <type>
//   extends <child> <parent>
//   depends <owner> <target>
// Lines starting with '#' and blank lines are skipped.
class TabularDeclarationReader : public DeclarationReader {
public:
  explicit TabularDeclarationReader(std::shared_ptr<Logger> logger = nullptr);

  DeclarationListing Read(const AnalysisConfig &config) override;
  DeclarationListing Parse(std::istream &stream,
                           const std::string &source) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace solid
