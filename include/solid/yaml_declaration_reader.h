#pragma once

#include <solid/interfaces.h>
#include <solid/logging.h>

#include <memory>
#include <string>

namespace solid {

class YamlDeclarationReader : public DeclarationReader {
public:
  explicit YamlDeclarationReader(std::shared_ptr<Logger> logger = nullptr);

  DeclarationListing Read(const AnalysisConfig &config) override;
  DeclarationListing Parse(const std::string &content,
                           const std::string &source) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace solid
