#pragma once

#include <solid/errors.h>
#include <solid/graph.h>
#include <solid/logging.h>
#include <solid/models.h>

#include <memory>

namespace solid {

struct ModelBuilderOptions {
  bool strict_dependencies = false;
};

// Turns a flat declaration listing into a validated Graph. Throws
// MalformedInputError on the first invalid record.
class ModelBuilder {
public:
  explicit ModelBuilder(ModelBuilderOptions options = {},
                        std::shared_ptr<Logger> logger = nullptr);

  Graph Build(const DeclarationListing &listing) const;

private:
  ModelBuilderOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace solid
