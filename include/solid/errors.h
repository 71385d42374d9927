#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace solid {

// Raised when a declaration listing cannot be turned into a graph: unknown
// type references, duplicate names, inheritance cycles or unreadable records.
class MalformedInputError : public std::runtime_error {
public:
  MalformedInputError(const std::string &message,
                      std::vector<std::string> offending_names);

  const std::vector<std::string> &OffendingNames() const {
    return offending_names_;
  }

private:
  std::vector<std::string> offending_names_;
};

} // namespace solid
