#include <solid/errors.h>

#include <utility>

namespace solid {

MalformedInputError::MalformedInputError(
    const std::string &message, std::vector<std::string> offending_names)
    : std::runtime_error(message),
      offending_names_(std::move(offending_names)) {}

} // namespace solid
