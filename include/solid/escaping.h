#pragma once

#include <string>
#include <vector>

namespace solid {

// Tab-separated records: fields escape '\\', '\t' and '\n' with a backslash.
std::string EscapeField(const std::string &value);
std::string UnescapeField(const std::string &value);

std::vector<std::string> SplitRecord(const std::string &line);
std::string JoinRecord(const std::vector<std::string> &fields);

} // namespace solid
