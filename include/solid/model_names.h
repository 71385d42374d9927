#pragma once

#include <solid/models.h>

#include <string>

namespace solid {

std::string PrincipleName(Principle principle);
Principle ParsePrinciple(const std::string &value);
// Lower-case rule selector used on the command line ("lsp", "dip", ...).
std::string RuleName(Principle principle);

std::string SeverityName(Severity severity);
Severity ParseSeverity(const std::string &value);

std::string BodyBehaviorName(BodyBehavior behavior);
BodyBehavior ParseBodyBehavior(const std::string &value);

TypeKind ParseTypeKind(const std::string &value);

TypeLayer ParseTypeLayer(const std::string &value);

// Lower-cases and maps '_' and ' ' to '-', so "Throws_Unsupported" and
// "throws-unsupported" compare equal.
std::string NormalizeToken(std::string value);

} // namespace solid
