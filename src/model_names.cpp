#include <solid/model_names.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace solid {

std::string NormalizeToken(std::string value) {
  const auto is_space = [](unsigned char character) {
    return std::isspace(character) != 0;
  };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                          [&](unsigned char character) {
                                            return !is_space(character);
                                          }));
  value.erase(std::find_if(
                  value.rbegin(), value.rend(),
                  [&](unsigned char character) { return !is_space(character); })
                  .base(),
              value.end());
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   if (character == '_' || character == ' ') {
                     return '-';
                   }
                   return static_cast<char>(std::tolower(character));
                 });
  return value;
}

std::string PrincipleName(Principle principle) {
  switch (principle) {
  case Principle::kSrp:
    return "SRP";
  case Principle::kOcp:
    return "OCP";
  case Principle::kLsp:
    return "LSP";
  case Principle::kIsp:
    return "ISP";
  case Principle::kDip:
    return "DIP";
  }
  return "unknown";
}

Principle ParsePrinciple(const std::string &value) {
  const auto normalized = NormalizeToken(value);
  if (normalized == "srp") {
    return Principle::kSrp;
  }
  if (normalized == "ocp") {
    return Principle::kOcp;
  }
  if (normalized == "lsp") {
    return Principle::kLsp;
  }
  if (normalized == "isp") {
    return Principle::kIsp;
  }
  if (normalized == "dip") {
    return Principle::kDip;
  }
  throw std::invalid_argument("Unknown principle: " + value);
}

std::string RuleName(Principle principle) {
  auto name = PrincipleName(principle);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::tolower(character));
                 });
  return name;
}

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kInfo:
    return "info";
  case Severity::kWarning:
    return "warning";
  case Severity::kError:
    return "error";
  }
  return "unknown";
}

Severity ParseSeverity(const std::string &value) {
  const auto normalized = NormalizeToken(value);
  if (normalized == "info") {
    return Severity::kInfo;
  }
  if (normalized == "warning" || normalized == "warn") {
    return Severity::kWarning;
  }
  if (normalized == "error") {
    return Severity::kError;
  }
  throw std::invalid_argument("Unknown severity: " + value);
}

std::string BodyBehaviorName(BodyBehavior behavior) {
  switch (behavior) {
  case BodyBehavior::kNormal:
    return "normal";
  case BodyBehavior::kThrowsUnsupported:
    return "throws-unsupported";
  case BodyBehavior::kNoOp:
    return "no-op";
  case BodyBehavior::kTypeSwitch:
    return "type-switch";
  }
  return "unknown";
}

BodyBehavior ParseBodyBehavior(const std::string &value) {
  const auto normalized = NormalizeToken(value);
  if (normalized.empty() || normalized == "normal") {
    return BodyBehavior::kNormal;
  }
  if (normalized == "throws-unsupported" || normalized == "throwsunsupported" ||
      normalized == "unsupported") {
    return BodyBehavior::kThrowsUnsupported;
  }
  if (normalized == "no-op" || normalized == "noop") {
    return BodyBehavior::kNoOp;
  }
  if (normalized == "type-switch" || normalized == "typeswitch") {
    return BodyBehavior::kTypeSwitch;
  }
  throw std::invalid_argument("Unknown body tag: " + value);
}

TypeKind ParseTypeKind(const std::string &value) {
  const auto normalized = NormalizeToken(value);
  if (normalized.empty() || normalized == "class") {
    return TypeKind::kClass;
  }
  if (normalized == "interface") {
    return TypeKind::kInterface;
  }
  throw std::invalid_argument("Unknown type kind: " + value);
}

TypeLayer ParseTypeLayer(const std::string &value) {
  const auto normalized = NormalizeToken(value);
  if (normalized.empty() || normalized == "unspecified" ||
      normalized == "none") {
    return TypeLayer::kUnspecified;
  }
  if (normalized == "service" || normalized == "service-layer") {
    return TypeLayer::kService;
  }
  if (normalized == "technical") {
    return TypeLayer::kTechnical;
  }
  throw std::invalid_argument("Unknown layer: " + value);
}

} // namespace solid
