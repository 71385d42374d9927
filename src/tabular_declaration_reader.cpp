#include <solid/errors.h>
#include <solid/escaping.h>
#include <solid/model_names.h>
#include <solid/tabular_declaration_reader.h>

#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using Fields = std::vector<std::string>;

[[noreturn]] void Fail(const std::string &message,
                       const std::string &location) {
  throw solid::MalformedInputError(message + " at " + location, {});
}

void RequireFieldCount(const Fields &fields, std::size_t minimum,
                       std::size_t maximum, const std::string &location) {
  if (fields.size() < minimum || fields.size() > maximum) {
    Fail("Record '" + fields.front() + "' expects " +
             std::to_string(minimum - 1) +
             (minimum == maximum ? "" : "-" + std::to_string(maximum - 1)) +
             " fields, found " + std::to_string(fields.size() - 1),
         location);
  }
}

int ParseArity(const std::string &value, const std::string &location) {
  std::size_t consumed = 0;
  int arity = 0;
  try {
    arity = std::stoi(value, &consumed);
  } catch (const std::exception &) {
    Fail("Arity '" + value + "' is not a number", location);
  }
  if (consumed != value.size()) {
    Fail("Arity '" + value + "' is not a number", location);
  }
  return arity;
}

void ParseRecord(const Fields &fields, const std::string &location,
                 solid::DeclarationListing &listing) {
  const auto record = solid::NormalizeToken(fields.front());
  if (record == "type") {
    RequireFieldCount(fields, 3, 4, location);
    solid::TypeDeclaration type;
    type.name = fields[1];
    type.kind = solid::ParseTypeKind(fields[2]);
    if (fields.size() > 3) {
      type.layer = solid::ParseTypeLayer(fields[3]);
    }
    type.location = location;
    listing.types.push_back(type);
    return;
  }
  if (record == "method") {
    RequireFieldCount(fields, 6, 6, location);
    listing.methods.push_back(solid::MethodDeclaration{
        fields[1], fields[2], ParseArity(fields[3], location), fields[4],
        solid::ParseBodyBehavior(fields[5]), location});
    return;
  }
  if (record == "field") {
    RequireFieldCount(fields, 4, 4, location);
    listing.fields.push_back(
        solid::FieldDeclaration{fields[1], fields[2], fields[3], location});
    return;
  }
  if (record == "extends" || record == "implements") {
    RequireFieldCount(fields, 3, 3, location);
    listing.inheritance.push_back(
        solid::InheritanceDeclaration{fields[1], fields[2], location});
    return;
  }
  if (record == "depends") {
    RequireFieldCount(fields, 3, 3, location);
    listing.dependencies.push_back(
        solid::DependencyDeclaration{fields[1], fields[2], location});
    return;
  }
  Fail("Unknown record '" + fields.front() + "'", location);
}

} // namespace

namespace solid {

TabularDeclarationReader::TabularDeclarationReader(
    std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

DeclarationListing
TabularDeclarationReader::Read(const AnalysisConfig &config) {
  std::ifstream stream(config.input_path);
  if (!stream) {
    throw std::runtime_error("Failed to open declaration listing: " +
                             config.input_path);
  }
  return Parse(stream, config.input_path);
}

DeclarationListing
TabularDeclarationReader::Parse(std::istream &stream,
                                const std::string &source) const {
  DeclarationListing listing;
  listing.source = source;

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos ||
        line.front() == '#') {
      continue;
    }
    const auto location = source + ":" + std::to_string(line_number);
    try {
      ParseRecord(SplitRecord(line), location, listing);
    } catch (const std::invalid_argument &ex) {
      Fail(ex.what(), location);
    }
  }

  logger_->Log(LogLevel::kDebug, "reader.complete",
               {{"reader", "tabular"},
                {"source", source},
                {"lines", std::to_string(line_number)},
                {"types", std::to_string(listing.types.size())}});
  return listing;
}

} // namespace solid
