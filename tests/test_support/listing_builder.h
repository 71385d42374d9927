#ifndef SOLID_TEST_SUPPORT_LISTING_BUILDER_H
#define SOLID_TEST_SUPPORT_LISTING_BUILDER_H

#include <solid/graph.h>
#include <solid/model_builder.h>
#include <solid/models.h>

#include <string>

namespace solid {
namespace test {

// Fluent construction of declaration listings for checker and builder tests.
class ListingBuilder {
public:
  ListingBuilder &Class(const std::string &name,
                        TypeLayer layer = TypeLayer::kUnspecified) {
    listing_.types.push_back(
        TypeDeclaration{name, TypeKind::kClass, layer, "test"});
    return *this;
  }

  ListingBuilder &Interface(const std::string &name) {
    listing_.types.push_back(TypeDeclaration{name, TypeKind::kInterface,
                                             TypeLayer::kUnspecified, "test"});
    return *this;
  }

  ListingBuilder &Method(const std::string &owner, const std::string &name,
                         BodyBehavior behavior = BodyBehavior::kNormal,
                         int arity = 0) {
    listing_.methods.push_back(
        MethodDeclaration{owner, name, arity, "void", behavior, "test"});
    return *this;
  }

  ListingBuilder &Field(const std::string &owner, const std::string &name,
                        const std::string &type_name) {
    listing_.fields.push_back(FieldDeclaration{owner, name, type_name, "test"});
    return *this;
  }

  ListingBuilder &Extends(const std::string &child,
                          const std::string &parent) {
    listing_.inheritance.push_back(
        InheritanceDeclaration{child, parent, "test"});
    return *this;
  }

  ListingBuilder &Depends(const std::string &owner,
                          const std::string &target) {
    listing_.dependencies.push_back(
        DependencyDeclaration{owner, target, "test"});
    return *this;
  }

  const DeclarationListing &Listing() const { return listing_; }

  Graph Build(ModelBuilderOptions options = {}) const {
    return ModelBuilder(options).Build(listing_);
  }

private:
  DeclarationListing listing_;
};

} // namespace test
} // namespace solid

#endif // SOLID_TEST_SUPPORT_LISTING_BUILDER_H
