// validator.hpp - Builds instances whose shape matches a registry entry exactly
#pragma once
#include "alkey/errors.hpp"
#include "alkey/events.hpp"
#include "alkey/registry.hpp"
#include "alkey/value.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace alkey {

// Every declared field must be present and satisfy its tag; extra keys are UnknownField, not
// dropped. Failures emit ValidationFailed and throw ValidationError.
class Validator {
public:
    explicit Validator(const Registry& reg, std::shared_ptr<EventSink> sink = {}) : reg_(reg), sink_(std::move(sink)) {}

    // A Rec field given a pending lazy cell is accepted unforced, so its result has not been
    // checked: read such fields through force_checked rather than RecursionCell::force.
    instance_ptr construct_product(std::string_view type, field_list fields) const;
    instance_ptr construct_variant(std::string_view type, std::string_view variant, field_list fields) const;

    // Looks up `type` and checks its kind (UnknownType / WrongKind otherwise).
    std::shared_ptr<const TypeDefinition> require(std::string_view type, TypeKind kind) const;

    // Forces a recursion cell and checks that it produced an instance of `type`.
    value force_checked(const cell_ptr& cell, std::string_view type) const;

    // Structural conformance without constructing anything. Rec cells are not forced: a pending
    // cell conforms, an available one must hold an instance of the named type.
    static bool conforms(const value& v, const TypeTag& tag, std::string* why = nullptr);

    const Registry& registry() const { return reg_; }

private:
    instance_ptr build(const TypeDefinition& def, const VariantSpec* vs, field_list fields) const;
    [[noreturn]] void fail(ValidationErrorKind k, std::string_view type, Diagnostic d) const;

    const Registry& reg_;
    std::shared_ptr<EventSink> sink_;
};

} // namespace alkey
