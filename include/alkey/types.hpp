// types.hpp - Declared shapes: type tags, fields, variants and type definitions
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace alkey
{

    enum class TypeKind
    {
        Product,
        Sum
    };

    // Closed set of field type tags. Checking against a tag is structural:
    // Int never satisfies Float, strings never satisfy numbers.
    struct TypeTag
    {
        enum class Kind
        {
            Nil,
            Bool,
            Int,
            Float,
            String,
            Keyword,
            Ref, // nested product/sum instance
            Seq, // sequence-of
            Map, // mapping-of
            Rec  // recursion cell producing an instance
        } kind = Kind::Nil;
        std::string type_name;               // Ref, Rec
        std::shared_ptr<const TypeTag> elem; // Seq element, Map key
        std::shared_ptr<const TypeTag> val;  // Map value

        bool is_scalar() const { return kind <= Kind::Keyword; }
    };

    TypeTag scalar_tag(TypeTag::Kind k);
    TypeTag ref_tag(std::string type_name);
    TypeTag rec_tag(std::string type_name);
    TypeTag seq_tag(TypeTag elem);
    TypeTag map_tag(TypeTag key, TypeTag val);

    // Scalar tag for a textual name: nil bool int i64 float f64 string keyword.
    std::optional<TypeTag> scalar_tag_named(std::string_view name);

    bool operator==(const TypeTag &a, const TypeTag &b);
    inline bool operator!=(const TypeTag &a, const TypeTag &b) { return !(a == b); }

    struct FieldSpec
    {
        std::string name;
        TypeTag tag;
    };

    struct VariantSpec
    {
        std::string name;
        std::vector<FieldSpec> fields;

        const FieldSpec *field(std::string_view n) const;
    };

    struct TypeDefinition
    {
        std::string name;
        TypeKind kind = TypeKind::Product;
        std::vector<FieldSpec> fields;     // Product
        std::vector<VariantSpec> variants; // Sum
        uint64_t revision = 0;             // assigned by Registry::define

        static TypeDefinition product(std::string name, std::vector<FieldSpec> fields);
        static TypeDefinition sum(std::string name, std::vector<VariantSpec> variants);

        const VariantSpec *variant(std::string_view n) const;
        const FieldSpec *field(std::string_view n) const;
        // Field count for products, variant count for sums.
        size_t member_count() const { return kind == TypeKind::Product ? fields.size() : variants.size(); }
        // Every Ref/Rec target named anywhere in the shape, in first-seen order.
        std::vector<std::string> referenced_types() const;
    };

    const char *to_string(TypeKind k);
    std::string to_string(const TypeTag &t);
    std::string to_string(const TypeDefinition &d);

} // namespace alkey
