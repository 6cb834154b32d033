// schema.hpp - Loads product/sum declarations and instance fixtures from EDN-style text
#pragma once
#include "alkey/errors.hpp"
#include "alkey/reader.hpp"
#include "alkey/registry.hpp"
#include "alkey/validator.hpp"
#include "alkey/value.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace alkey {

// Collected, not thrown: a whole file's problems are reported in one pass.
struct SchemaResult {
    bool success = true;
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;
    std::vector<std::string> defined;     // declaration order
    std::vector<instance_ptr> fixtures;   // validated instances, file order
};

// Forms:
//   (product :name Point :fields [(field :name x :type int) ...])
//   (sum :name Option :variants [(variant :name Some :fields [...]) (variant :name None)])
//   (instance :type Option :variant Some :fields {:value 5})
// Type forms: nil bool int i64 float f64 string keyword, a bare symbol naming another type,
// (seq T), (map K V), (rec Name). Declarations are defined in file order; instance fixtures are
// validated after every declaration of the file is in.
SchemaResult load_schema(Registry& reg, const Validator& validator, std::string_view text, std::string_view source_name = "<schema>");

// Throws schema_error (E1475) for a form that names no type.
TypeTag parse_type_tag(const form& f);

// Literal conversion: vectors and lists become seq, maps become map_t, symbols become keywords.
value form_to_value(const form& f);

} // namespace alkey
