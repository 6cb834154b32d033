// reader.hpp - EDN-style form reader for declaration files
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace alkey {

struct form;
using form_ptr = std::shared_ptr<form>;

struct form {
    enum class Kind { Nil, Bool, Int, Float, String, Symbol, Keyword, List, Vector, Map };
    Kind kind = Kind::Nil;
    bool b = false;
    int64_t i = 0;
    double f = 0.0;
    std::string text;             // String contents, Symbol name, Keyword name without ':'
    std::vector<form_ptr> elems;  // List/Vector elements; Map as alternating key, value
    int line = 1, col = 1;

    bool is_symbol(std::string_view s) const { return kind == Kind::Symbol && text == s; }
    bool is_coll() const { return kind == Kind::List || kind == Kind::Vector || kind == Kind::Map; }
};

// Reads every top-level form of `src`. ';' starts a line comment, commas are whitespace,
// nil/true/false read as Nil/Bool. Throws schema_error (E1460 syntax, E1461 integer out of
// range, E1462 odd number of map forms) carrying the line and column.
std::vector<form_ptr> read_forms(std::string_view src, std::string_view source_name = "<input>");

const char* to_string(form::Kind k);
std::string to_string(const form& f);

} // namespace alkey
