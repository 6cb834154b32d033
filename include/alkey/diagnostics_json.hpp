// diagnostics_json.hpp - JSON serialization for schema load diagnostics
#pragma once
#include "alkey/schema.hpp"
#include <string>

namespace alkey {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

std::string diagnostic_to_json(const Diagnostic& d);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const SchemaResult& r);

} // namespace alkey
