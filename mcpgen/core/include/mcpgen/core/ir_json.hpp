#pragma once

#include "ir.hpp"
#include "spec_node.hpp"

#include <string>
#include <string_view>

namespace mcpgen {

// Writes a canonical schema back as JSON Schema: type arrays for nullable
// primitives, oneOf / anyOf / allOf for combinators and
// {"$ref": ref_prefix + name} for references. Normalizing the output again
// gives an equivalent schema.
spec_node emit_schema(const schema_node& schema, std::string_view ref_prefix = "#/schemas/");

// The hand-off document for the generator.
spec_node ir_to_node(const ir_document& doc);
std::string to_json(const ir_document& doc, int indent = 2);

} // namespace mcpgen
