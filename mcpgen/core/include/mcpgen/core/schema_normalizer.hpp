#pragma once

#include "ir.hpp"
#include "result.hpp"
#include "run_context.hpp"
#include "spec_node.hpp"

#include <string_view>

namespace mcpgen {

// Turns raw schema nodes of any dialect into canonical schema_nodes.
//
// Rules, in order:
//   1. nullability flags and "null" entries of type arrays fold into
//      `nullable`; a single remaining type collapses, several become a
//      one_of union of primitives;
//   2. oneOf / anyOf become unions, allOf an intersection (a node mixing its
//      own object structure with combinators becomes an intersection of
//      all parts; single parts collapse);
//   3. objects keep their declared `required` list and property order,
//      arrays carry exactly one item schema;
//   4. pointers into the schema registry become reference(name); other
//      pointers are inlined, and a cyclic one is registered under a
//      synthesized name.
class schema_normalizer {
public:
    explicit schema_normalizer(run_context& ctx) noexcept : ctx_(&ctx) {}

    // location names the raw node in errors and warnings.
    result<const schema_node*> normalize(const spec_node& raw, std::string_view location);

    // Normalizes every declared registry schema in declaration order.
    result<void> build_registry();

    [[nodiscard]] schema_node* make_node(schema_kind kind);
    [[nodiscard]] schema_node* make_primitive(primitive_type type);
    [[nodiscard]] schema_node* clone(const schema_node& src);

private:
    result<const schema_node*> normalize_at(const spec_node& raw, std::string_view loc, int depth);
    result<const schema_node*> normalize_pointer(const spec_node& raw, std::string_view loc,
                                                 int depth);
    result<const schema_node*> normalize_merged(const spec_node& raw, const std::string& pointer,
                                                std::string_view loc, int depth);
    result<const schema_node*> resolve_target(const std::string& pointer, int depth);
    result<const schema_node*> build(const spec_node& raw, std::string_view loc, int depth);
    result<const schema_node*> build_alternatives(const spec_node& list, combinator mode,
                                                  std::string_view loc, int depth,
                                                  bool& saw_null);
    result<schema_node*> build_own(const spec_node& raw, std::string_view loc, int depth,
                                   bool& type_null);
    result<schema_node*> build_typed(const spec_node& raw, std::string_view type,
                                     std::string_view loc, int depth);
    void copy_value_annotations(schema_node& node, const spec_node& raw);
    schema_node* make_reference(std::string_view name);
    std::string synthesize_name(const std::string& pointer);

    run_context* ctx_;
};

// Structural equality of two canonical schemas, annotations included.
// Reference nodes compare by name.
bool equivalent(const schema_node& a, const schema_node& b) noexcept;

} // namespace mcpgen
