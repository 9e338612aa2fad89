#pragma once

#include "ir.hpp"
#include "result.hpp"
#include "run_context.hpp"
#include "schema_normalizer.hpp"
#include "spec_node.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpgen {

// Index of the content entry to use, by media preference: application/json,
// other JSON types, form-urlencoded, then the first declared.
// Ties go to document order. nullopt when the mapping is empty.
std::optional<size_t> preferred_media_type(const spec_node& content) noexcept;

// "get" + "/pets/{petId}" -> "get_pets_petid"; "/" alone becomes "root".
std::string derive_operation_id(http_method method, std::string_view path);

// Names between braces in a path template, in order of appearance.
std::vector<std::string> path_template_names(std::string_view path);

// Walks the paths section and appends one operation_descriptor per
// path + method to the run's IR.
class operation_extractor {
public:
    operation_extractor(run_context& ctx, schema_normalizer& normalizer) noexcept
        : ctx_(&ctx), normalizer_(&normalizer) {}

    // Shape checks of the paths section. Runs over the whole document before
    // anything is extracted.
    result<void> validate_structure();

    result<void> extract_all();

private:
    struct raw_parameter {
        std::string name;
        std::string in;
        const spec_node* node = nullptr; // dereferenced
        std::string location;
    };

    result<void> extract_operation(std::string_view path,
                                   http_method method,
                                   const spec_node& op,
                                   const std::vector<raw_parameter>& path_params,
                                   std::string_view op_loc);

    result<std::vector<raw_parameter>> collect_parameters(const spec_node* list,
                                                          std::string_view loc);

    result<void> fill_parameter(parameter_descriptor& out, const raw_parameter& raw,
                                std::string_view where);
    result<const request_body_descriptor*> body_from_parameter(const raw_parameter& raw,
                                                               const spec_node& op,
                                                               std::string_view where);
    result<const request_body_descriptor*>
    body_from_form(const std::vector<const raw_parameter*>& fields, const spec_node& op);
    result<const request_body_descriptor*> body_from_field(const spec_node& raw_body,
                                                           std::string_view loc);
    result<void> fill_response(operation_descriptor& out, const spec_node& op,
                               std::string_view op_loc);
    result<const schema_node*> content_schema(const spec_node& content, std::string_view loc,
                                              std::string* media);

    std::vector<std::string> consumes(const spec_node& op) const;

    run_context* ctx_;
    schema_normalizer* normalizer_;
    // id -> "METHOD path" of the operation that claimed it.
    std::unordered_map<std::string, std::string> ids_;
};

} // namespace mcpgen
