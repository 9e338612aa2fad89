#include "mcpgen/core/ir.hpp"

namespace mcpgen {

http_method parse_method_key(std::string_view key) noexcept {
    if (key == "get") return http_method::get;
    if (key == "put") return http_method::put;
    if (key == "post") return http_method::post;
    if (key == "delete") return http_method::del;
    if (key == "options") return http_method::options;
    if (key == "head") return http_method::head;
    if (key == "patch") return http_method::patch;
    if (key == "trace") return http_method::trace;
    return http_method::unknown;
}

std::string_view method_key(http_method m) noexcept {
    switch (m) {
        case http_method::get: return "get";
        case http_method::put: return "put";
        case http_method::post: return "post";
        case http_method::del: return "delete";
        case http_method::options: return "options";
        case http_method::head: return "head";
        case http_method::patch: return "patch";
        case http_method::trace: return "trace";
        default: return "unknown";
    }
}

std::string_view method_to_string(http_method m) noexcept {
    switch (m) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::post: return "POST";
        case http_method::del: return "DELETE";
        case http_method::options: return "OPTIONS";
        case http_method::head: return "HEAD";
        case http_method::patch: return "PATCH";
        case http_method::trace: return "TRACE";
        default: return "UNKNOWN";
    }
}

std::string_view schema_kind_to_string(schema_kind k) noexcept {
    switch (k) {
        case schema_kind::primitive: return "primitive";
        case schema_kind::array: return "array";
        case schema_kind::object: return "object";
        case schema_kind::union_type: return "union";
        case schema_kind::intersection: return "intersection";
        case schema_kind::reference: return "reference";
    }
    return "unknown";
}

std::string_view primitive_to_string(primitive_type p) noexcept {
    switch (p) {
        case primitive_type::string: return "string";
        case primitive_type::integer: return "integer";
        case primitive_type::number: return "number";
        case primitive_type::boolean: return "boolean";
        case primitive_type::null_type: return "null";
        case primitive_type::any: return "any";
    }
    return "any";
}

std::string_view location_to_string(param_location l) noexcept {
    switch (l) {
        case param_location::path: return "path";
        case param_location::query: return "query";
        case param_location::header: return "header";
        case param_location::cookie: return "cookie";
    }
    return "query";
}

} // namespace mcpgen
