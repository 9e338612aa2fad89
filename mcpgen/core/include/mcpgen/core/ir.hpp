#pragma once

#include "arena.hpp"
#include "dialect.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace mcpgen {

enum class http_method : uint8_t { get, put, post, del, options, head, patch, trace, unknown };

// Lower-case key as written under a path item ("get", "delete", ...).
http_method parse_method_key(std::string_view key) noexcept;
std::string_view method_key(http_method m) noexcept;
// Upper-case form ("GET", "DELETE", ...).
std::string_view method_to_string(http_method m) noexcept;

enum class schema_kind : uint8_t { primitive, array, object, union_type, intersection, reference };

enum class primitive_type : uint8_t { string, integer, number, boolean, null_type, any };

enum class combinator : uint8_t { one_of, any_of };

enum class param_location : uint8_t { path, query, header, cookie };

std::string_view schema_kind_to_string(schema_kind k) noexcept;
std::string_view primitive_to_string(primitive_type p) noexcept;
std::string_view location_to_string(param_location l) noexcept;

struct schema_node;

struct property {
    explicit property(monotonic_arena* arena = nullptr) : name(arena_allocator<char>(arena)) {}

    arena_string<> name;
    const schema_node* type = nullptr;
};

// Canonical, dialect-independent schema. Nodes are arena-allocated and
// immutable once built; registry schemas are only ever pointed at through
// reference nodes.
struct schema_node {
    explicit schema_node(monotonic_arena* arena = nullptr)
        : properties(arena_allocator<property>(arena)),
          required(arena_allocator<arena_string<>>(arena)),
          variants(arena_allocator<const schema_node*>(arena)),
          ref_name(arena_allocator<char>(arena)), description(arena_allocator<char>(arena)),
          format(arena_allocator<char>(arena)), default_value(arena_allocator<char>(arena)),
          enum_values(arena_allocator<arena_string<>>(arena)) {}

    schema_kind kind{schema_kind::primitive};
    primitive_type primitive{primitive_type::any};
    combinator mode{combinator::one_of};
    bool nullable = false;

    const schema_node* items = nullptr;           // array
    arena_vector<property> properties;            // object, document order
    arena_vector<arena_string<>> required;        // object, declaration order
    const schema_node* additional_properties = nullptr;
    bool additional_properties_allowed = true;
    arena_vector<const schema_node*> variants;    // union / intersection
    arena_string<> ref_name;                      // reference

    arena_string<> description;
    arena_string<> format;
    arena_string<> default_value;                 // JSON literal text
    arena_vector<arena_string<>> enum_values;     // JSON literal text

    [[nodiscard]] bool is_required(std::string_view name) const noexcept {
        for (const auto& r : required) {
            if (std::string_view(r) == name) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] const property* find_property(std::string_view name) const noexcept {
        for (const auto& p : properties) {
            if (std::string_view(p.name) == name) {
                return &p;
            }
        }
        return nullptr;
    }
};

struct parameter_descriptor {
    explicit parameter_descriptor(monotonic_arena* arena = nullptr)
        : name(arena_allocator<char>(arena)), description(arena_allocator<char>(arena)) {}

    arena_string<> name;
    param_location location{param_location::query};
    bool required = false;
    bool deprecated = false;
    arena_string<> description;
    const schema_node* schema = nullptr;
};

struct request_body_descriptor {
    explicit request_body_descriptor(monotonic_arena* arena = nullptr)
        : description(arena_allocator<char>(arena)), media_type(arena_allocator<char>(arena)) {}

    bool required = false;
    arena_string<> description;
    arena_string<> media_type;
    const schema_node* schema = nullptr;
};

struct operation_descriptor {
    explicit operation_descriptor(monotonic_arena* arena = nullptr)
        : id(arena_allocator<char>(arena)), path(arena_allocator<char>(arena)),
          summary(arena_allocator<char>(arena)), description(arena_allocator<char>(arena)),
          tags(arena_allocator<arena_string<>>(arena)),
          parameters(arena_allocator<parameter_descriptor>(arena)),
          security(arena_allocator<arena_string<>>(arena)) {}

    arena_string<> id;
    http_method method = http_method::unknown;
    arena_string<> path;
    arena_string<> summary;
    arena_string<> description;
    arena_vector<arena_string<>> tags;
    bool deprecated = false;
    arena_vector<parameter_descriptor> parameters;
    const request_body_descriptor* body = nullptr;
    const schema_node* response = nullptr;
    int response_status = 0; // 0 when no typed response
    arena_vector<arena_string<>> security;

    [[nodiscard]] bool has_tag(std::string_view tag) const noexcept {
        for (const auto& t : tags) {
            if (std::string_view(t) == tag) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] const parameter_descriptor* find_parameter(std::string_view name,
                                                             param_location in) const noexcept {
        for (const auto& p : parameters) {
            if (p.location == in && std::string_view(p.name) == name) {
                return &p;
            }
        }
        return nullptr;
    }
};

struct named_schema {
    explicit named_schema(monotonic_arena* arena = nullptr) : name(arena_allocator<char>(arena)) {}

    arena_string<> name;
    const schema_node* schema = nullptr;
};

struct ir_warning {
    explicit ir_warning(monotonic_arena* arena = nullptr)
        : location(arena_allocator<char>(arena)), message(arena_allocator<char>(arena)) {}

    arena_string<> location;
    arena_string<> message;
};

// The hand-off to the generator. Owns nothing: every string, vector and node
// lives in the arena passed to the constructor.
struct ir_document {
    explicit ir_document(monotonic_arena& arena) noexcept
        : arena_(&arena), spec_version(arena_allocator<char>(&arena)),
          title(arena_allocator<char>(&arena)), api_version(arena_allocator<char>(&arena)),
          description(arena_allocator<char>(&arena)), base_url(arena_allocator<char>(&arena)),
          servers(arena_allocator<arena_string<>>(&arena)),
          operations(arena_allocator<operation_descriptor>(&arena)),
          schemas(arena_allocator<named_schema>(&arena)),
          warnings(arena_allocator<ir_warning>(&arena)) {}

    ir_document(const ir_document&) = delete;
    ir_document& operator=(const ir_document&) = delete;
    ir_document(ir_document&&) noexcept = default;
    ir_document& operator=(ir_document&&) = default;

    [[nodiscard]] arena_string<> make_string(std::string_view sv) const {
        return make_arena_string(sv, arena_);
    }

    named_schema& add_schema(std::string_view name, const schema_node* schema) {
        schemas.emplace_back(arena_);
        auto& s = schemas.back();
        s.name = make_string(name);
        s.schema = schema;
        return s;
    }

    operation_descriptor& add_operation() {
        operations.emplace_back(arena_);
        return operations.back();
    }

    void add_warning(std::string_view location, std::string_view message) {
        warnings.emplace_back(arena_);
        warnings.back().location = make_string(location);
        warnings.back().message = make_string(message);
    }

    [[nodiscard]] const named_schema* find_schema(std::string_view name) const noexcept {
        for (const auto& s : schemas) {
            if (std::string_view(s.name) == name) {
                return &s;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const operation_descriptor* find_operation(std::string_view id) const noexcept {
        for (const auto& op : operations) {
            if (std::string_view(op.id) == id) {
                return &op;
            }
        }
        return nullptr;
    }

    [[nodiscard]] monotonic_arena* arena() const noexcept { return arena_; }

    monotonic_arena* arena_;
    dialect source_dialect = dialect::openapi_3_0;
    arena_string<> spec_version;
    arena_string<> title;
    arena_string<> api_version;
    arena_string<> description;
    arena_string<> base_url;
    arena_vector<arena_string<>> servers;
    arena_vector<operation_descriptor> operations;
    arena_vector<named_schema> schemas;
    arena_vector<ir_warning> warnings;
};

} // namespace mcpgen
