#include "mcpgen/core/ir_json.hpp"

#include "mcpgen/core/spec_reader.hpp"

namespace mcpgen {

namespace {

spec_node str(std::string_view sv) {
    return spec_node::make_string(std::string(sv));
}

// Literal text stored by the normalizer is always valid JSON; anything else
// is kept as a string.
spec_node literal(std::string_view text) {
    auto parsed = parse_json(text);
    if (!parsed) {
        return str(text);
    }
    return std::move(*parsed);
}

spec_node type_entry(std::string_view type, bool nullable) {
    if (!nullable) {
        return str(type);
    }
    auto types = spec_node::make_array();
    types.push_back(str(type));
    types.push_back(str("null"));
    return types;
}

void add_value_annotations(spec_node& out, const schema_node& s) {
    if (!s.format.empty()) {
        out.set("format", str(s.format));
    }
    if (!s.enum_values.empty()) {
        auto values = spec_node::make_array();
        for (const auto& v : s.enum_values) {
            values.push_back(literal(v));
        }
        out.set("enum", std::move(values));
    }
    if (!s.default_value.empty()) {
        out.set("default", literal(s.default_value));
    }
}

} // namespace

spec_node emit_schema(const schema_node& s, std::string_view ref_prefix) {
    auto out = spec_node::make_object();
    if (!s.description.empty() && s.kind != schema_kind::reference) {
        out.set("description", str(s.description));
    }

    switch (s.kind) {
    case schema_kind::primitive:
        if (s.primitive == primitive_type::any) {
            if (s.nullable) {
                out.set("nullable", spec_node::make_bool(true));
            }
        } else if (s.primitive == primitive_type::null_type) {
            out.set("type", str("null"));
        } else {
            out.set("type", type_entry(primitive_to_string(s.primitive), s.nullable));
        }
        add_value_annotations(out, s);
        break;

    case schema_kind::array:
        out.set("type", type_entry("array", s.nullable));
        if (s.items) {
            out.set("items", emit_schema(*s.items, ref_prefix));
        }
        add_value_annotations(out, s);
        break;

    case schema_kind::object: {
        out.set("type", type_entry("object", s.nullable));
        if (!s.properties.empty()) {
            auto props = spec_node::make_object();
            for (const auto& p : s.properties) {
                props.set(std::string(p.name), p.type ? emit_schema(*p.type, ref_prefix)
                                                      : spec_node::make_object());
            }
            out.set("properties", std::move(props));
        }
        if (!s.required.empty()) {
            auto req = spec_node::make_array();
            for (const auto& r : s.required) {
                req.push_back(str(r));
            }
            out.set("required", std::move(req));
        }
        if (s.additional_properties) {
            out.set("additionalProperties", emit_schema(*s.additional_properties, ref_prefix));
        } else if (!s.additional_properties_allowed) {
            out.set("additionalProperties", spec_node::make_bool(false));
        }
        add_value_annotations(out, s);
        break;
    }

    case schema_kind::union_type: {
        auto variants = spec_node::make_array();
        for (const auto* v : s.variants) {
            variants.push_back(emit_schema(*v, ref_prefix));
        }
        if (s.nullable) {
            auto null_variant = spec_node::make_object();
            null_variant.set("type", str("null"));
            variants.push_back(std::move(null_variant));
        }
        out.set(s.mode == combinator::one_of ? "oneOf" : "anyOf", std::move(variants));
        break;
    }

    case schema_kind::intersection: {
        auto parts = spec_node::make_array();
        for (const auto* v : s.variants) {
            parts.push_back(emit_schema(*v, ref_prefix));
        }
        out.set("allOf", std::move(parts));
        if (s.nullable) {
            out.set("nullable", spec_node::make_bool(true));
        }
        break;
    }

    case schema_kind::reference: {
        auto ref = spec_node::make_object();
        ref.set("$ref", str(std::string(ref_prefix) + std::string(s.ref_name)));
        if (!s.nullable && s.description.empty()) {
            return ref;
        }
        // Annotated references are wrapped so that dialects ignoring
        // keywords next to "$ref" still see them.
        auto parts = spec_node::make_array();
        parts.push_back(std::move(ref));
        out.set("allOf", std::move(parts));
        if (!s.description.empty()) {
            out.set("description", str(s.description));
        }
        if (s.nullable) {
            out.set("nullable", spec_node::make_bool(true));
        }
        break;
    }
    }
    return out;
}

spec_node ir_to_node(const ir_document& doc) {
    auto root = spec_node::make_object();
    root.set("dialect", str(dialect_to_string(doc.source_dialect)));
    root.set("spec_version", str(doc.spec_version));
    root.set("title", str(doc.title));
    root.set("api_version", str(doc.api_version));
    root.set("description", str(doc.description));
    root.set("base_url", str(doc.base_url));

    auto servers = spec_node::make_array();
    for (const auto& s : doc.servers) {
        servers.push_back(str(s));
    }
    root.set("servers", std::move(servers));

    auto operations = spec_node::make_array();
    for (const auto& op : doc.operations) {
        auto o = spec_node::make_object();
        o.set("id", str(op.id));
        o.set("method", str(method_to_string(op.method)));
        o.set("path", str(op.path));
        o.set("summary", str(op.summary));
        o.set("description", str(op.description));
        auto tags = spec_node::make_array();
        for (const auto& t : op.tags) {
            tags.push_back(str(t));
        }
        o.set("tags", std::move(tags));
        o.set("deprecated", spec_node::make_bool(op.deprecated));

        auto params = spec_node::make_array();
        for (const auto& p : op.parameters) {
            auto param = spec_node::make_object();
            param.set("name", str(p.name));
            param.set("in", str(location_to_string(p.location)));
            param.set("required", spec_node::make_bool(p.required));
            if (!p.description.empty()) {
                param.set("description", str(p.description));
            }
            if (p.deprecated) {
                param.set("deprecated", spec_node::make_bool(true));
            }
            param.set("schema", p.schema ? emit_schema(*p.schema) : spec_node::make_object());
            params.push_back(std::move(param));
        }
        o.set("parameters", std::move(params));

        if (op.body) {
            auto body = spec_node::make_object();
            body.set("required", spec_node::make_bool(op.body->required));
            if (!op.body->description.empty()) {
                body.set("description", str(op.body->description));
            }
            body.set("media_type", str(op.body->media_type));
            body.set("schema", op.body->schema ? emit_schema(*op.body->schema)
                                               : spec_node::make_object());
            o.set("request_body", std::move(body));
        } else {
            o.set("request_body", spec_node::make_null());
        }

        if (op.response) {
            auto response = spec_node::make_object();
            response.set("status", spec_node::make_number(std::to_string(op.response_status)));
            response.set("schema", emit_schema(*op.response));
            o.set("response", std::move(response));
        } else {
            o.set("response", spec_node::make_null());
        }

        auto security = spec_node::make_array();
        for (const auto& s : op.security) {
            security.push_back(str(s));
        }
        o.set("security", std::move(security));
        operations.push_back(std::move(o));
    }
    root.set("operations", std::move(operations));

    auto schemas = spec_node::make_object();
    for (const auto& entry : doc.schemas) {
        schemas.set(std::string(entry.name),
                    entry.schema ? emit_schema(*entry.schema) : spec_node::make_object());
    }
    root.set("schemas", std::move(schemas));

    auto warnings = spec_node::make_array();
    for (const auto& w : doc.warnings) {
        auto entry = spec_node::make_object();
        entry.set("location", str(w.location));
        entry.set("message", str(w.message));
        warnings.push_back(std::move(entry));
    }
    root.set("warnings", std::move(warnings));
    return root;
}

std::string to_json(const ir_document& doc, int indent) {
    return write_json(ir_to_node(doc), indent);
}

} // namespace mcpgen
