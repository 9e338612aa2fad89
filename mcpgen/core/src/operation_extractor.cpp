#include "mcpgen/core/operation_extractor.hpp"

#include "mcpgen/core/serde.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace mcpgen {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

int media_rank(std::string_view media) {
    auto base = lower(serde::trim_view(media.substr(0, media.find(';'))));
    std::string_view b = base;
    if (b == "application/json") {
        return 0;
    }
    if (b.ends_with("+json") || b.ends_with("/json")) {
        return 1;
    }
    if (b == "application/x-www-form-urlencoded") {
        return 2;
    }
    return 3;
}

std::string child_location(std::string_view loc, std::string_view segment) {
    std::string out(loc);
    out.push_back('/');
    out += ref_resolver::escape_segment(segment);
    return out;
}

std::string describe(http_method method, std::string_view path) {
    std::string out(method_to_string(method));
    out.push_back(' ');
    out += path;
    return out;
}

std::optional<int> success_status(std::string_view key) noexcept {
    int code = 0;
    auto [end, ec] = std::from_chars(key.data(), key.data() + key.size(), code);
    if (ec != std::errc() || end != key.data() + key.size() || code < 200 || code > 299) {
        return std::nullopt;
    }
    return code;
}

std::optional<param_location> parse_location(std::string_view in) noexcept {
    if (in == "path") return param_location::path;
    if (in == "query") return param_location::query;
    if (in == "header") return param_location::header;
    if (in == "cookie") return param_location::cookie;
    return std::nullopt;
}

} // namespace

std::optional<size_t> preferred_media_type(const spec_node& content) noexcept {
    std::optional<size_t> best;
    int best_rank = 0;
    const auto& members = content.members();
    for (size_t i = 0; i < members.size(); ++i) {
        int rank = media_rank(members[i].first);
        if (!best || rank < best_rank) {
            best = i;
            best_rank = rank;
        }
    }
    return best;
}

std::string derive_operation_id(http_method method, std::string_view path) {
    std::string body;
    bool pending_separator = false;
    for (char c : path) {
        if (c == '{' || c == '}') {
            continue;
        }
        if (std::isalnum(static_cast<unsigned char>(c))) {
            if (pending_separator && !body.empty()) {
                body.push_back('_');
            }
            pending_separator = false;
            body.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        } else {
            pending_separator = true;
        }
    }
    if (body.empty()) {
        body = "root";
    }
    std::string id(method_key(method));
    id.push_back('_');
    id += body;
    return id;
}

std::vector<std::string> path_template_names(std::string_view path) {
    std::vector<std::string> names;
    size_t pos = 0;
    while ((pos = path.find('{', pos)) != std::string_view::npos) {
        auto close = path.find('}', pos);
        if (close == std::string_view::npos) {
            break;
        }
        auto name = path.substr(pos + 1, close - pos - 1);
        if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
            names.emplace_back(name);
        }
        pos = close + 1;
    }
    return names;
}

result<void> operation_extractor::validate_structure() {
    const auto* paths = ctx_->adapter->root().find("paths");
    if (!paths) {
        return {};
    }
    if (!paths->is_object()) {
        return fail(error_code::structural_error, "#/paths", "paths must be a mapping");
    }

    auto check_parameters = [](const spec_node& owner,
                               const std::string& loc) -> result<void> {
        const auto* params = owner.find("parameters");
        if (!params) {
            return {};
        }
        if (!params->is_array()) {
            return fail(error_code::structural_error,
                        child_location(loc, "parameters"),
                        "parameters must be a list");
        }
        for (size_t i = 0; i < params->items().size(); ++i) {
            if (!params->items()[i].is_object()) {
                return fail(error_code::structural_error,
                            child_location(loc, "parameters") + "/" + std::to_string(i),
                            "parameter must be a mapping");
            }
        }
        return {};
    };

    for (const auto& [path, raw_item] : paths->members()) {
        std::string loc = child_location("#/paths", path);
        if (!raw_item.is_object()) {
            return fail(error_code::structural_error, loc, "path item must be a mapping");
        }
        auto item = ctx_->resolver.deref(raw_item);
        if (!item) {
            return std::unexpected(item.error());
        }
        if (!(*item)->is_object()) {
            return fail(error_code::structural_error, loc, "path item must be a mapping");
        }
        if (auto r = check_parameters(**item, loc); !r) {
            return r;
        }
        for (const auto& [key, op] : (*item)->members()) {
            if (parse_method_key(key) == http_method::unknown) {
                continue;
            }
            std::string op_loc = child_location(loc, key);
            if (!op.is_object()) {
                return fail(error_code::structural_error, op_loc, "operation must be a mapping");
            }
            if (auto r = check_parameters(op, op_loc); !r) {
                return r;
            }
            if (const auto* responses = op.find("responses"); responses && !responses->is_object()) {
                return fail(error_code::structural_error,
                            child_location(op_loc, "responses"),
                            "responses must be a mapping");
            }
            if (const auto* body = op.find("requestBody"); body && !body->is_object()) {
                return fail(error_code::structural_error,
                            child_location(op_loc, "requestBody"),
                            "requestBody must be a mapping");
            }
        }
    }
    return {};
}

result<void> operation_extractor::extract_all() {
    const auto* paths = ctx_->adapter->root().object_at("paths");
    if (!paths) {
        ctx_->warn("#/paths", "document declares no paths");
        return {};
    }
    for (const auto& [path, raw_item] : paths->members()) {
        std::string loc = child_location("#/paths", path);
        auto item = ctx_->resolver.deref(raw_item);
        if (!item) {
            return std::unexpected(item.error());
        }
        auto path_params = collect_parameters((*item)->find("parameters"), loc);
        if (!path_params) {
            return std::unexpected(path_params.error());
        }
        for (const auto& [key, op] : (*item)->members()) {
            auto method = parse_method_key(key);
            if (method == http_method::unknown) {
                continue;
            }
            if (auto r = extract_operation(path, method, op, *path_params, child_location(loc, key));
                !r) {
                return r;
            }
        }
    }
    return {};
}

result<std::vector<operation_extractor::raw_parameter>>
operation_extractor::collect_parameters(const spec_node* list, std::string_view loc) {
    std::vector<raw_parameter> out;
    if (!list || !list->is_array()) {
        return out;
    }
    auto list_loc = child_location(loc, "parameters");
    for (size_t i = 0; i < list->items().size(); ++i) {
        std::string item_loc = list_loc + "/" + std::to_string(i);
        const auto& raw = list->items()[i];
        if (auto pointer = ref_resolver::pointer_of(raw); !pointer.empty()) {
            item_loc = std::string(pointer);
        }
        // Resolved before any field is read.
        auto node = ctx_->resolver.deref(raw);
        if (!node) {
            return std::unexpected(node.error());
        }
        const auto* p = *node;
        auto name = p->string_or("name");
        auto in = p->string_or("in");
        if (name.empty() || in.empty()) {
            return fail(error_code::structural_error, item_loc,
                        "parameter needs both 'name' and 'in'");
        }

        raw_parameter param{std::string(name), std::string(in), p, item_loc};
        auto same = std::find_if(out.begin(), out.end(), [&](const raw_parameter& existing) {
            return existing.name == param.name && existing.in == param.in;
        });
        if (same != out.end()) {
            ctx_->warn(item_loc, "parameter '" + param.name + "' in " + param.in +
                                     " declared twice; the later declaration wins");
            *same = std::move(param);
        } else {
            out.push_back(std::move(param));
        }
    }
    return out;
}

std::vector<std::string> operation_extractor::consumes(const spec_node& op) const {
    const spec_node* list = op.array_at("consumes");
    if (!list) {
        list = ctx_->adapter->root().array_at("consumes");
    }
    std::vector<std::string> out;
    if (list) {
        for (const auto& item : list->items()) {
            if (item.is_string()) {
                out.push_back(item.text());
            }
        }
    }
    return out;
}

result<void> operation_extractor::extract_operation(std::string_view path,
                                                    http_method method,
                                                    const spec_node& op,
                                                    const std::vector<raw_parameter>& path_params,
                                                    std::string_view op_loc) {
    const std::string where = describe(method, path);
    operation_descriptor out(ctx_->arena);
    out.method = method;
    out.path = make_arena_string(path, ctx_->arena);
    out.summary = make_arena_string(op.string_or("summary"), ctx_->arena);
    out.description = make_arena_string(op.string_or("description"), ctx_->arena);
    out.deprecated = op.bool_at("deprecated").value_or(false);

    // Identifier.
    std::string id(op.string_or("operationId"));
    if (id.empty()) {
        id = derive_operation_id(method, path);
    }
    if (auto it = ids_.find(id); it != ids_.end()) {
        return fail(error_code::duplicate_operation_id, where,
                    "'" + id + "' is also used by " + it->second);
    }
    ids_.emplace(id, where);
    out.id = make_arena_string(id, ctx_->arena);

    // Tags.
    if (const auto* tags = op.array_at("tags")) {
        for (const auto& t : tags->items()) {
            if (t.is_string() && !t.text().empty() && !out.has_tag(t.text())) {
                out.tags.push_back(make_arena_string(t.text(), ctx_->arena));
            }
        }
    }
    if (out.tags.empty()) {
        out.tags.push_back(make_arena_string("default", ctx_->arena));
    }

    // Parameters: operation-level entries replace path-level ones with the
    // same name and location, in place.
    auto own_params = collect_parameters(op.find("parameters"), op_loc);
    if (!own_params) {
        return std::unexpected(own_params.error());
    }
    std::vector<raw_parameter> merged = path_params;
    for (auto& p : *own_params) {
        auto same = std::find_if(merged.begin(), merged.end(), [&](const raw_parameter& existing) {
            return existing.name == p.name && existing.in == p.in;
        });
        if (same != merged.end()) {
            *same = std::move(p);
        } else {
            merged.push_back(std::move(p));
        }
    }

    // Payload parameters only exist in the dialect without a requestBody
    // field; they are folded into the body and never reach the list.
    const bool payload_in_parameters = !ctx_->adapter->has_request_body_field();
    const raw_parameter* body_param = nullptr;
    std::vector<const raw_parameter*> form_fields;
    for (const auto& p : merged) {
        if (payload_in_parameters && p.in == "body") {
            if (body_param) {
                return fail(error_code::ambiguous_request_body, where,
                            "body parameters '" + body_param->name + "' and '" + p.name + "'");
            }
            body_param = &p;
            continue;
        }
        if (payload_in_parameters && p.in == "formData") {
            form_fields.push_back(&p);
            continue;
        }
        parameter_descriptor param(ctx_->arena);
        if (auto r = fill_parameter(param, p, where); !r) {
            return r;
        }
        out.parameters.push_back(std::move(param));
    }

    if (body_param && !form_fields.empty()) {
        return fail(error_code::ambiguous_request_body, where,
                    "both a body parameter and formData parameters are declared");
    }

    for (const auto& name : path_template_names(path)) {
        if (!out.find_parameter(name, param_location::path)) {
            ctx_->warn(op_loc, "path parameter '" + name + "' is not declared; added as string");
            parameter_descriptor param(ctx_->arena);
            param.name = make_arena_string(name, ctx_->arena);
            param.location = param_location::path;
            param.required = true;
            param.schema = normalizer_->make_primitive(primitive_type::string);
            out.parameters.push_back(std::move(param));
        }
    }

    // Payload.
    if (body_param) {
        auto body = body_from_parameter(*body_param, op, where);
        if (!body) {
            return std::unexpected(body.error());
        }
        out.body = *body;
    } else if (!form_fields.empty()) {
        auto body = body_from_form(form_fields, op);
        if (!body) {
            return std::unexpected(body.error());
        }
        out.body = *body;
    } else if (const auto* raw_body = op.find("requestBody");
               raw_body && ctx_->adapter->has_request_body_field()) {
        auto body = body_from_field(*raw_body, child_location(op_loc, "requestBody"));
        if (!body) {
            return std::unexpected(body.error());
        }
        out.body = *body;
    }

    if (auto r = fill_response(out, op, op_loc); !r) {
        return r;
    }

    // Security requirement names, falling back to the document level.
    const spec_node* security = op.array_at("security");
    if (!security) {
        security = ctx_->adapter->root().array_at("security");
    }
    if (security) {
        for (const auto& requirement : security->items()) {
            for (const auto& [scheme, scopes] : requirement.members()) {
                bool seen = std::any_of(out.security.begin(), out.security.end(),
                                        [&](const arena_string<>& s) {
                                            return std::string_view(s) == scheme;
                                        });
                if (!seen) {
                    out.security.push_back(make_arena_string(scheme, ctx_->arena));
                }
            }
        }
    }

    ctx_->ir.operations.push_back(std::move(out));
    return {};
}

result<void> operation_extractor::fill_parameter(parameter_descriptor& out,
                                                 const raw_parameter& raw,
                                                 std::string_view where) {
    auto location = parse_location(raw.in);
    if (!location) {
        return fail(error_code::structural_error, raw.location,
                    "unknown parameter location '" + raw.in + "' in " + std::string(where));
    }
    const auto& node = *raw.node;
    out.name = make_arena_string(raw.name, ctx_->arena);
    out.location = *location;
    out.required = *location == param_location::path || node.bool_at("required").value_or(false);
    out.deprecated = node.bool_at("deprecated").value_or(false);
    out.description = make_arena_string(node.string_or("description"), ctx_->arena);

    if (!ctx_->adapter->has_request_body_field()) {
        // Swagger 2 keeps the type keywords on the parameter itself.
        if (!node.contains("type")) {
            out.schema = normalizer_->make_primitive(primitive_type::string);
            return {};
        }
        auto schema = normalizer_->normalize(node, raw.location);
        if (!schema) {
            return std::unexpected(schema.error());
        }
        out.schema = *schema;
        return {};
    }

    if (const auto* schema_raw = node.find("schema")) {
        auto schema = normalizer_->normalize(*schema_raw, child_location(raw.location, "schema"));
        if (!schema) {
            return std::unexpected(schema.error());
        }
        out.schema = *schema;
        return {};
    }
    if (const auto* content = node.object_at("content"); content && content->size() > 0) {
        auto schema = content_schema(*content, child_location(raw.location, "content"), nullptr);
        if (!schema) {
            return std::unexpected(schema.error());
        }
        out.schema = *schema ? *schema : normalizer_->make_primitive(primitive_type::string);
        return {};
    }
    out.schema = normalizer_->make_primitive(primitive_type::string);
    return {};
}

result<const request_body_descriptor*>
operation_extractor::body_from_parameter(const raw_parameter& raw, const spec_node& op,
                                         std::string_view where) {
    const auto* schema_raw = raw.node->find("schema");
    if (!schema_raw) {
        return fail(error_code::structural_error, raw.location,
                    "body parameter of " + std::string(where) + " has no schema");
    }
    auto schema = normalizer_->normalize(*schema_raw, child_location(raw.location, "schema"));
    if (!schema) {
        return std::unexpected(schema.error());
    }

    auto* body = ctx_->arena->make<request_body_descriptor>(ctx_->arena);
    body->required = raw.node->bool_at("required").value_or(false);
    body->description = make_arena_string(raw.node->string_or("description"), ctx_->arena);
    body->schema = *schema;

    std::string media = "application/json";
    auto declared = consumes(op);
    if (!declared.empty()) {
        auto best = std::min_element(declared.begin(), declared.end(),
                                     [](const std::string& a, const std::string& b) {
                                         return media_rank(a) < media_rank(b);
                                     });
        media = *best;
    }
    body->media_type = make_arena_string(media, ctx_->arena);
    return body;
}

result<const request_body_descriptor*>
operation_extractor::body_from_form(const std::vector<const raw_parameter*>& fields,
                                    const spec_node& op) {
    auto* object = normalizer_->make_node(schema_kind::object);
    bool any_required = false;
    bool has_file = false;
    for (const auto* field : fields) {
        const auto& node = *field->node;
        const schema_node* type = nullptr;
        if (node.contains("type")) {
            auto normalized = normalizer_->normalize(node, field->location);
            if (!normalized) {
                return std::unexpected(normalized.error());
            }
            type = *normalized;
        } else {
            type = normalizer_->make_primitive(primitive_type::string);
        }
        has_file = has_file || node.string_or("type") == "file";

        property p(ctx_->arena);
        p.name = make_arena_string(field->name, ctx_->arena);
        p.type = type;
        object->properties.push_back(std::move(p));
        if (node.bool_at("required").value_or(false)) {
            object->required.push_back(make_arena_string(field->name, ctx_->arena));
            any_required = true;
        }
    }

    std::string media = "application/x-www-form-urlencoded";
    if (has_file) {
        media = "multipart/form-data";
    } else {
        for (const auto& declared : consumes(op)) {
            std::string_view type = declared;
            auto base = lower(serde::trim_view(type.substr(0, type.find(';'))));
            if (base == "application/x-www-form-urlencoded" || base == "multipart/form-data") {
                media = declared;
                break;
            }
        }
    }

    auto* body = ctx_->arena->make<request_body_descriptor>(ctx_->arena);
    body->required = any_required;
    body->media_type = make_arena_string(media, ctx_->arena);
    body->schema = object;
    return body;
}

result<const request_body_descriptor*>
operation_extractor::body_from_field(const spec_node& raw_body, std::string_view loc) {
    std::string body_loc(loc);
    if (auto pointer = ref_resolver::pointer_of(raw_body); !pointer.empty()) {
        body_loc = std::string(pointer);
    }
    auto node = ctx_->resolver.deref(raw_body);
    if (!node) {
        return std::unexpected(node.error());
    }
    const auto* content = (*node)->object_at("content");
    if (!content || content->size() == 0) {
        ctx_->warn(body_loc, "request body declares no content; ignored");
        return nullptr;
    }

    std::string media;
    auto schema = content_schema(*content, child_location(body_loc, "content"), &media);
    if (!schema) {
        return std::unexpected(schema.error());
    }

    auto* body = ctx_->arena->make<request_body_descriptor>(ctx_->arena);
    body->required = (*node)->bool_at("required").value_or(false);
    body->description = make_arena_string((*node)->string_or("description"), ctx_->arena);
    body->media_type = make_arena_string(media, ctx_->arena);
    body->schema = *schema ? *schema : normalizer_->make_primitive(primitive_type::any);
    return body;
}

result<const schema_node*> operation_extractor::content_schema(const spec_node& content,
                                                               std::string_view loc,
                                                               std::string* media) {
    auto index = preferred_media_type(content);
    if (!index) {
        return nullptr;
    }
    const auto& [type, entry] = content.members()[*index];
    if (media) {
        *media = type;
    }
    const auto* schema_raw = entry.find("schema");
    if (!schema_raw) {
        return nullptr;
    }
    return normalizer_->normalize(*schema_raw,
                                  child_location(child_location(loc, type), "schema"));
}

result<void> operation_extractor::fill_response(operation_descriptor& out, const spec_node& op,
                                                std::string_view op_loc) {
    const auto* responses = op.object_at("responses");
    if (!responses) {
        return {};
    }
    std::vector<std::pair<int, const spec_node::member*>> candidates;
    for (const auto& m : responses->members()) {
        if (auto code = success_status(m.first)) {
            candidates.emplace_back(*code, &m);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    auto responses_loc = child_location(op_loc, "responses");
    for (const auto& [code, member] : candidates) {
        std::string loc = child_location(responses_loc, member->first);
        if (auto pointer = ref_resolver::pointer_of(member->second); !pointer.empty()) {
            loc = std::string(pointer);
        }
        auto node = ctx_->resolver.deref(member->second);
        if (!node) {
            return std::unexpected(node.error());
        }
        if (!(*node)->is_object()) {
            return fail(error_code::structural_error, loc, "response must be a mapping");
        }

        const schema_node* schema = nullptr;
        if (!ctx_->adapter->has_request_body_field()) {
            if (const auto* schema_raw = (*node)->find("schema")) {
                auto normalized = normalizer_->normalize(*schema_raw, child_location(loc, "schema"));
                if (!normalized) {
                    return std::unexpected(normalized.error());
                }
                schema = *normalized;
            }
        } else if (const auto* content = (*node)->object_at("content")) {
            auto normalized = content_schema(*content, child_location(loc, "content"), nullptr);
            if (!normalized) {
                return std::unexpected(normalized.error());
            }
            schema = *normalized;
        }

        if (schema) {
            out.response = schema;
            out.response_status = code;
            return {};
        }
    }
    return {};
}

} // namespace mcpgen
