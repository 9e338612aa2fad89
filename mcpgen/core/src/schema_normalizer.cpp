#include "mcpgen/core/schema_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mcpgen {

namespace {

constexpr int kMaxSchemaDepth = 256;

// Keywords that may sit next to a "$ref" without changing the structure of
// the target.
bool is_annotation_key(std::string_view key) noexcept {
    return key == "description" || key == "summary" || key == "title" || key == "nullable" ||
           key == "deprecated" || key == "readOnly" || key == "writeOnly" || key == "example" ||
           key == "examples" || key == "$comment" || key.starts_with("x-");
}

bool has_object_structure(const spec_node& raw) noexcept {
    return raw.contains("properties") || raw.contains("additionalProperties") ||
           raw.array_at("required") != nullptr;
}

bool has_own_structure(const spec_node& raw) noexcept {
    return has_object_structure(raw) || raw.contains("items") || raw.contains("enum") ||
           raw.contains("const");
}

std::string child_location(std::string_view loc, std::string_view segment) {
    std::string out(loc);
    out.push_back('/');
    out += ref_resolver::escape_segment(segment);
    return out;
}

std::string child_location(std::string_view loc, std::string_view key, size_t index) {
    return child_location(loc, key) + "/" + std::to_string(index);
}

std::string_view infer_type_from_value(const spec_node& value) noexcept {
    switch (value.kind()) {
    case node_kind::string:
        return "string";
    case node_kind::boolean:
        return "boolean";
    case node_kind::number: {
        const auto& t = value.text();
        bool fractional = t.find_first_of(".eE") != std::string::npos;
        return fractional ? "number" : "integer";
    }
    case node_kind::array:
        return "array";
    case node_kind::object:
        return "object";
    case node_kind::null_value:
        break;
    }
    return {};
}

// Marks a pointer as under construction for the lifetime of the object.
class building_mark {
public:
    building_mark(std::unordered_set<std::string>& set, std::string pointer)
        : set_(&set), pointer_(std::move(pointer)) {
        inserted_ = set_->insert(pointer_).second;
    }
    ~building_mark() {
        if (inserted_) {
            set_->erase(pointer_);
        }
    }

    building_mark(const building_mark&) = delete;
    building_mark& operator=(const building_mark&) = delete;

private:
    std::unordered_set<std::string>* set_;
    std::string pointer_;
    bool inserted_;
};

std::string sanitize_identifier(std::string_view raw) {
    std::string out;
    for (char c : raw) {
        out.push_back(std::isalnum(static_cast<unsigned char>(c)) ? c : '_');
    }
    if (out.empty() || std::isdigit(static_cast<unsigned char>(out.front()))) {
        out.insert(0, "Schema_");
    }
    return out;
}

} // namespace

schema_node* schema_normalizer::make_node(schema_kind kind) {
    auto* node = ctx_->arena->make<schema_node>(ctx_->arena);
    node->kind = kind;
    return node;
}

schema_node* schema_normalizer::make_primitive(primitive_type type) {
    auto* node = make_node(schema_kind::primitive);
    node->primitive = type;
    return node;
}

schema_node* schema_normalizer::clone(const schema_node& src) {
    return ctx_->arena->make<schema_node>(src);
}

schema_node* schema_normalizer::make_reference(std::string_view name) {
    auto* node = make_node(schema_kind::reference);
    node->ref_name = make_arena_string(name, ctx_->arena);
    return node;
}

result<const schema_node*> schema_normalizer::normalize(const spec_node& raw,
                                                        std::string_view location) {
    return normalize_at(raw, location, 0);
}

result<void> schema_normalizer::build_registry() {
    const auto* registry = ctx_->adapter->schema_registry_root();
    if (!registry) {
        return {};
    }
    auto prefix = ctx_->adapter->schema_pointer_prefix();
    for (const auto& [name, raw] : registry->members()) {
        std::string loc = std::string(prefix) + ref_resolver::escape_segment(name);
        building_mark mark(ctx_->building, loc);
        auto node = normalize(raw, loc);
        if (!node) {
            return std::unexpected(node.error());
        }
        ctx_->ir.add_schema(name, *node);
    }
    return {};
}

result<const schema_node*>
schema_normalizer::normalize_at(const spec_node& raw, std::string_view loc, int depth) {
    if (depth > kMaxSchemaDepth) {
        return fail(error_code::structural_error, std::string(loc), "schema nesting too deep");
    }
    if (raw.is_bool()) {
        if (!raw.as_bool()) {
            ctx_->warn(loc, "'false' schema treated as unconstrained");
        }
        return make_primitive(primitive_type::any);
    }
    if (!raw.is_object()) {
        return fail(error_code::structural_error, std::string(loc), "schema must be a mapping");
    }
    if (ref_resolver::is_pointer(raw)) {
        return normalize_pointer(raw, loc, depth);
    }
    return build(raw, loc, depth);
}

result<const schema_node*>
schema_normalizer::normalize_pointer(const spec_node& raw, std::string_view loc, int depth) {
    std::string pointer(ref_resolver::pointer_of(raw));
    const bool has_siblings = raw.size() > 1;
    bool structural_siblings = false;
    for (const auto& [key, value] : raw.members()) {
        if (key != "$ref" && !is_annotation_key(key)) {
            structural_siblings = true;
        }
    }

    const bool siblings_apply = has_siblings && ctx_->adapter->supports_ref_siblings();
    if (has_siblings && !siblings_apply && structural_siblings) {
        ctx_->warn(loc, "keywords next to $ref are ignored in this dialect");
    }
    if (siblings_apply && structural_siblings) {
        return normalize_merged(raw, pointer, loc, depth);
    }

    auto target = resolve_target(pointer, depth);
    if (!target || !siblings_apply) {
        return target;
    }
    auto* annotated = clone(**target);
    if (auto desc = raw.string_or("description"); !desc.empty()) {
        annotated->description = make_arena_string(desc, ctx_->arena);
    }
    if (raw.bool_at(ctx_->adapter->nullable_keyword()).value_or(false)) {
        annotated->nullable = true;
    }
    return annotated;
}

result<const schema_node*> schema_normalizer::normalize_merged(const spec_node& raw,
                                                               const std::string& pointer,
                                                               std::string_view loc, int depth) {
    auto& resolver = ctx_->resolver;
    const bool re_entered = ctx_->building.contains(pointer) || resolver.in_progress(pointer);

    if (re_entered) {
        auto name = resolver.registry_name(pointer);
        if (!name) {
            return make_reference(synthesize_name(pointer));
        }
        // Cycle edge into the registry: the entry by name, narrowed by the
        // sibling keywords.
        auto& siblings = ctx_->detached_nodes.emplace_back(raw);
        siblings.erase("$ref");
        auto narrowed = build(siblings, loc, depth + 1);
        if (!narrowed) {
            return narrowed;
        }
        auto* out = make_node(schema_kind::intersection);
        out->variants.push_back(make_reference(*name));
        out->variants.push_back(*narrowed);
        return out;
    }

    auto merged = resolver.deref(raw);
    if (!merged) {
        return std::unexpected(merged.error());
    }
    building_mark mark(ctx_->building, pointer);
    auto built = build(**merged, loc, depth + 1);
    if (!built) {
        return built;
    }

    // The target referred back to this pointer while it was being built. The
    // plain target goes into the registry under the synthesized name.
    auto it = ctx_->synthesized_names.find(pointer);
    if (it != ctx_->synthesized_names.end() && !resolver.in_progress(pointer) &&
        !ctx_->ir.find_schema(it->second)) {
        auto target = resolver.resolve(pointer);
        if (!target) {
            return std::unexpected(target.error());
        }
        auto plain = normalize_at(*target->node, pointer, depth + 1);
        if (!plain) {
            return plain;
        }
        ctx_->ir.add_schema(it->second, *plain);
    }
    return built;
}

result<const schema_node*> schema_normalizer::resolve_target(const std::string& pointer,
                                                             int depth) {
    auto& resolver = ctx_->resolver;
    if (auto name = resolver.registry_name(pointer)) {
        auto r = resolver.resolve(pointer);
        if (!r) {
            return std::unexpected(r.error());
        }
        return make_reference(*name);
    }

    if (auto it = ctx_->synthesized_names.find(pointer); it != ctx_->synthesized_names.end()) {
        return make_reference(it->second);
    }
    if (auto it = ctx_->inline_cache.find(pointer); it != ctx_->inline_cache.end()) {
        return it->second;
    }

    auto r = resolver.resolve(pointer);
    if (!r) {
        return std::unexpected(r.error());
    }
    if (r->cycle) {
        return make_reference(synthesize_name(pointer));
    }

    auto guard = resolver.enter(pointer);
    auto built = normalize_at(*r->node, pointer, depth + 1);
    if (!built) {
        return built;
    }
    // The target pointed back at itself while it was being built: it now
    // lives in the registry and this occurrence refers to it as well.
    if (auto it = ctx_->synthesized_names.find(pointer); it != ctx_->synthesized_names.end()) {
        ctx_->ir.add_schema(it->second, *built);
        return make_reference(it->second);
    }
    ctx_->inline_cache.emplace(pointer, *built);
    return built;
}

std::string schema_normalizer::synthesize_name(const std::string& pointer) {
    if (auto it = ctx_->synthesized_names.find(pointer); it != ctx_->synthesized_names.end()) {
        return it->second;
    }
    auto slash = pointer.rfind('/');
    auto last = slash == std::string::npos ? std::string_view(pointer)
                                           : std::string_view(pointer).substr(slash + 1);
    std::string base = sanitize_identifier(ref_resolver::unescape_segment(last));

    const auto* registry = ctx_->adapter->schema_registry_root();
    auto taken = [&](const std::string& candidate) {
        if (registry && registry->contains(candidate)) {
            return true;
        }
        if (ctx_->ir.find_schema(candidate)) {
            return true;
        }
        for (const auto& [p, n] : ctx_->synthesized_names) {
            if (n == candidate) {
                return true;
            }
        }
        return false;
    };

    std::string candidate = base;
    for (int n = 2; taken(candidate); ++n) {
        candidate = base + "_" + std::to_string(n);
    }
    ctx_->synthesized_names.emplace(pointer, candidate);
    ctx_->warn(pointer, "cyclic schema registered as '" + candidate + "'");
    return candidate;
}

result<const schema_node*>
schema_normalizer::build(const spec_node& raw, std::string_view loc, int depth) {
    const bool flagged_nullable =
        raw.bool_at(ctx_->adapter->nullable_keyword()).value_or(false);

    std::vector<const schema_node*> parts;
    bool had_combinator = false;
    bool saw_null = false;

    if (const auto* all = raw.array_at("allOf")) {
        had_combinator = true;
        size_t i = 0;
        for (const auto& item : all->items()) {
            auto part = normalize_at(item, child_location(loc, "allOf", i++), depth + 1);
            if (!part) {
                return part;
            }
            parts.push_back(*part);
        }
    }

    constexpr std::pair<std::string_view, combinator> alternatives[] = {
        {"oneOf", combinator::one_of},
        {"anyOf", combinator::any_of},
    };
    for (const auto& [key, mode] : alternatives) {
        const auto* list = raw.array_at(key);
        if (!list) {
            continue;
        }
        if (!ctx_->adapter->supports_alternatives()) {
            ctx_->warn(loc, std::string(key) + " is not part of this dialect and was ignored");
            continue;
        }
        had_combinator = true;
        auto part = build_alternatives(*list, mode, child_location(loc, key), depth, saw_null);
        if (!part) {
            return part;
        }
        if (*part) {
            parts.push_back(*part);
        }
    }

    bool type_null = false;
    schema_node* out = nullptr;
    if (!had_combinator || has_own_structure(raw)) {
        auto own = build_own(raw, loc, depth, type_null);
        if (!own) {
            return std::unexpected(own.error());
        }
        if (!had_combinator) {
            out = *own;
        } else {
            parts.push_back(*own);
        }
    }

    if (!out) {
        if (parts.empty()) {
            out = make_primitive(saw_null ? primitive_type::null_type : primitive_type::any);
            saw_null = false;
        } else if (parts.size() == 1) {
            out = clone(*parts.front());
        } else {
            out = make_node(schema_kind::intersection);
            for (const auto* p : parts) {
                out->variants.push_back(p);
            }
        }
    }

    out->nullable = out->nullable || flagged_nullable || type_null || saw_null;
    if (auto desc = raw.string_or("description"); !desc.empty()) {
        out->description = make_arena_string(desc, ctx_->arena);
    }
    return out;
}

result<const schema_node*> schema_normalizer::build_alternatives(const spec_node& list,
                                                                 combinator mode,
                                                                 std::string_view loc,
                                                                 int depth,
                                                                 bool& saw_null) {
    std::vector<const schema_node*> variants;
    size_t i = 0;
    for (const auto& item : list.items()) {
        auto variant = normalize_at(item, child_location(loc, std::to_string(i++)), depth + 1);
        if (!variant) {
            return variant;
        }
        const auto* v = *variant;
        if (v->kind == schema_kind::primitive && v->primitive == primitive_type::null_type) {
            saw_null = true;
            continue;
        }
        variants.push_back(v);
    }
    if (variants.empty()) {
        return nullptr;
    }
    if (variants.size() == 1) {
        return variants.front();
    }
    auto* u = make_node(schema_kind::union_type);
    u->mode = mode;
    for (const auto* v : variants) {
        u->variants.push_back(v);
    }
    return u;
}

result<schema_node*> schema_normalizer::build_own(const spec_node& raw, std::string_view loc,
                                                  int depth, bool& type_null) {
    std::vector<std::string> types;
    if (const auto* t = raw.find("type")) {
        if (t->is_string()) {
            types.push_back(t->text());
        } else if (t->is_array()) {
            for (const auto& item : t->items()) {
                if (item.is_string() &&
                    std::find(types.begin(), types.end(), item.text()) == types.end()) {
                    types.push_back(item.text());
                }
            }
        }
    }

    if (types.empty()) {
        if (has_object_structure(raw)) {
            types.emplace_back("object");
        } else if (raw.contains("items")) {
            types.emplace_back("array");
        } else if (const auto* e = raw.array_at("enum"); e && !e->items().empty()) {
            if (auto inferred = infer_type_from_value(e->items().front()); !inferred.empty()) {
                types.emplace_back(inferred);
            }
        } else if (const auto* c = raw.find("const")) {
            if (auto inferred = infer_type_from_value(*c); !inferred.empty()) {
                types.emplace_back(inferred);
            }
        }
    }

    auto null_it = std::find(types.begin(), types.end(), "null");
    const bool had_null = null_it != types.end();
    if (had_null) {
        types.erase(null_it);
    }

    if (types.empty()) {
        auto* node = make_primitive(had_null ? primitive_type::null_type : primitive_type::any);
        copy_value_annotations(*node, raw);
        return node;
    }
    type_null = had_null;

    if (types.size() == 1) {
        return build_typed(raw, types.front(), loc, depth);
    }
    auto* u = make_node(schema_kind::union_type);
    u->mode = combinator::one_of;
    for (const auto& type : types) {
        auto variant = build_typed(raw, type, loc, depth);
        if (!variant) {
            return variant;
        }
        u->variants.push_back(*variant);
    }
    return u;
}

result<schema_node*> schema_normalizer::build_typed(const spec_node& raw, std::string_view type,
                                                    std::string_view loc, int depth) {
    schema_node* node = nullptr;
    if (type == "object") {
        node = make_node(schema_kind::object);
        if (const auto* props = raw.object_at("properties")) {
            auto props_loc = child_location(loc, "properties");
            for (const auto& [name, value] : props->members()) {
                auto prop_type = normalize_at(value, child_location(props_loc, name), depth + 1);
                if (!prop_type) {
                    return std::unexpected(prop_type.error());
                }
                property p(ctx_->arena);
                p.name = make_arena_string(name, ctx_->arena);
                p.type = *prop_type;
                node->properties.push_back(std::move(p));
            }
        }
        if (const auto* req = raw.array_at("required")) {
            for (const auto& r : req->items()) {
                if (r.is_string() && !node->is_required(r.text())) {
                    node->required.push_back(make_arena_string(r.text(), ctx_->arena));
                }
            }
        }
        if (const auto* extra = raw.find("additionalProperties")) {
            if (extra->is_bool()) {
                node->additional_properties_allowed = extra->as_bool();
            } else if (extra->is_object()) {
                auto extra_type =
                    normalize_at(*extra, child_location(loc, "additionalProperties"), depth + 1);
                if (!extra_type) {
                    return std::unexpected(extra_type.error());
                }
                node->additional_properties = *extra_type;
            }
        }
    } else if (type == "array") {
        node = make_node(schema_kind::array);
        const auto* items = raw.find("items");
        auto items_loc = child_location(loc, "items");
        if (items && items->is_array()) {
            // Tuple form: the item schema is a union of the positions.
            bool saw_null = false;
            auto u = build_alternatives(*items, combinator::one_of, items_loc, depth, saw_null);
            if (!u) {
                return std::unexpected(u.error());
            }
            const schema_node* item = *u;
            if (!item) {
                item = make_primitive(saw_null ? primitive_type::null_type : primitive_type::any);
            } else if (saw_null) {
                auto* copy = clone(*item);
                copy->nullable = true;
                item = copy;
            }
            node->items = item;
        } else if (items && (items->is_object() || items->is_bool())) {
            auto item = normalize_at(*items, items_loc, depth + 1);
            if (!item) {
                return std::unexpected(item.error());
            }
            node->items = *item;
        } else {
            node->items = make_primitive(primitive_type::any);
        }
    } else if (type == "string") {
        node = make_primitive(primitive_type::string);
    } else if (type == "integer") {
        node = make_primitive(primitive_type::integer);
    } else if (type == "number") {
        node = make_primitive(primitive_type::number);
    } else if (type == "boolean") {
        node = make_primitive(primitive_type::boolean);
    } else if (type == "null") {
        node = make_primitive(primitive_type::null_type);
    } else if (type == "file") {
        node = make_primitive(primitive_type::string);
        node->format = make_arena_string("binary", ctx_->arena);
    } else {
        ctx_->warn(loc, "unknown type '" + std::string(type) + "' treated as unconstrained");
        node = make_primitive(primitive_type::any);
    }
    copy_value_annotations(*node, raw);
    return node;
}

void schema_normalizer::copy_value_annotations(schema_node& node, const spec_node& raw) {
    if (auto format = raw.string_or("format"); !format.empty()) {
        node.format = make_arena_string(format, ctx_->arena);
    }
    if (const auto* values = raw.array_at("enum")) {
        for (const auto& v : values->items()) {
            node.enum_values.push_back(make_arena_string(write_json(v), ctx_->arena));
        }
    } else if (const auto* c = raw.find("const")) {
        node.enum_values.push_back(make_arena_string(write_json(*c), ctx_->arena));
    }
    if (const auto* def = raw.find("default")) {
        node.default_value = make_arena_string(write_json(*def), ctx_->arena);
    }
}

bool equivalent(const schema_node& a, const schema_node& b) noexcept {
    if (&a == &b) {
        return true;
    }
    auto same = [](const arena_string<>& x, const arena_string<>& y) {
        return std::string_view(x) == std::string_view(y);
    };
    auto same_list = [&](const arena_vector<arena_string<>>& x,
                         const arena_vector<arena_string<>>& y) {
        if (x.size() != y.size()) {
            return false;
        }
        for (size_t i = 0; i < x.size(); ++i) {
            if (!same(x[i], y[i])) {
                return false;
            }
        }
        return true;
    };
    auto same_ptr = [](const schema_node* x, const schema_node* y) {
        if (!x || !y) {
            return x == y;
        }
        return equivalent(*x, *y);
    };

    if (a.kind != b.kind || a.nullable != b.nullable || !same(a.description, b.description) ||
        !same(a.format, b.format) || !same(a.default_value, b.default_value) ||
        !same_list(a.enum_values, b.enum_values)) {
        return false;
    }

    switch (a.kind) {
    case schema_kind::primitive:
        return a.primitive == b.primitive;
    case schema_kind::array:
        return same_ptr(a.items, b.items);
    case schema_kind::object:
        if (a.properties.size() != b.properties.size() || !same_list(a.required, b.required) ||
            a.additional_properties_allowed != b.additional_properties_allowed ||
            !same_ptr(a.additional_properties, b.additional_properties)) {
            return false;
        }
        for (size_t i = 0; i < a.properties.size(); ++i) {
            if (!same(a.properties[i].name, b.properties[i].name) ||
                !same_ptr(a.properties[i].type, b.properties[i].type)) {
                return false;
            }
        }
        return true;
    case schema_kind::union_type:
    case schema_kind::intersection:
        if (a.mode != b.mode && a.kind == schema_kind::union_type) {
            return false;
        }
        if (a.variants.size() != b.variants.size()) {
            return false;
        }
        for (size_t i = 0; i < a.variants.size(); ++i) {
            if (!same_ptr(a.variants[i], b.variants[i])) {
                return false;
            }
        }
        return true;
    case schema_kind::reference:
        return same(a.ref_name, b.ref_name);
    }
    return false;
}

} // namespace mcpgen
