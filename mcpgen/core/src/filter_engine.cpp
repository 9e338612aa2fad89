#include "mcpgen/core/filter_engine.hpp"

#include <string_view>

namespace mcpgen {

namespace {

bool matches(const operation_descriptor& op, const filter_config& config) {
    for (const auto& tag : config.tags) {
        if (op.has_tag(tag)) {
            return true;
        }
    }
    std::string_view path = op.path;
    for (const auto& fragment : config.path_substrings) {
        if (path.find(fragment) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

void collect_references(const schema_node* node, std::vector<std::string>& pending) {
    if (!node) {
        return;
    }
    switch (node->kind) {
    case schema_kind::reference:
        pending.emplace_back(node->ref_name);
        break;
    case schema_kind::array:
        collect_references(node->items, pending);
        break;
    case schema_kind::object:
        for (const auto& p : node->properties) {
            collect_references(p.type, pending);
        }
        collect_references(node->additional_properties, pending);
        break;
    case schema_kind::union_type:
    case schema_kind::intersection:
        for (const auto* v : node->variants) {
            collect_references(v, pending);
        }
        break;
    case schema_kind::primitive:
        break;
    }
}

} // namespace

result<std::vector<size_t>> select_operations(const arena_vector<operation_descriptor>& ops,
                                              const filter_config& config) {
    std::vector<size_t> selected;
    selected.reserve(ops.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        if (config.selects_everything() || matches(ops[i], config)) {
            selected.push_back(i);
        }
    }
    if (config.max_operations && selected.size() > *config.max_operations) {
        return fail(error_code::operation_count_exceeded,
                    "filter",
                    std::to_string(selected.size()) + " operations selected, maximum is " +
                        std::to_string(*config.max_operations) +
                        "; narrow the selection with tag or path filters");
    }
    return selected;
}

result<void> apply_filter(ir_document& doc, const filter_config& config) {
    auto selected = select_operations(doc.operations, config);
    if (!selected) {
        return std::unexpected(selected.error());
    }
    if (selected->size() == doc.operations.size()) {
        return {};
    }
    arena_vector<operation_descriptor> kept{arena_allocator<operation_descriptor>(doc.arena())};
    kept.reserve(selected->size());
    for (size_t index : *selected) {
        kept.push_back(std::move(doc.operations[index]));
    }
    doc.operations = std::move(kept);
    return {};
}

std::set<std::string> reachable_schemas(const ir_document& doc) {
    std::vector<std::string> pending;
    for (const auto& op : doc.operations) {
        for (const auto& p : op.parameters) {
            collect_references(p.schema, pending);
        }
        if (op.body) {
            collect_references(op.body->schema, pending);
        }
        collect_references(op.response, pending);
    }

    std::set<std::string> reached;
    while (!pending.empty()) {
        std::string name = std::move(pending.back());
        pending.pop_back();
        if (!reached.insert(name).second) {
            continue;
        }
        if (const auto* entry = doc.find_schema(name)) {
            collect_references(entry->schema, pending);
        }
    }
    return reached;
}

size_t prune_unreachable_schemas(ir_document& doc) {
    auto reached = reachable_schemas(doc);
    arena_vector<named_schema> kept{arena_allocator<named_schema>(doc.arena())};
    for (auto& entry : doc.schemas) {
        if (reached.contains(std::string(entry.name))) {
            kept.push_back(std::move(entry));
        }
    }
    size_t removed = doc.schemas.size() - kept.size();
    doc.schemas = std::move(kept);
    return removed;
}

} // namespace mcpgen
