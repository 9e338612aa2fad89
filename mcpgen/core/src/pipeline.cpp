#include "mcpgen/core/pipeline.hpp"

#include "mcpgen/core/operation_extractor.hpp"
#include "mcpgen/core/run_context.hpp"
#include "mcpgen/core/schema_normalizer.hpp"

#include <algorithm>
#include <iterator>

namespace mcpgen {

result<ir_document> build_ir(const spec_document& doc, monotonic_arena& arena,
                             const build_options& options) {
    auto adapter = detect_dialect(doc);
    if (!adapter) {
        return std::unexpected(adapter.error());
    }

    run_context ctx(std::move(*adapter), arena);
    auto& ir = ctx.ir;
    const auto& root = ctx.adapter->root();
    const spec_node* info = root.object_at("info");

    ir.source_dialect = ctx.adapter->tag();
    ir.spec_version = ir.make_string(ctx.adapter->version());
    if (info) {
        ir.title = ir.make_string(info->string_or("title"));
        ir.api_version = ir.make_string(info->string_or("version"));
        ir.description = ir.make_string(info->string_or("description"));
    }
    ir.base_url = ir.make_string(options.base_url_override.empty() ? ctx.adapter->base_url()
                                                                    : options.base_url_override);
    for (const auto& server : ctx.adapter->servers()) {
        ir.servers.push_back(ir.make_string(server));
    }

    schema_normalizer normalizer(ctx);
    operation_extractor extractor(ctx, normalizer);

    if (options.validate) {
        if (auto r = extractor.validate_structure(); !r) {
            return std::unexpected(r.error());
        }
    }
    if (auto r = normalizer.build_registry(); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = extractor.extract_all(); !r) {
        return std::unexpected(r.error());
    }

    if (options.filter.selects_everything() && ir.operations.size() > LARGE_OPERATION_COUNT) {
        ctx.warn("#/paths",
                 std::to_string(ir.operations.size()) +
                     " operations selected without filters; consider --tag or --path-filter");
    }
    if (auto r = apply_filter(ir, options.filter); !r) {
        return std::unexpected(r.error());
    }
    if (options.prune_schemas) {
        prune_unreachable_schemas(ir);
    }
    return std::move(ir);
}

result<spec_summary> summarize(const spec_document& doc) {
    monotonic_arena arena;
    auto ir = build_ir(doc, arena);
    if (!ir) {
        return std::unexpected(ir.error());
    }

    spec_summary out;
    out.source_dialect = ir->source_dialect;
    out.spec_version = std::string(ir->spec_version);
    out.title = std::string(ir->title);
    out.api_version = std::string(ir->api_version);
    out.description = std::string(ir->description);
    out.base_url = std::string(ir->base_url);
    for (const auto& s : ir->servers) {
        out.servers.emplace_back(s);
    }
    if (const auto* paths = doc.root.object_at("paths")) {
        out.path_count = paths->size();
        for (const auto& [path, item] : paths->members()) {
            out.paths.push_back(path);
        }
    }
    out.operation_count = ir->operations.size();
    for (const auto& s : ir->schemas) {
        out.schema_names.emplace_back(s.name);
    }

    for (const auto& op : ir->operations) {
        operation_summary entry{std::string(op.id), std::string(method_to_string(op.method)),
                                std::string(op.path), std::string(op.summary), op.deprecated};
        for (const auto& tag : op.tags) {
            std::string_view tag_view = tag;
            auto group = std::find_if(out.operations_by_tag.begin(), out.operations_by_tag.end(),
                                      [&](const auto& g) { return g.first == tag_view; });
            if (group == out.operations_by_tag.end()) {
                out.operations_by_tag.emplace_back(std::string(tag_view),
                                                   std::vector<operation_summary>{});
                group = std::prev(out.operations_by_tag.end());
            }
            group->second.push_back(entry);
        }
    }
    for (const auto& w : ir->warnings) {
        std::string line(w.location);
        line += ": ";
        line += std::string_view(w.message);
        out.warnings.push_back(std::move(line));
    }
    return out;
}

} // namespace mcpgen
