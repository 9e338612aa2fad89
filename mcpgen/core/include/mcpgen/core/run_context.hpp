#pragma once

#include "arena.hpp"
#include "dialect.hpp"
#include "ir.hpp"
#include "ref_resolver.hpp"
#include "spec_node.hpp"

#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace mcpgen {

// Everything one generation run shares: the adapter, the reference cache, the
// IR under construction and the bookkeeping of the normalizer. Created per
// run and passed explicitly; nothing here is global.
struct run_context {
    run_context(std::unique_ptr<dialect_adapter> dialect_view, monotonic_arena& ir_arena)
        : adapter(std::move(dialect_view)), resolver(*adapter), arena(&ir_arena),
          ir(ir_arena) {}

    run_context(const run_context&) = delete;
    run_context& operator=(const run_context&) = delete;

    void warn(std::string_view location, std::string_view message) {
        ir.add_warning(location, message);
    }

    std::unique_ptr<dialect_adapter> adapter;
    ref_resolver resolver;
    monotonic_arena* arena;
    ir_document ir;

    // Normalized targets of pointers outside the registry, by pointer string.
    std::unordered_map<std::string, const schema_node*> inline_cache;
    // Registry names given to pointers outside the registry that turned out
    // to be cyclic.
    std::unordered_map<std::string, std::string> synthesized_names;
    // Registry entries under construction and pointers whose target is being
    // built with "$ref" siblings merged in. Kept apart from the resolver's
    // in-progress set so pointer walks through them still succeed.
    std::unordered_set<std::string> building;
    // Raw nodes assembled during the run; stable for the resolver's caches.
    std::deque<spec_node> detached_nodes;
};

} // namespace mcpgen
