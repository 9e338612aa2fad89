#pragma once

#include "ir.hpp"
#include "result.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpgen {

struct filter_config {
    std::vector<std::string> tags;
    std::vector<std::string> path_substrings;
    std::optional<size_t> max_operations;

    [[nodiscard]] bool selects_everything() const noexcept {
        return tags.empty() && path_substrings.empty();
    }
};

// Indices of the retained operations, in original order. An operation is
// retained when it carries one of the tags or its path contains one of the
// substrings; with no tags and no substrings everything is retained. Fails
// with operation_count_exceeded when the retained count is above
// max_operations.
result<std::vector<size_t>> select_operations(const arena_vector<operation_descriptor>& ops,
                                              const filter_config& config);

// Narrows doc.operations to the selection. The document is untouched when
// the selection fails.
result<void> apply_filter(ir_document& doc, const filter_config& config);

// Registry names reachable from the operations' parameters, bodies and
// responses, following reference edges transitively.
std::set<std::string> reachable_schemas(const ir_document& doc);

// Drops registry entries no operation can reach. Returns how many were removed.
size_t prune_unreachable_schemas(ir_document& doc);

} // namespace mcpgen
