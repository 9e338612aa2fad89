#pragma once

#include "arena.hpp"
#include "dialect.hpp"
#include "filter_engine.hpp"
#include "ir.hpp"
#include "result.hpp"
#include "spec_node.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace mcpgen {

// Above this many operations an unfiltered run gets a warning.
constexpr size_t LARGE_OPERATION_COUNT = 100;

struct build_options {
    filter_config filter;
    // Structural checks of the paths section before extraction.
    bool validate = true;
    bool prune_schemas = false;
    // Replaces the base URL the document declares when non-empty.
    std::string base_url_override;
};

// One generation run: detect, build the registry, extract, filter. The
// returned document lives in `arena`; every other piece of run state is
// dropped before returning.
result<ir_document> build_ir(const spec_document& doc, monotonic_arena& arena,
                             const build_options& options = {});

struct operation_summary {
    std::string id;
    std::string method;
    std::string path;
    std::string summary;
    bool deprecated = false;
};

struct spec_summary {
    dialect source_dialect = dialect::openapi_3_0;
    std::string spec_version;
    std::string title;
    std::string api_version;
    std::string description;
    std::string base_url;
    std::vector<std::string> servers;
    std::vector<std::string> paths;
    size_t path_count = 0;
    size_t operation_count = 0;
    std::vector<std::string> schema_names;
    // Tags in order of first appearance.
    std::vector<std::pair<std::string, std::vector<operation_summary>>> operations_by_tag;
    std::vector<std::string> warnings;
};

result<spec_summary> summarize(const spec_document& doc);

} // namespace mcpgen
