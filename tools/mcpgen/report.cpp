#include "commands.hpp"

#include "mcpgen/core/dialect.hpp"

#include <algorithm>

namespace mcpgen_cli {

namespace {

constexpr size_t VERBOSE_LIST_LIMIT = 20;

void print_limited(std::ostream& os, std::string_view heading, const std::vector<std::string>& items) {
    os << heading << ":\n";
    size_t shown = std::min(items.size(), VERBOSE_LIST_LIMIT);
    for (size_t i = 0; i < shown; ++i) {
        os << "  - " << items[i] << "\n";
    }
    if (items.size() > shown) {
        os << "  ... and " << (items.size() - shown) << " more\n";
    }
}

} // namespace

void print_validation(const mcpgen::spec_summary& summary, bool verbose, std::ostream& os) {
    os << "[spec] OK: dialect=" << mcpgen::dialect_to_string(summary.source_dialect)
       << " version=" << summary.spec_version << "\n";
    os << "  title:      " << summary.title << "\n";
    os << "  version:    " << summary.api_version << "\n";
    os << "  paths:      " << summary.path_count << "\n";
    os << "  operations: " << summary.operation_count << "\n";
    os << "  schemas:    " << summary.schema_names.size() << "\n";
    if (!summary.warnings.empty()) {
        os << "  warnings:   " << summary.warnings.size() << "\n";
    }
    if (!verbose) {
        return;
    }
    print_limited(os, "paths", summary.paths);
    print_limited(os, "schemas", summary.schema_names);
    for (const auto& w : summary.warnings) {
        os << "[warn] " << w << "\n";
    }
}

void print_info(const mcpgen::spec_summary& summary, std::ostream& os) {
    os << summary.title << " " << summary.api_version << "\n";
    os << "  format: " << mcpgen::dialect_to_string(summary.source_dialect) << " ("
       << summary.spec_version << ")\n";
    if (!summary.description.empty()) {
        os << "  description: " << summary.description << "\n";
    }
    os << "  base url: " << (summary.base_url.empty() ? "(none)" : summary.base_url) << "\n";
    if (!summary.servers.empty()) {
        os << "servers:\n";
        for (const auto& s : summary.servers) {
            os << "  - " << s << "\n";
        }
    }

    os << "endpoints (" << summary.operation_count << "):\n";
    for (const auto& [tag, ops] : summary.operations_by_tag) {
        os << "  [" << tag << "]\n";
        for (const auto& op : ops) {
            os << "    " << op.method << " " << op.path << "  " << op.id;
            if (!op.summary.empty()) {
                os << " - " << op.summary;
            }
            if (op.deprecated) {
                os << " (deprecated)";
            }
            os << "\n";
        }
    }

    os << "schemas (" << summary.schema_names.size() << "):\n";
    for (const auto& name : summary.schema_names) {
        os << "  - " << name << "\n";
    }
}

} // namespace mcpgen_cli
