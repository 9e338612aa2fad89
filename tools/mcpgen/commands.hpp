#pragma once

#include "mcpgen/core/ir.hpp"
#include "mcpgen/core/pipeline.hpp"
#include "mcpgen/core/result.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgen_cli {

// Runtime settings of the generated server, written next to the IR.
struct server_config {
    std::string name;
    std::string transport;
    std::string api_key_env;
    std::string api_key_header;
    std::string api_key_prefix;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<std::string> tags;
    std::vector<std::string> path_filters;
    std::optional<size_t> max_operations;
};

// Identifier-safe server name: whitespace and dashes become '_', anything
// else outside [A-Za-z0-9_] is dropped; empty input gives "mcp_server".
std::string sanitize_server_name(std::string_view name);

// "Name: Value" -> {"Name", "Value"}; nullopt without a colon or a name.
std::optional<std::pair<std::string, std::string>> parse_header(std::string_view text);

std::string server_config_json(const server_config& config, const mcpgen::ir_document& ir);

// Writes mcp_ir.json and server_config.json into dir and returns the paths.
mcpgen::result<std::vector<std::filesystem::path>>
write_bundle(const std::filesystem::path& dir, const mcpgen::ir_document& ir,
             const server_config& config);

void print_validation(const mcpgen::spec_summary& summary, bool verbose, std::ostream& os);
void print_info(const mcpgen::spec_summary& summary, std::ostream& os);

} // namespace mcpgen_cli
