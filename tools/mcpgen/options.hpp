#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcpgen_cli {

struct options {
    std::string subcommand;
    std::string spec;
    std::filesystem::path output = "generated_mcp_server";
    std::string name = "mcp_server";
    std::string transport = "stdio";        // stdio,sse
    std::string base_url;                   // overrides the document's base when set
    bool validate = true;
    bool force = false;
    bool verbose = false;
    std::string api_key_env;
    std::string api_key_header = "Authorization";
    std::string api_key_prefix = "Bearer";
    std::vector<std::string> headers;       // "Name: Value"
    std::vector<std::string> tags;
    std::vector<std::string> path_filters;
    std::optional<size_t> max_operations;
    bool prune_schemas = false;
};

[[noreturn]] void print_usage(int exit_code = 1);
options parse_args(int argc, char** argv);

} // namespace mcpgen_cli
