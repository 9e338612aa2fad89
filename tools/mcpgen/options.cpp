#include "options.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace mcpgen_cli {

[[noreturn]] void print_usage(int exit_code) {
    std::cout << R"(mcpgen - MCP server bundles from Swagger / OpenAPI descriptions

Usage:
  mcpgen create <spec> [options]
  mcpgen validate-spec <spec> [-v]
  mcpgen info <spec>

<spec> is a local JSON or YAML file (Swagger 2.0, OpenAPI 3.0 or 3.1).

create options:
  -o, --output <dir>         Output directory (default: ./generated_mcp_server)
  -n, --name <name>          Server name (default: mcp_server)
  -t, --transport <kind>     Transport: stdio,sse (default: stdio)
  -b, --base-url <url>       Base URL for API requests (default: from the document)
  --validate / --no-validate Structural checks before extraction (default: on)
  -f, --force                Write into a non-empty output directory
  -v, --verbose              Print every step and warning
  --api-key-env <var>        Environment variable holding the API key at runtime
  --api-key-header <name>    Header carrying the API key (default: Authorization)
  --api-key-prefix <text>    Prefix of the API key value (default: Bearer)
  -H, --header <'N: V'>      Extra HTTP header (repeatable)
  -T, --tag <tag>            Keep operations with this tag (repeatable)
  --path-filter <text>       Keep operations whose path contains text (repeatable)
  --max-operations <n>       Fail when more than n operations are selected
  --prune-schemas            Drop schemas no selected operation uses
  -h, --help                 Show this help
)";
    std::exit(exit_code);
}

namespace {

const char* take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << argv[i] << "\n";
        print_usage();
    }
    return argv[++i];
}

} // namespace

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage(0);
    }
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(0);
        } else if (arg == "-o" || arg == "--output") {
            opts.output = take_value(argc, argv, i);
        } else if (arg == "-n" || arg == "--name") {
            opts.name = take_value(argc, argv, i);
        } else if (arg == "-t" || arg == "--transport") {
            opts.transport = take_value(argc, argv, i);
        } else if (arg == "-b" || arg == "--base-url") {
            opts.base_url = take_value(argc, argv, i);
        } else if (arg == "--validate") {
            opts.validate = true;
        } else if (arg == "--no-validate") {
            opts.validate = false;
        } else if (arg == "-f" || arg == "--force") {
            opts.force = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--api-key-env") {
            opts.api_key_env = take_value(argc, argv, i);
        } else if (arg == "--api-key-header") {
            opts.api_key_header = take_value(argc, argv, i);
        } else if (arg == "--api-key-prefix") {
            opts.api_key_prefix = take_value(argc, argv, i);
        } else if (arg == "-H" || arg == "--header") {
            opts.headers.emplace_back(take_value(argc, argv, i));
        } else if (arg == "-T" || arg == "--tag") {
            opts.tags.emplace_back(take_value(argc, argv, i));
        } else if (arg == "--path-filter") {
            opts.path_filters.emplace_back(take_value(argc, argv, i));
        } else if (arg == "--max-operations") {
            std::string_view value = take_value(argc, argv, i);
            size_t n = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec != std::errc() || end != value.data() + value.size()) {
                std::cerr << "Invalid --max-operations value: " << value << "\n";
                print_usage();
            }
            opts.max_operations = n;
        } else if (arg == "--prune-schemas") {
            opts.prune_schemas = true;
        } else if (!arg.empty() && arg.front() != '-' && opts.spec.empty()) {
            opts.spec = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace mcpgen_cli
