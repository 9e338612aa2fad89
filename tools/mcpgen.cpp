#include "mcpgen/core/arena.hpp"
#include "mcpgen/core/pipeline.hpp"
#include "mcpgen/core/spec_reader.hpp"

#include "mcpgen/commands.hpp"
#include "mcpgen/options.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>

using namespace mcpgen_cli;

namespace {

bool is_remote(std::string_view spec) {
    return spec.starts_with("http://") || spec.starts_with("https://");
}

// Loads the document for any subcommand; reports on stderr under `tag`.
std::optional<mcpgen::spec_document> load_spec(const options& opts, std::string_view tag) {
    if (opts.spec.empty()) {
        std::cerr << "[" << tag << "] input spec is required\n";
        return std::nullopt;
    }
    if (is_remote(opts.spec)) {
        std::cerr << "[spec] remote specs are not supported, download it first: " << opts.spec
                  << "\n";
        return std::nullopt;
    }
    auto loaded = mcpgen::load_from_file(opts.spec);
    if (!loaded) {
        std::cerr << "[spec] " << loaded.error().message() << "\n";
        return std::nullopt;
    }
    if (opts.verbose) {
        std::cout << "[spec] loaded " << opts.spec << " (" << loaded->source_length << " bytes)\n";
    }
    return std::move(*loaded);
}

int run_create(const options& opts) {
    if (opts.transport != "stdio" && opts.transport != "sse") {
        std::cerr << "[create] unknown transport: " << opts.transport << " (expected stdio or sse)\n";
        return 1;
    }

    server_config config;
    config.name = sanitize_server_name(opts.name);
    config.transport = opts.transport;
    config.api_key_env = opts.api_key_env;
    config.api_key_header = opts.api_key_header;
    config.api_key_prefix = opts.api_key_prefix;
    config.tags = opts.tags;
    config.path_filters = opts.path_filters;
    config.max_operations = opts.max_operations;
    for (const auto& raw : opts.headers) {
        auto header = parse_header(raw);
        if (!header) {
            std::cerr << "[create] invalid header, expected 'Name: Value': " << raw << "\n";
            return 1;
        }
        config.headers.push_back(std::move(*header));
    }

    std::error_code fs_ec;
    if (std::filesystem::exists(opts.output, fs_ec)) {
        if (!std::filesystem::is_directory(opts.output, fs_ec)) {
            std::cerr << "[create] output path is not a directory: " << opts.output.string() << "\n";
            return 1;
        }
        if (!std::filesystem::is_empty(opts.output, fs_ec) && !opts.force) {
            std::cerr << "[create] output directory is not empty: " << opts.output.string()
                      << " (use --force to overwrite)\n";
            return 1;
        }
    }
    if (fs_ec) {
        std::cerr << "[create] cannot inspect output directory: " << fs_ec.message() << "\n";
        return 1;
    }

    auto doc = load_spec(opts, "create");
    if (!doc) {
        return 1;
    }

    mcpgen::build_options build;
    build.filter.tags = opts.tags;
    build.filter.path_substrings = opts.path_filters;
    build.filter.max_operations = opts.max_operations;
    build.validate = opts.validate;
    build.prune_schemas = opts.prune_schemas;
    build.base_url_override = opts.base_url;

    mcpgen::monotonic_arena arena;
    auto ir = mcpgen::build_ir(*doc, arena, build);
    if (!ir) {
        std::cerr << "[spec] " << ir.error().message() << "\n";
        return 1;
    }

    if (opts.verbose) {
        for (const auto& w : ir->warnings) {
            std::cerr << "[warn] " << std::string_view(w.location) << ": "
                      << std::string_view(w.message) << "\n";
        }
    } else if (!ir->warnings.empty()) {
        std::cerr << "[warn] " << ir->warnings.size() << " warning(s), rerun with -v to list them\n";
    }
    if (opts.verbose) {
        std::cout << "[spec] " << mcpgen::dialect_to_string(ir->source_dialect) << " "
                  << std::string_view(ir->spec_version) << ", " << ir->operations.size()
                  << " operations, " << ir->schemas.size() << " schemas\n";
        if (!build.filter.selects_everything()) {
            std::cout << "[filter] kept " << ir->operations.size() << " operations matching "
                      << opts.tags.size() << " tag(s) and " << opts.path_filters.size()
                      << " path filter(s)\n";
        }
        if (ir->base_url.empty()) {
            std::cout << "[create] no base URL declared; pass --base-url to set one\n";
        }
    }

    auto written = write_bundle(opts.output, *ir, config);
    if (!written) {
        std::cerr << "[create] " << written.error().message() << "\n";
        return 1;
    }
    for (const auto& path : *written) {
        std::cout << "[create] wrote " << path.string() << "\n";
    }
    std::cout << "[create] OK: server=" << config.name << " operations=" << ir->operations.size()
              << " schemas=" << ir->schemas.size() << "\n";
    return 0;
}

int run_validate(const options& opts) {
    auto doc = load_spec(opts, "validate-spec");
    if (!doc) {
        return 1;
    }
    auto summary = mcpgen::summarize(*doc);
    if (!summary) {
        std::cerr << "[spec] " << summary.error().message() << "\n";
        return 1;
    }
    print_validation(*summary, opts.verbose, std::cout);
    return 0;
}

int run_info(const options& opts) {
    auto doc = load_spec(opts, "info");
    if (!doc) {
        return 1;
    }
    auto summary = mcpgen::summarize(*doc);
    if (!summary) {
        std::cerr << "[spec] " << summary.error().message() << "\n";
        return 1;
    }
    print_info(*summary, std::cout);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand == "create") {
        return run_create(opts);
    }
    if (opts.subcommand == "validate-spec") {
        return run_validate(opts);
    }
    if (opts.subcommand == "info") {
        return run_info(opts);
    }
    std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
    print_usage();
}
