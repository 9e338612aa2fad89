#include "commands.hpp"

#include "mcpgen/core/ir_json.hpp"
#include "mcpgen/core/serde.hpp"
#include "mcpgen/core/spec_node.hpp"

#include <cctype>
#include <fstream>

namespace mcpgen_cli {

using mcpgen::spec_node;

namespace {

spec_node str(std::string_view sv) {
    return spec_node::make_string(std::string(sv));
}

spec_node string_list(const std::vector<std::string>& items) {
    auto out = spec_node::make_array();
    for (const auto& item : items) {
        out.push_back(str(item));
    }
    return out;
}

mcpgen::result<void> write_file(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return mcpgen::fail(mcpgen::error_code::io_error, path.string(), "cannot open for writing");
    }
    out << content;
    if (!out) {
        return mcpgen::fail(mcpgen::error_code::io_error, path.string(), "write failed");
    }
    return {};
}

} // namespace

std::string sanitize_server_name(std::string_view name) {
    std::string out;
    bool in_separator = false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '-') {
            if (!in_separator) {
                out.push_back('_');
            }
            in_separator = true;
            continue;
        }
        in_separator = false;
        if (std::isalnum(uc) || c == '_') {
            out.push_back(c);
        }
    }
    if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.front()))) {
        out.insert(out.begin(), '_');
    }
    return out.empty() ? "mcp_server" : out;
}

std::optional<std::pair<std::string, std::string>> parse_header(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto name = mcpgen::serde::trim_view(text.substr(0, colon));
    auto value = mcpgen::serde::trim_view(text.substr(colon + 1));
    if (name.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::string(name), std::string(value));
}

std::string server_config_json(const server_config& config, const mcpgen::ir_document& ir) {
    auto root = spec_node::make_object();
    root.set("name", str(config.name));
    root.set("transport", str(config.transport));
    root.set("base_url", str(ir.base_url));

    auto auth = spec_node::make_object();
    auth.set("api_key_env",
             config.api_key_env.empty() ? spec_node::make_null() : str(config.api_key_env));
    auth.set("header", str(config.api_key_header));
    auth.set("prefix", str(config.api_key_prefix));
    root.set("auth", std::move(auth));

    auto headers = spec_node::make_object();
    for (const auto& [name, value] : config.headers) {
        headers.set(name, str(value));
    }
    root.set("headers", std::move(headers));

    auto filters = spec_node::make_object();
    filters.set("tags", string_list(config.tags));
    filters.set("path_filters", string_list(config.path_filters));
    filters.set("max_operations", config.max_operations
                                      ? spec_node::make_number(std::to_string(*config.max_operations))
                                      : spec_node::make_null());
    root.set("filters", std::move(filters));

    root.set("operation_count", spec_node::make_number(std::to_string(ir.operations.size())));
    root.set("schema_count", spec_node::make_number(std::to_string(ir.schemas.size())));

    auto source = spec_node::make_object();
    source.set("title", str(ir.title));
    source.set("version", str(ir.api_version));
    source.set("dialect", str(mcpgen::dialect_to_string(ir.source_dialect)));
    source.set("spec_version", str(ir.spec_version));
    root.set("source", std::move(source));

    return mcpgen::write_json(root, 2) + "\n";
}

mcpgen::result<std::vector<std::filesystem::path>>
write_bundle(const std::filesystem::path& dir, const mcpgen::ir_document& ir,
             const server_config& config) {
    std::error_code fs_ec;
    std::filesystem::create_directories(dir, fs_ec);
    if (fs_ec) {
        return mcpgen::fail(mcpgen::error_code::io_error, dir.string(), fs_ec.message());
    }

    std::vector<std::filesystem::path> written;
    auto ir_path = dir / "mcp_ir.json";
    if (auto r = write_file(ir_path, mcpgen::to_json(ir, 2) + "\n"); !r) {
        return std::unexpected(r.error());
    }
    written.push_back(ir_path);

    auto config_path = dir / "server_config.json";
    if (auto r = write_file(config_path, server_config_json(config, ir)); !r) {
        return std::unexpected(r.error());
    }
    written.push_back(config_path);
    return written;
}

} // namespace mcpgen_cli
