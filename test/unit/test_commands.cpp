#include "mcpgen/commands.hpp"
#include "mcpgen/core/ir_json.hpp"

#include "support/spec_fixtures.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace mcpgen_cli;
using mcpgen::test::load_ok;

namespace {

constexpr std::string_view kStore = R"({
    "openapi": "3.0.1",
    "info": {"title": "Store", "version": "2.1"},
    "servers": [{"url": "https://store.example"}],
    "paths": {
        "/orders": {"get": {"tags": ["orders"], "summary": "List orders"}},
        "/legacy": {"get": {"operationId": "oldThing", "deprecated": true}}
    },
    "components": {"schemas": {"Order": {"type": "object"}}}
})";

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(Commands, SanitizeServerName) {
    EXPECT_EQ(sanitize_server_name("Pet Store-API"), "Pet_Store_API");
    EXPECT_EQ(sanitize_server_name("a - b"), "a_b");
    EXPECT_EQ(sanitize_server_name("v2.api!"), "v2api");
    EXPECT_EQ(sanitize_server_name("3d"), "_3d");
    EXPECT_EQ(sanitize_server_name("!!!"), "mcp_server");
    EXPECT_EQ(sanitize_server_name(""), "mcp_server");
}

TEST(Commands, ParseHeader) {
    auto h = parse_header("X-Trace :  abc:def ");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->first, "X-Trace");
    EXPECT_EQ(h->second, "abc:def");

    auto empty_value = parse_header("X-Empty:");
    ASSERT_TRUE(empty_value.has_value());
    EXPECT_TRUE(empty_value->second.empty());

    EXPECT_FALSE(parse_header("no colon").has_value());
    EXPECT_FALSE(parse_header("  : value").has_value());
}

TEST(Commands, ServerConfigJson) {
    auto doc = load_ok(kStore);
    mcpgen::monotonic_arena arena;
    auto ir = mcpgen::build_ir(doc, arena);
    ASSERT_TRUE(ir);

    server_config config;
    config.name = "store";
    config.transport = "stdio";
    config.api_key_header = "Authorization";
    config.api_key_prefix = "Bearer";
    config.headers = {{"X-Client", "mcpgen"}};
    config.tags = {"orders"};
    config.max_operations = 10;

    auto parsed = mcpgen::parse_json(server_config_json(config, *ir));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->string_or("name"), "store");
    EXPECT_EQ(parsed->string_or("base_url"), "https://store.example");
    EXPECT_TRUE(parsed->object_at("auth")->find("api_key_env")->is_null());
    EXPECT_EQ(parsed->object_at("auth")->string_or("prefix"), "Bearer");
    EXPECT_EQ(parsed->object_at("headers")->string_or("X-Client"), "mcpgen");
    const auto* filters = parsed->object_at("filters");
    EXPECT_EQ(filters->array_at("tags")->size(), 1U);
    EXPECT_TRUE(filters->array_at("path_filters")->items().empty());
    EXPECT_EQ(filters->find("max_operations")->text(), "10");
    EXPECT_EQ(parsed->find("operation_count")->text(), "2");
    EXPECT_EQ(parsed->find("schema_count")->text(), "1");
    EXPECT_EQ(parsed->object_at("source")->string_or("dialect"), "openapi_3_0");
    EXPECT_EQ(parsed->object_at("source")->string_or("spec_version"), "3.0.1");
}

TEST(Commands, WriteBundle) {
    auto doc = load_ok(kStore);
    mcpgen::monotonic_arena arena;
    auto ir = mcpgen::build_ir(doc, arena);
    ASSERT_TRUE(ir);

    auto dir = std::filesystem::temp_directory_path() / "mcpgen_bundle_test" / "nested";
    std::filesystem::remove_all(dir.parent_path());

    server_config config;
    config.name = "store";
    config.transport = "sse";
    auto written = write_bundle(dir, *ir, config);
    ASSERT_TRUE(written) << written.error().message();
    ASSERT_EQ(written->size(), 2U);
    EXPECT_EQ((*written)[0].filename().string(), "mcp_ir.json");
    EXPECT_EQ((*written)[1].filename().string(), "server_config.json");

    auto ir_text = slurp((*written)[0]);
    EXPECT_EQ(ir_text, mcpgen::to_json(*ir, 2) + "\n");
    auto reparsed = mcpgen::parse_json(ir_text);
    ASSERT_TRUE(reparsed);
    EXPECT_EQ(reparsed->array_at("operations")->size(), 2U);

    std::filesystem::remove_all(dir.parent_path());
}

TEST(Commands, PrintInfoGroupsEndpoints) {
    auto summary = mcpgen::summarize(load_ok(kStore));
    ASSERT_TRUE(summary);
    std::ostringstream os;
    print_info(*summary, os);
    auto out = os.str();
    EXPECT_NE(out.find("Store 2.1\n"), std::string::npos);
    EXPECT_NE(out.find("  base url: https://store.example\n"), std::string::npos);
    EXPECT_NE(out.find("endpoints (2):\n  [orders]\n    GET /orders  get_orders - List orders\n"),
              std::string::npos);
    EXPECT_NE(out.find("  [default]\n    GET /legacy  oldThing (deprecated)\n"),
              std::string::npos);
    EXPECT_NE(out.find("schemas (1):\n  - Order\n"), std::string::npos);
}

TEST(Commands, PrintValidation) {
    auto summary = mcpgen::summarize(load_ok(kStore));
    ASSERT_TRUE(summary);

    std::ostringstream brief;
    print_validation(*summary, false, brief);
    EXPECT_EQ(brief.str().rfind("[spec] OK: dialect=openapi_3_0 version=3.0.1\n", 0), 0U);
    EXPECT_EQ(brief.str().find("paths:\n"), std::string::npos);

    std::ostringstream verbose;
    print_validation(*summary, true, verbose);
    EXPECT_NE(verbose.str().find("paths:\n  - /orders\n  - /legacy\n"), std::string::npos);
}
