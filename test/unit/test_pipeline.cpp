#include "mcpgen/core/pipeline.hpp"

#include "support/spec_fixtures.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace mcpgen;
using mcpgen::test::load_ok;
using mcpgen::test::sv;

namespace {

constexpr std::string_view kPetsOpenApi = R"(
openapi: 3.0.3
info:
  title: Pets
  version: 1.0.0
paths:
  /pets:
    get:
      tags: [pets]
      parameters:
        - name: limit
          in: query
          schema:
            type: integer
      responses:
        '200':
          description: ok
    post:
      tags: [pets]
      requestBody:
        content:
          application/json:
            schema:
              $ref: '#/components/schemas/Pet'
      responses:
        '201':
          description: created
components:
  schemas:
    Pet:
      type: object
      required: [name]
      properties:
        name:
          type: string
)";

constexpr std::string_view kPetsSwagger = R"({
    "swagger": "2.0",
    "info": {"title": "Pets", "version": "1.0.0"},
    "paths": {"/pets": {
        "get": {"parameters": [{"name": "limit", "in": "query", "type": "integer"}],
                "responses": {"200": {"description": "ok"}}},
        "post": {"parameters": [{"name": "body", "in": "body", "schema": {"$ref": "#/definitions/Pet"}}],
                 "responses": {"201": {"description": "created"}}}
    }},
    "definitions": {"Pet": {"type": "object", "required": ["name"],
                            "properties": {"name": {"type": "string"}}}}
})";

void expect_pets_ir(const ir_document& ir) {
    ASSERT_EQ(ir.operations.size(), 2U);

    const auto& get = ir.operations[0];
    EXPECT_EQ(get.method, http_method::get);
    ASSERT_EQ(get.parameters.size(), 1U);
    EXPECT_EQ(sv(get.parameters[0].name), "limit");
    EXPECT_EQ(get.parameters[0].location, param_location::query);
    EXPECT_FALSE(get.parameters[0].required);
    EXPECT_EQ(get.parameters[0].schema->primitive, primitive_type::integer);
    EXPECT_EQ(get.body, nullptr);

    const auto& post = ir.operations[1];
    EXPECT_EQ(post.method, http_method::post);
    EXPECT_TRUE(post.parameters.empty());
    ASSERT_NE(post.body, nullptr);
    ASSERT_EQ(post.body->schema->kind, schema_kind::reference);
    EXPECT_EQ(sv(post.body->schema->ref_name), "Pet");

    const auto* pet = ir.find_schema("Pet");
    ASSERT_NE(pet, nullptr);
    ASSERT_EQ(pet->schema->kind, schema_kind::object);
    ASSERT_EQ(pet->schema->properties.size(), 1U);
    EXPECT_EQ(sv(pet->schema->properties[0].name), "name");
    EXPECT_EQ(pet->schema->properties[0].type->primitive, primitive_type::string);
    ASSERT_EQ(pet->schema->required.size(), 1U);
    EXPECT_EQ(sv(pet->schema->required[0]), "name");
}

std::string many_operations(size_t count) {
    std::string text = R"({"openapi": "3.0.0", "paths": {)";
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            text += ",";
        }
        text += "\"/r" + std::to_string(i) + "\": {\"get\": {}}";
    }
    text += "}}";
    return text;
}

} // namespace

TEST(Pipeline, PetsScenarioOpenApi3) {
    auto doc = load_ok(kPetsOpenApi);
    monotonic_arena arena;
    auto ir = build_ir(doc, arena);
    ASSERT_TRUE(ir) << ir.error().message();
    expect_pets_ir(*ir);
    EXPECT_EQ(sv(ir->title), "Pets");
    EXPECT_EQ(sv(ir->api_version), "1.0.0");
    EXPECT_EQ(sv(ir->spec_version), "3.0.3");
    EXPECT_EQ(sv(ir->operations[1].body->media_type), "application/json");
}

TEST(Pipeline, PetsScenarioSwagger2) {
    auto doc = load_ok(kPetsSwagger);
    monotonic_arena arena;
    auto ir = build_ir(doc, arena);
    ASSERT_TRUE(ir) << ir.error().message();
    expect_pets_ir(*ir);
    EXPECT_EQ(ir->source_dialect, dialect::swagger_2);
}

TEST(Pipeline, EmptyBaseUrlWithoutServers) {
    auto doc = load_ok(kPetsOpenApi);
    monotonic_arena arena;
    auto ir = build_ir(doc, arena);
    ASSERT_TRUE(ir);
    EXPECT_TRUE(ir->base_url.empty());
    EXPECT_TRUE(ir->servers.empty());
}

TEST(Pipeline, BaseUrlOverride) {
    auto doc = load_ok(kPetsSwagger);
    monotonic_arena arena;
    build_options options;
    options.base_url_override = "http://localhost:9000";
    auto ir = build_ir(doc, arena, options);
    ASSERT_TRUE(ir);
    EXPECT_EQ(sv(ir->base_url), "http://localhost:9000");
}

TEST(Pipeline, FilterAndPrune) {
    auto doc = load_ok(kPetsOpenApi);
    monotonic_arena arena;
    build_options options;
    options.filter.path_substrings = {"/pets"};
    options.filter.max_operations = 1;
    auto over = build_ir(doc, arena, options);
    ASSERT_FALSE(over);
    EXPECT_EQ(over.error(), error_code::operation_count_exceeded);

    options.filter.max_operations = 2;
    options.filter.path_substrings.clear();
    options.filter.tags = {"pets"};
    options.prune_schemas = true;
    auto ir = build_ir(doc, arena, options);
    ASSERT_TRUE(ir);
    EXPECT_EQ(ir->operations.size(), 2U);
    EXPECT_NE(ir->find_schema("Pet"), nullptr);
}

TEST(Pipeline, PruneDropsSchemasOfFilteredOperations) {
    auto doc = load_ok(kPetsOpenApi);
    monotonic_arena arena;
    build_options options;
    options.filter.path_substrings = {"/nothing"};
    options.prune_schemas = true;
    auto ir = build_ir(doc, arena, options);
    ASSERT_TRUE(ir);
    EXPECT_TRUE(ir->operations.empty());
    EXPECT_TRUE(ir->schemas.empty());
}

TEST(Pipeline, LargeUnfilteredRunWarns) {
    auto doc = load_ok(many_operations(LARGE_OPERATION_COUNT + 1));
    monotonic_arena arena;
    auto ir = build_ir(doc, arena);
    ASSERT_TRUE(ir);
    EXPECT_EQ(ir->operations.size(), LARGE_OPERATION_COUNT + 1);
    ASSERT_EQ(ir->warnings.size(), 1U);
    EXPECT_NE(std::string_view(ir->warnings[0].message).find("without filters"),
              std::string_view::npos);

    auto small = load_ok(many_operations(LARGE_OPERATION_COUNT));
    monotonic_arena small_arena;
    auto small_ir = build_ir(small, small_arena);
    ASSERT_TRUE(small_ir);
    EXPECT_TRUE(small_ir->warnings.empty());
}

TEST(Pipeline, StructuralErrorsStopTheRun) {
    auto doc = load_ok(R"({"openapi": "3.0.0", "paths": {"/a": {"get": "nope"}}})");
    monotonic_arena arena;
    auto checked = build_ir(doc, arena);
    ASSERT_FALSE(checked);
    EXPECT_EQ(checked.error(), error_code::structural_error);
    EXPECT_EQ(checked.error().location, "#/paths/~1a/get");
}

TEST(Pipeline, RunsDoNotShareState) {
    auto doc = load_ok(kPetsOpenApi);
    monotonic_arena a1;
    monotonic_arena a2;
    auto first = build_ir(doc, a1);
    auto second = build_ir(doc, a2);
    ASSERT_TRUE(first && second);
    ASSERT_EQ(first->operations.size(), second->operations.size());
    for (size_t i = 0; i < first->operations.size(); ++i) {
        EXPECT_EQ(sv(first->operations[i].id), sv(second->operations[i].id));
    }
    EXPECT_NE(first->find_schema("Pet")->schema, second->find_schema("Pet")->schema);
}

TEST(Pipeline, SummarizeGroupsByTag) {
    auto doc = load_ok(R"({
        "openapi": "3.1.0",
        "info": {"title": "Shop", "version": "3", "description": "A shop"},
        "servers": [{"url": "https://shop.example/v3"}],
        "paths": {
            "/items": {"get": {"tags": ["items"], "summary": "List"},
                       "post": {"tags": ["items", "admin"], "deprecated": true}},
            "/health": {"get": {}}
        },
        "components": {"schemas": {"Item": {"type": "object"}}}
    })");
    auto summary = summarize(doc);
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->title, "Shop");
    EXPECT_EQ(summary->description, "A shop");
    EXPECT_EQ(summary->source_dialect, dialect::openapi_3_1);
    EXPECT_EQ(summary->base_url, "https://shop.example/v3");
    EXPECT_EQ(summary->path_count, 2U);
    EXPECT_EQ(summary->operation_count, 3U);
    ASSERT_EQ(summary->schema_names.size(), 1U);

    ASSERT_EQ(summary->operations_by_tag.size(), 3U);
    EXPECT_EQ(summary->operations_by_tag[0].first, "items");
    EXPECT_EQ(summary->operations_by_tag[0].second.size(), 2U);
    EXPECT_EQ(summary->operations_by_tag[0].second[0].summary, "List");
    EXPECT_EQ(summary->operations_by_tag[1].first, "admin");
    EXPECT_TRUE(summary->operations_by_tag[1].second[0].deprecated);
    EXPECT_EQ(summary->operations_by_tag[2].first, "default");
    EXPECT_EQ(summary->operations_by_tag[2].second[0].id, "get_health");
}
