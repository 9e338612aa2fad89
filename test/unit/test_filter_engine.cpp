#include "mcpgen/core/filter_engine.hpp"

#include "support/spec_fixtures.hpp"

#include <gtest/gtest.h>

using namespace mcpgen;
using mcpgen::test::sv;

namespace {

struct ops_fixture {
    ops_fixture() : ir(arena) {
        add("list_pets", "/pets", {"pets"});
        add("create_pet", "/pets", {"pets", "write"});
        add("get_store", "/store/inventory", {"store"});
        add("login", "/user/login", {"user"});
    }

    operation_descriptor& add(std::string_view id, std::string_view path,
                              std::initializer_list<std::string_view> tags) {
        auto& op = ir.add_operation();
        op.id = ir.make_string(id);
        op.path = ir.make_string(path);
        for (auto t : tags) {
            op.tags.push_back(ir.make_string(t));
        }
        return op;
    }

    schema_node* node(schema_kind kind) {
        auto* n = arena.make<schema_node>(&arena);
        n->kind = kind;
        return n;
    }

    schema_node* ref(std::string_view name) {
        auto* n = node(schema_kind::reference);
        n->ref_name = ir.make_string(name);
        return n;
    }

    monotonic_arena arena;
    ir_document ir;
};

} // namespace

TEST(FilterEngine, EmptyFilterKeepsEverythingInOrder) {
    ops_fixture f;
    auto selected = select_operations(f.ir.operations, filter_config{});
    ASSERT_TRUE(selected);
    ASSERT_EQ(selected->size(), 4U);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ((*selected)[i], i);
    }

    ASSERT_TRUE(apply_filter(f.ir, filter_config{}));
    ASSERT_EQ(f.ir.operations.size(), 4U);
    EXPECT_EQ(sv(f.ir.operations[3].id), "login");
}

TEST(FilterEngine, TagsAndPathSubstringsAreAlternatives) {
    ops_fixture f;
    filter_config config;
    config.tags = {"write"};
    config.path_substrings = {"/store"};
    ASSERT_TRUE(apply_filter(f.ir, config));
    ASSERT_EQ(f.ir.operations.size(), 2U);
    EXPECT_EQ(sv(f.ir.operations[0].id), "create_pet");
    EXPECT_EQ(sv(f.ir.operations[1].id), "get_store");
}

TEST(FilterEngine, NoMatchLeavesNothing) {
    ops_fixture f;
    filter_config config;
    config.tags = {"absent"};
    ASSERT_TRUE(apply_filter(f.ir, config));
    EXPECT_TRUE(f.ir.operations.empty());
}

TEST(FilterEngine, MaxOperationsBoundary) {
    ops_fixture f;
    filter_config config;
    config.tags = {"pets"};
    config.max_operations = 2;
    auto exact = select_operations(f.ir.operations, config);
    ASSERT_TRUE(exact);
    EXPECT_EQ(exact->size(), 2U);

    config.max_operations = 1;
    auto over = apply_filter(f.ir, config);
    ASSERT_FALSE(over);
    EXPECT_EQ(over.error(), error_code::operation_count_exceeded);
    EXPECT_EQ(over.error().location, "filter");
    EXPECT_NE(over.error().detail.find("2 operations selected, maximum is 1"), std::string::npos);
    EXPECT_EQ(f.ir.operations.size(), 4U);
}

TEST(FilterEngine, MaxOperationsAppliesWithoutFilters) {
    ops_fixture f;
    filter_config config;
    config.max_operations = 3;
    auto r = select_operations(f.ir.operations, config);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), error_code::operation_count_exceeded);
}

TEST(FilterEngine, ReachabilityFollowsReferences) {
    ops_fixture f;
    auto* pet = f.node(schema_kind::object);
    property owner(&f.arena);
    owner.name = f.ir.make_string("owner");
    owner.type = f.ref("Owner");
    pet->properties.push_back(std::move(owner));
    f.ir.add_schema("Pet", pet);
    f.ir.add_schema("Owner", f.node(schema_kind::object));
    f.ir.add_schema("Unused", f.node(schema_kind::object));

    auto* list = f.node(schema_kind::array);
    list->items = f.ref("Pet");
    f.ir.operations[0].response = list;

    auto reached = reachable_schemas(f.ir);
    EXPECT_TRUE(reached.contains("Pet"));
    EXPECT_TRUE(reached.contains("Owner"));
    EXPECT_FALSE(reached.contains("Unused"));

    EXPECT_EQ(prune_unreachable_schemas(f.ir), 1U);
    ASSERT_EQ(f.ir.schemas.size(), 2U);
    EXPECT_EQ(f.ir.find_schema("Unused"), nullptr);
    EXPECT_NE(f.ir.find_schema("Owner"), nullptr);
}

TEST(FilterEngine, ReachabilityToleratesCycles) {
    ops_fixture f;
    auto* node = f.node(schema_kind::object);
    property next(&f.arena);
    next.name = f.ir.make_string("next");
    next.type = f.ref("Node");
    node->properties.push_back(std::move(next));
    f.ir.add_schema("Node", node);

    auto* body = f.arena.make<request_body_descriptor>(&f.arena);
    body->schema = f.ref("Node");
    f.ir.operations[1].body = body;

    auto reached = reachable_schemas(f.ir);
    EXPECT_EQ(reached.size(), 1U);
    EXPECT_TRUE(reached.contains("Node"));
}
