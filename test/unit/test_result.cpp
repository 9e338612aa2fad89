#include "mcpgen/core/result.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace mcpgen;

TEST(Result, HasValueSuccess) {
    result<int> r = 42;
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, FailCarriesLocationAndDetail) {
    result<int> r = fail(error_code::unresolved_reference, "#/components/schemas/Pet", "no member 'Pet'");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), error_code::unresolved_reference);
    EXPECT_EQ(r.error().location, "#/components/schemas/Pet");
    EXPECT_EQ(r.error().detail, "no member 'Pet'");
    EXPECT_EQ(r.error().code.value(), static_cast<int>(error_code::unresolved_reference));
}

TEST(Result, MessageFormatting) {
    spec_error full(error_code::duplicate_operation_id, "GET /b", "'x' is also used by GET /a");
    EXPECT_EQ(full.message(),
              "duplicate operation identifier at GET /b: 'x' is also used by GET /a");

    spec_error no_detail(error_code::structural_error, "#/paths");
    EXPECT_EQ(no_detail.message(), "malformed document structure at #/paths");

    spec_error bare(error_code::parse_error);
    EXPECT_EQ(bare.message(), "failed to parse document text");

    spec_error detail_only(error_code::io_error, "", "permission denied");
    EXPECT_EQ(detail_only.message(), "failed to read document: permission denied");
}

TEST(Result, CategoryIdentity) {
    auto ec = make_error_code(error_code::ambiguous_request_body);
    EXPECT_STREQ(ec.category().name(), "mcpgen");
    EXPECT_EQ(&ec.category(), &get_error_category());
    EXPECT_EQ(ec.message(), "more than one request body declared");

    std::error_code implicit = error_code::operation_count_exceeded;
    EXPECT_EQ(implicit, make_error_code(error_code::operation_count_exceeded));
    EXPECT_EQ(get_error_category().message(999), "unknown error");
}

TEST(Result, ErrorComparesOnlyByCode) {
    spec_error e(error_code::unsupported_dialect, "#/swagger", "1.2");
    EXPECT_TRUE(e == error_code::unsupported_dialect);
    EXPECT_FALSE(e == error_code::structural_error);
}

TEST(Result, AndThenShortCircuit) {
    result<int> r = 5;
    bool second_called = false;

    auto chain = r.and_then([](int) -> result<int> {
                      return fail(error_code::structural_error, "#/paths");
                  }).and_then([&second_called](int val) -> result<int> {
        second_called = true;
        return val * 2;
    });

    ASSERT_FALSE(chain.has_value());
    EXPECT_FALSE(second_called);
    EXPECT_EQ(chain.error().location, "#/paths");
}

TEST(Result, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> bad = fail(error_code::io_error, "/missing.yaml");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), error_code::io_error);
    EXPECT_EQ(bad.error().message(), "failed to read document at /missing.yaml");
}
