#pragma once

#include "mcpgen/core/arena.hpp"
#include "mcpgen/core/pipeline.hpp"
#include "mcpgen/core/run_context.hpp"
#include "mcpgen/core/spec_reader.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string_view>

namespace mcpgen::test {

// Parses a document that the test expects to be well formed.
inline spec_document load_ok(std::string_view text) {
    auto doc = load_from_string(text);
    EXPECT_TRUE(doc.has_value()) << (doc ? "" : doc.error().message());
    return doc ? std::move(*doc) : spec_document{};
}

// Run state over a loaded document, for tests that drive the normalizer or
// the extractor directly.
struct run_fixture {
    explicit run_fixture(std::string_view text) : doc(load_ok(text)) {
        auto adapter = detect_dialect(doc);
        EXPECT_TRUE(adapter.has_value()) << (adapter ? "" : adapter.error().message());
        if (adapter) {
            ctx = std::make_unique<run_context>(std::move(*adapter), arena);
        }
    }

    spec_document doc;
    monotonic_arena arena;
    std::unique_ptr<run_context> ctx;
};

inline std::string_view sv(const arena_string<>& s) {
    return s;
}

} // namespace mcpgen::test
