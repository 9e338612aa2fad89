#include "mcpgen/core/arena.hpp"
#include "mcpgen/core/ir_json.hpp"
#include "mcpgen/core/pipeline.hpp"
#include "mcpgen/core/spec_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int32_t LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0 || size > 1024 * 1024) { // Max 1MB
        return 0;
    }

    auto doc = mcpgen::load_from_string(std::string_view(reinterpret_cast<const char*>(data), size));
    if (!doc) {
        return 0;
    }

    mcpgen::monotonic_arena arena;
    auto ir = mcpgen::build_ir(*doc, arena);
    if (ir) {
        // Emitted IR must always parse back.
        auto text = mcpgen::to_json(*ir);
        if (!mcpgen::parse_json(text)) {
            __builtin_trap();
        }
    }
    return 0;
}
