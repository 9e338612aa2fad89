#pragma once

#include "dialect.hpp"
#include "result.hpp"
#include "spec_node.hpp"

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace mcpgen {

struct resolution {
    const spec_node* node = nullptr;
    // Set when the pointer is already being resolved further up the stack;
    // node is null then.
    bool cycle = false;
};

// Resolves local "#/..." pointers against the document of one run. Every
// successful resolution is cached by its exact pointer string, so resolving a
// pointer twice yields the same node.
class ref_resolver {
public:
    explicit ref_resolver(const dialect_adapter& adapter) noexcept : adapter_(&adapter) {}

    ref_resolver(const ref_resolver&) = delete;
    ref_resolver& operator=(const ref_resolver&) = delete;

    // Keeps a pointer marked in progress while its target is being processed,
    // so re-entering it reports a cycle.
    class visit_guard {
    public:
        visit_guard(ref_resolver& owner, std::string pointer);
        ~visit_guard();

        visit_guard(const visit_guard&) = delete;
        visit_guard& operator=(const visit_guard&) = delete;

    private:
        ref_resolver* owner_;
        std::string pointer_;
        bool inserted_;
    };

    result<resolution> resolve(std::string_view pointer);

    // Follows a chain of pointers to a node that is not one. In dialects that
    // allow keywords next to "$ref" the answer is a merged node: the target's
    // keys overridden by the siblings. Merged nodes live as long as the resolver.
    result<const spec_node*> deref(const spec_node& node);

    [[nodiscard]] visit_guard enter(std::string_view pointer) {
        return visit_guard(*this, std::string(pointer));
    }

    // Name of the registry entry a pointer addresses directly
    // ("#/components/schemas/Pet" -> "Pet"), nullopt for any other pointer.
    [[nodiscard]] std::optional<std::string> registry_name(std::string_view pointer) const;

    [[nodiscard]] size_t cache_size() const noexcept { return cache_.size(); }
    [[nodiscard]] bool in_progress(std::string_view pointer) const {
        return in_progress_.contains(std::string(pointer));
    }

    // The "$ref" string of a node, empty when the node is not a pointer.
    [[nodiscard]] static std::string_view pointer_of(const spec_node& node) noexcept;
    [[nodiscard]] static bool is_pointer(const spec_node& node) noexcept {
        return !pointer_of(node).empty();
    }

    static std::string unescape_segment(std::string_view segment);
    static std::string escape_segment(std::string_view segment);

private:
    result<const spec_node*> walk(std::string_view pointer);

    const dialect_adapter* adapter_;
    std::unordered_map<std::string, const spec_node*> cache_;
    std::unordered_set<std::string> in_progress_;
    std::unordered_map<const spec_node*, const spec_node*> merged_index_;
    std::deque<spec_node> merged_;
};

} // namespace mcpgen
