#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgen {

enum class node_kind : uint8_t { null_value, boolean, number, string, array, object };

// One value of a parsed API description. Objects keep their keys in document
// order because document order breaks every tie in the pipeline. Numbers keep
// their source text so literals are written back exactly as declared.
class spec_node {
public:
    using member = std::pair<std::string, spec_node>;

    spec_node() = default;

    static spec_node make_null() { return spec_node{}; }
    static spec_node make_bool(bool value);
    static spec_node make_number(std::string literal);
    static spec_node make_string(std::string value);
    static spec_node make_array();
    static spec_node make_object();

    [[nodiscard]] node_kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_null() const noexcept { return kind_ == node_kind::null_value; }
    [[nodiscard]] bool is_bool() const noexcept { return kind_ == node_kind::boolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == node_kind::number; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == node_kind::string; }
    [[nodiscard]] bool is_array() const noexcept { return kind_ == node_kind::array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == node_kind::object; }

    [[nodiscard]] bool as_bool() const noexcept { return bool_; }
    // String value, or the literal text of a number.
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] std::optional<double> as_number() const noexcept;

    [[nodiscard]] const std::vector<spec_node>& items() const noexcept { return items_; }
    [[nodiscard]] const std::vector<member>& members() const noexcept { return members_; }
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] const spec_node* find(std::string_view key) const noexcept;
    [[nodiscard]] spec_node* find(std::string_view key) noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key); }

    // Typed lookups that answer nullopt / fallback when the key is missing or
    // holds another kind.
    [[nodiscard]] std::string_view string_or(std::string_view key,
                                             std::string_view fallback = {}) const noexcept;
    [[nodiscard]] std::optional<bool> bool_at(std::string_view key) const noexcept;
    [[nodiscard]] const spec_node* object_at(std::string_view key) const noexcept;
    [[nodiscard]] const spec_node* array_at(std::string_view key) const noexcept;

    // Replaces the value of an existing key in place or appends a new one.
    spec_node& set(std::string key, spec_node value);
    bool erase(std::string_view key);
    spec_node& push_back(spec_node value);

    friend bool operator==(const spec_node& a, const spec_node& b) noexcept;

private:
    node_kind kind_ = node_kind::null_value;
    bool bool_ = false;
    std::string text_;
    std::vector<spec_node> items_;
    std::vector<member> members_;
};

// A document as handed over by the loader. The core never performs I/O;
// source_length is only used in diagnostics.
struct spec_document {
    spec_node root;
    size_t source_length = 0;
};

std::string escape_json(std::string_view sv);

// Serializes a node as JSON. indent < 0 produces compact output.
std::string write_json(const spec_node& node, int indent = -1);

} // namespace mcpgen
