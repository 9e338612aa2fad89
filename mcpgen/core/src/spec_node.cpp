#include "mcpgen/core/spec_node.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace mcpgen {

spec_node spec_node::make_bool(bool value) {
    spec_node n;
    n.kind_ = node_kind::boolean;
    n.bool_ = value;
    return n;
}

spec_node spec_node::make_number(std::string literal) {
    spec_node n;
    n.kind_ = node_kind::number;
    n.text_ = std::move(literal);
    return n;
}

spec_node spec_node::make_string(std::string value) {
    spec_node n;
    n.kind_ = node_kind::string;
    n.text_ = std::move(value);
    return n;
}

spec_node spec_node::make_array() {
    spec_node n;
    n.kind_ = node_kind::array;
    return n;
}

spec_node spec_node::make_object() {
    spec_node n;
    n.kind_ = node_kind::object;
    return n;
}

std::optional<double> spec_node::as_number() const noexcept {
    if (kind_ != node_kind::number || text_.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec != std::errc() || ptr != text_.data() + text_.size()) {
        return std::nullopt;
    }
    return value;
}

size_t spec_node::size() const noexcept {
    switch (kind_) {
    case node_kind::array:
        return items_.size();
    case node_kind::object:
        return members_.size();
    default:
        return 0;
    }
}

const spec_node* spec_node::find(std::string_view key) const noexcept {
    if (kind_ != node_kind::object) {
        return nullptr;
    }
    for (const auto& [k, v] : members_) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

spec_node* spec_node::find(std::string_view key) noexcept {
    return const_cast<spec_node*>(std::as_const(*this).find(key));
}

std::string_view spec_node::string_or(std::string_view key,
                                      std::string_view fallback) const noexcept {
    const auto* v = find(key);
    if (!v || !v->is_string()) {
        return fallback;
    }
    return v->text_;
}

std::optional<bool> spec_node::bool_at(std::string_view key) const noexcept {
    const auto* v = find(key);
    if (!v || !v->is_bool()) {
        return std::nullopt;
    }
    return v->bool_;
}

const spec_node* spec_node::object_at(std::string_view key) const noexcept {
    const auto* v = find(key);
    return (v && v->is_object()) ? v : nullptr;
}

const spec_node* spec_node::array_at(std::string_view key) const noexcept {
    const auto* v = find(key);
    return (v && v->is_array()) ? v : nullptr;
}

spec_node& spec_node::set(std::string key, spec_node value) {
    if (kind_ != node_kind::object) {
        *this = make_object();
    }
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    members_.emplace_back(std::move(key), std::move(value));
    return members_.back().second;
}

bool spec_node::erase(std::string_view key) {
    auto it = std::find_if(
        members_.begin(), members_.end(), [&](const member& m) { return m.first == key; });
    if (it == members_.end()) {
        return false;
    }
    members_.erase(it);
    return true;
}

spec_node& spec_node::push_back(spec_node value) {
    if (kind_ != node_kind::array) {
        *this = make_array();
    }
    items_.push_back(std::move(value));
    return items_.back();
}

bool operator==(const spec_node& a, const spec_node& b) noexcept {
    if (a.kind_ != b.kind_) {
        return false;
    }
    switch (a.kind_) {
    case node_kind::null_value:
        return true;
    case node_kind::boolean:
        return a.bool_ == b.bool_;
    case node_kind::number: {
        auto x = a.as_number();
        auto y = b.as_number();
        if (x && y) {
            return *x == *y;
        }
        return a.text_ == b.text_;
    }
    case node_kind::string:
        return a.text_ == b.text_;
    case node_kind::array:
        return a.items_ == b.items_;
    case node_kind::object:
        return a.members_ == b.members_;
    }
    return false;
}

std::string escape_json(std::string_view sv) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out.push_back(hex[(static_cast<unsigned char>(c) >> 4) & 0xF]);
                out.push_back(hex[static_cast<unsigned char>(c) & 0xF]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

namespace {

void newline(std::string& out, int indent, int depth) {
    if (indent < 0) {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<size_t>(indent * depth), ' ');
}

void write_node(const spec_node& n, std::string& out, int indent, int depth) {
    switch (n.kind()) {
    case node_kind::null_value:
        out += "null";
        break;
    case node_kind::boolean:
        out += n.as_bool() ? "true" : "false";
        break;
    case node_kind::number:
        out += n.text();
        break;
    case node_kind::string:
        out.push_back('\"');
        out += escape_json(n.text());
        out.push_back('\"');
        break;
    case node_kind::array: {
        if (n.items().empty()) {
            out += "[]";
            break;
        }
        out.push_back('[');
        bool first = true;
        for (const auto& item : n.items()) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            newline(out, indent, depth + 1);
            write_node(item, out, indent, depth + 1);
        }
        newline(out, indent, depth);
        out.push_back(']');
        break;
    }
    case node_kind::object: {
        if (n.members().empty()) {
            out += "{}";
            break;
        }
        out.push_back('{');
        bool first = true;
        for (const auto& [key, value] : n.members()) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            newline(out, indent, depth + 1);
            out.push_back('\"');
            out += escape_json(key);
            out += indent < 0 ? "\":" : "\": ";
            write_node(value, out, indent, depth + 1);
        }
        newline(out, indent, depth);
        out.push_back('}');
        break;
    }
    }
}

} // namespace

std::string write_json(const spec_node& node, int indent) {
    std::string out;
    write_node(node, out, indent, 0);
    return out;
}

} // namespace mcpgen
