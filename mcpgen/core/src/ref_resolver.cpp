#include "mcpgen/core/ref_resolver.hpp"

#include <charconv>

namespace mcpgen {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace

ref_resolver::visit_guard::visit_guard(ref_resolver& owner, std::string pointer)
    : owner_(&owner), pointer_(std::move(pointer)) {
    inserted_ = owner_->in_progress_.insert(pointer_).second;
}

ref_resolver::visit_guard::~visit_guard() {
    if (inserted_) {
        owner_->in_progress_.erase(pointer_);
    }
}

std::string_view ref_resolver::pointer_of(const spec_node& node) noexcept {
    const auto* ref = node.find("$ref");
    if (!ref || !ref->is_string()) {
        return {};
    }
    return ref->text();
}

std::string ref_resolver::unescape_segment(std::string_view segment) {
    std::string decoded = percent_decode(segment);
    std::string out;
    out.reserve(decoded.size());
    for (size_t i = 0; i < decoded.size(); ++i) {
        if (decoded[i] == '~' && i + 1 < decoded.size()) {
            if (decoded[i + 1] == '1') {
                out.push_back('/');
                ++i;
                continue;
            }
            if (decoded[i + 1] == '0') {
                out.push_back('~');
                ++i;
                continue;
            }
        }
        out.push_back(decoded[i]);
    }
    return out;
}

std::string ref_resolver::escape_segment(std::string_view segment) {
    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> ref_resolver::registry_name(std::string_view pointer) const {
    auto prefix = adapter_->schema_pointer_prefix();
    if (!pointer.starts_with(prefix)) {
        return std::nullopt;
    }
    auto rest = pointer.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string_view::npos) {
        return std::nullopt;
    }
    return unescape_segment(rest);
}

result<resolution> ref_resolver::resolve(std::string_view pointer) {
    std::string key(pointer);
    if (in_progress_.contains(key)) {
        return resolution{nullptr, true};
    }
    if (auto it = cache_.find(key); it != cache_.end()) {
        return resolution{it->second, false};
    }

    in_progress_.insert(key);
    auto node = walk(pointer);
    in_progress_.erase(key);
    if (!node) {
        return std::unexpected(node.error());
    }
    cache_.emplace(std::move(key), *node);
    return resolution{*node, false};
}

result<const spec_node*> ref_resolver::walk(std::string_view pointer) {
    if (pointer.empty() || pointer.front() != '#') {
        return fail(error_code::unresolved_reference,
                    std::string(pointer),
                    "only local references are supported");
    }
    auto path = pointer.substr(1);
    const spec_node* cur = &adapter_->root();
    if (path.empty()) {
        return cur;
    }
    if (path.front() != '/') {
        return fail(error_code::unresolved_reference, std::string(pointer), "malformed pointer");
    }
    path.remove_prefix(1);

    while (true) {
        auto slash = path.find('/');
        auto segment = unescape_segment(path.substr(0, slash));

        // A pointer met on the way is followed before descending into it.
        if (auto inner = pointer_of(*cur); !inner.empty()) {
            auto r = resolve(inner);
            if (!r) {
                return std::unexpected(r.error());
            }
            if (r->cycle) {
                return fail(error_code::unresolved_reference,
                            std::string(pointer),
                            "circular reference chain through " + std::string(inner));
            }
            cur = r->node;
        }

        const spec_node* next = nullptr;
        if (cur->is_object()) {
            next = cur->find(segment);
        } else if (cur->is_array()) {
            size_t index = 0;
            auto [end, ec] =
                std::from_chars(segment.data(), segment.data() + segment.size(), index);
            if (ec == std::errc() && end == segment.data() + segment.size() &&
                index < cur->items().size()) {
                next = &cur->items()[index];
            }
        }
        if (!next) {
            return fail(error_code::unresolved_reference,
                        std::string(pointer),
                        "no member '" + segment + "'");
        }
        cur = next;
        if (slash == std::string_view::npos) {
            break;
        }
        path = path.substr(slash + 1);
    }
    return cur;
}

result<const spec_node*> ref_resolver::deref(const spec_node& node) {
    const spec_node* cur = &node;
    std::unordered_set<std::string> seen;
    while (true) {
        auto pointer = pointer_of(*cur);
        if (pointer.empty()) {
            return cur;
        }
        if (!seen.insert(std::string(pointer)).second) {
            return fail(error_code::unresolved_reference,
                        std::string(pointer),
                        "circular reference chain");
        }
        auto r = resolve(pointer);
        if (!r) {
            return std::unexpected(r.error());
        }
        if (r->cycle) {
            return fail(error_code::unresolved_reference,
                        std::string(pointer),
                        "circular reference chain");
        }

        if (adapter_->supports_ref_siblings() && cur->size() > 1) {
            if (auto it = merged_index_.find(cur); it != merged_index_.end()) {
                return it->second;
            }
            auto base = deref(*r->node);
            if (!base) {
                return base;
            }
            spec_node merged = **base;
            if (!merged.is_object()) {
                return *base;
            }
            for (const auto& [key, value] : cur->members()) {
                if (key != "$ref") {
                    merged.set(key, value);
                }
            }
            merged_.push_back(std::move(merged));
            merged_index_.emplace(cur, &merged_.back());
            return &merged_.back();
        }
        cur = r->node;
    }
}

} // namespace mcpgen
