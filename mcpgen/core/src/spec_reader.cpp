#include "mcpgen/core/spec_reader.hpp"

#include "mcpgen/core/serde.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mcpgen {

namespace {

using serde::json_cursor;
using serde::trim_view;

constexpr int kMaxNestingDepth = 256;

std::string at_offset(size_t pos) {
    return "offset " + std::to_string(pos);
}

result<spec_node> parse_json_value(json_cursor& cur, int depth) {
    if (depth > kMaxNestingDepth) {
        return fail(error_code::parse_error, at_offset(cur.pos()), "nesting too deep");
    }
    char c = cur.peek();
    if (c == '{') {
        cur.try_object_start();
        spec_node obj = spec_node::make_object();
        if (cur.try_object_end()) {
            return obj;
        }
        while (true) {
            auto key = cur.string();
            if (!key) {
                return fail(error_code::parse_error, at_offset(cur.pos()), "expected object key");
            }
            if (!cur.consume(':')) {
                return fail(error_code::parse_error, at_offset(cur.pos()), "expected ':'");
            }
            auto value = parse_json_value(cur, depth + 1);
            if (!value) {
                return value;
            }
            obj.set(std::move(*key), std::move(*value));
            if (cur.try_comma()) {
                continue;
            }
            if (cur.try_object_end()) {
                return obj;
            }
            return fail(error_code::parse_error, at_offset(cur.pos()), "expected ',' or '}'");
        }
    }
    if (c == '[') {
        cur.try_array_start();
        spec_node arr = spec_node::make_array();
        if (cur.try_array_end()) {
            return arr;
        }
        while (true) {
            auto value = parse_json_value(cur, depth + 1);
            if (!value) {
                return value;
            }
            arr.push_back(std::move(*value));
            if (cur.try_comma()) {
                continue;
            }
            if (cur.try_array_end()) {
                return arr;
            }
            return fail(error_code::parse_error, at_offset(cur.pos()), "expected ',' or ']'");
        }
    }
    if (c == '\"') {
        if (auto s = cur.string()) {
            return spec_node::make_string(std::move(*s));
        }
        return fail(error_code::parse_error, at_offset(cur.pos()), "malformed string");
    }
    if (cur.consume_literal("true")) {
        return spec_node::make_bool(true);
    }
    if (cur.consume_literal("false")) {
        return spec_node::make_bool(false);
    }
    if (cur.consume_literal("null")) {
        return spec_node::make_null();
    }
    if (auto num = cur.number()) {
        return spec_node::make_number(std::string(*num));
    }
    return fail(error_code::parse_error, at_offset(cur.pos()), "unexpected character");
}

// ---------------------------------------------------------------------------
// YAML

struct yaml_line {
    int indent = 0;
    std::string_view content; // comment stripped, trimmed
    std::string_view raw;     // full line without the newline
    bool blank = false;
};

std::string_view strip_comment(std::string_view s) noexcept {
    bool in_single = false;
    bool in_double = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\\' && in_double) {
            ++i;
        } else if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (c == '#' && !in_single && !in_double &&
                   (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
            return s.substr(0, i);
        }
    }
    return s;
}

std::vector<yaml_line> tokenize_yaml(std::string_view text) {
    std::vector<yaml_line> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t stop = text.find('\n', pos);
        if (stop == std::string_view::npos) {
            stop = text.size();
        }
        std::string_view line = text.substr(pos, stop - pos);
        pos = stop + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        yaml_line ln;
        ln.raw = line;
        int indent = 0;
        while (static_cast<size_t>(indent) < line.size() && line[static_cast<size_t>(indent)] == ' ') {
            ++indent;
        }
        ln.indent = indent;
        ln.content = trim_view(strip_comment(line.substr(static_cast<size_t>(indent))));
        ln.blank = ln.content.empty() || ln.content == "---" || ln.content == "..." ||
                   ln.content.front() == '%';
        lines.push_back(ln);
        if (stop == text.size()) {
            break;
        }
    }
    return lines;
}

bool is_sequence_entry(std::string_view content) noexcept {
    return content == "-" || (content.size() >= 2 && content[0] == '-' && content[1] == ' ');
}

// Position of the ':' that separates a mapping key from its value, outside
// quotes and flow brackets; npos when the text is not a mapping entry.
size_t find_mapping_colon(std::string_view s) noexcept {
    if (s.empty() || s.front() == '{' || s.front() == '[') {
        return std::string_view::npos;
    }
    bool in_single = false;
    bool in_double = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\\' && in_double) {
            ++i;
        } else if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (c == ':' && !in_single && !in_double &&
                   (i + 1 == s.size() || s[i + 1] == ' ' || s[i + 1] == '\t')) {
            return i;
        }
    }
    return std::string_view::npos;
}

bool is_null_literal(std::string_view sv) noexcept {
    return sv.empty() || sv == "~" || sv == "null" || sv == "Null" || sv == "NULL";
}

std::optional<bool> bool_literal(std::string_view sv) noexcept {
    if (sv == "true" || sv == "True" || sv == "TRUE") {
        return true;
    }
    if (sv == "false" || sv == "False" || sv == "FALSE") {
        return false;
    }
    return std::nullopt;
}

bool is_number_literal(std::string_view sv) noexcept {
    if (!sv.empty() && sv.front() == '+') {
        sv.remove_prefix(1);
    }
    if (sv.empty()) {
        return false;
    }
    json_cursor cur{sv.data(), sv.data() + sv.size()};
    auto num = cur.number();
    return num && cur.eof();
}

spec_node plain_scalar(std::string_view sv) {
    sv = trim_view(sv);
    if (is_null_literal(sv)) {
        return spec_node::make_null();
    }
    if (auto b = bool_literal(sv)) {
        return spec_node::make_bool(*b);
    }
    if (is_number_literal(sv)) {
        if (sv.front() == '+') {
            sv.remove_prefix(1);
        }
        return spec_node::make_number(std::string(sv));
    }
    return spec_node::make_string(std::string(sv));
}

std::optional<std::string> unquote(std::string_view sv) {
    if (sv.size() < 2) {
        return std::nullopt;
    }
    if (sv.front() == '\"' && sv.back() == '\"') {
        json_cursor cur{sv.data(), sv.data() + sv.size()};
        auto s = cur.string();
        if (!s || !cur.eof()) {
            return std::nullopt;
        }
        return s;
    }
    if (sv.front() == '\'' && sv.back() == '\'') {
        std::string out;
        auto inner = sv.substr(1, sv.size() - 2);
        for (size_t i = 0; i < inner.size(); ++i) {
            out.push_back(inner[i]);
            if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') {
                ++i;
            }
        }
        return out;
    }
    return std::nullopt;
}

std::string normalize_key(std::string_view key) {
    auto trimmed = trim_view(key);
    if (auto q = unquote(trimmed)) {
        return std::move(*q);
    }
    return std::string(trimmed);
}

class flow_parser {
public:
    flow_parser(std::string_view text, size_t line) : text_(text), line_(line) {}

    result<spec_node> parse() {
        auto v = value(0);
        if (!v) {
            return v;
        }
        skip_ws();
        if (pos_ != text_.size()) {
            return error("trailing characters after flow collection");
        }
        return v;
    }

private:
    std::unexpected<spec_error> error(std::string_view what) const {
        return fail(error_code::parse_error, "line " + std::to_string(line_), std::string(what));
    }

    void skip_ws() noexcept {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    result<std::string> quoted() {
        char q = text_[pos_];
        size_t begin = pos_++;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (q == '\"' && c == '\\') {
                pos_ += 2;
                continue;
            }
            if (c == q) {
                if (q == '\'' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '\'') {
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                auto s = unquote(text_.substr(begin, pos_ - begin));
                if (!s) {
                    return error("malformed quoted scalar");
                }
                return std::move(*s);
            }
            ++pos_;
        }
        return error("unterminated quoted scalar");
    }

    std::string_view plain(bool in_map_key) noexcept {
        size_t begin = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == ',' || c == ']' || c == '}') {
                break;
            }
            if (in_map_key && c == ':' &&
                (pos_ + 1 == text_.size() || text_[pos_ + 1] == ' ')) {
                break;
            }
            ++pos_;
        }
        return trim_view(text_.substr(begin, pos_ - begin));
    }

    result<spec_node> value(int depth) {
        if (depth > kMaxNestingDepth) {
            return error("nesting too deep");
        }
        skip_ws();
        if (pos_ >= text_.size()) {
            return spec_node::make_null();
        }
        char c = text_[pos_];
        if (c == '{') {
            ++pos_;
            spec_node obj = spec_node::make_object();
            while (true) {
                skip_ws();
                if (pos_ < text_.size() && text_[pos_] == '}') {
                    ++pos_;
                    return obj;
                }
                std::string key;
                if (pos_ < text_.size() && (text_[pos_] == '\"' || text_[pos_] == '\'')) {
                    auto q = quoted();
                    if (!q) {
                        return std::unexpected(q.error());
                    }
                    key = std::move(*q);
                } else {
                    key = std::string(plain(true));
                }
                skip_ws();
                spec_node v;
                if (pos_ < text_.size() && text_[pos_] == ':') {
                    ++pos_;
                    auto parsed = value(depth + 1);
                    if (!parsed) {
                        return parsed;
                    }
                    v = std::move(*parsed);
                }
                if (obj.contains(key)) {
                    return error("duplicate key '" + key + "' in flow mapping");
                }
                obj.set(std::move(key), std::move(v));
                skip_ws();
                if (pos_ < text_.size() && text_[pos_] == ',') {
                    ++pos_;
                    continue;
                }
                if (pos_ < text_.size() && text_[pos_] == '}') {
                    ++pos_;
                    return obj;
                }
                return error("expected ',' or '}' in flow mapping");
            }
        }
        if (c == '[') {
            ++pos_;
            spec_node arr = spec_node::make_array();
            while (true) {
                skip_ws();
                if (pos_ < text_.size() && text_[pos_] == ']') {
                    ++pos_;
                    return arr;
                }
                auto item = value(depth + 1);
                if (!item) {
                    return item;
                }
                arr.push_back(std::move(*item));
                skip_ws();
                if (pos_ < text_.size() && text_[pos_] == ',') {
                    ++pos_;
                    continue;
                }
                if (pos_ < text_.size() && text_[pos_] == ']') {
                    ++pos_;
                    return arr;
                }
                return error("expected ',' or ']' in flow sequence");
            }
        }
        if (c == '\"' || c == '\'') {
            auto q = quoted();
            if (!q) {
                return std::unexpected(q.error());
            }
            return spec_node::make_string(std::move(*q));
        }
        return plain_scalar(plain(false));
    }

    std::string_view text_;
    size_t line_;
    size_t pos_ = 0;
};

int bracket_balance(std::string_view s) noexcept {
    int depth = 0;
    bool in_single = false;
    bool in_double = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '\\' && in_double) {
            ++i;
        } else if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (!in_single && !in_double) {
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            }
        }
    }
    return depth;
}

class yaml_parser {
public:
    explicit yaml_parser(std::string_view text) : lines_(tokenize_yaml(text)) {}

    result<spec_node> parse() {
        skip_blank();
        if (eof()) {
            return fail(error_code::parse_error, "line 1", "empty document");
        }
        const int root_indent = lines_[idx_].indent;
        auto root = block(root_indent, 0);
        if (!root) {
            return root;
        }
        skip_blank();
        if (!eof()) {
            return error(idx_, "unexpected content at lower indentation");
        }
        return root;
    }

private:
    bool eof() const noexcept { return idx_ >= lines_.size(); }

    void skip_blank() noexcept {
        while (!eof() && lines_[idx_].blank) {
            ++idx_;
        }
    }

    std::unexpected<spec_error> error(size_t line_idx, std::string what) const {
        return fail(error_code::parse_error, "line " + std::to_string(line_idx + 1),
                    std::move(what));
    }

    result<spec_node> block(int indent, int depth) {
        if (depth > kMaxNestingDepth) {
            return error(idx_, "nesting too deep");
        }
        skip_blank();
        if (eof()) {
            return spec_node::make_null();
        }
        const auto& ln = lines_[idx_];
        if (is_sequence_entry(ln.content)) {
            return sequence(indent, depth);
        }
        if (find_mapping_colon(ln.content) != std::string_view::npos) {
            return mapping(indent, depth);
        }
        size_t line_idx = idx_;
        ++idx_;
        return scalar_value(ln.content, indent - 1, line_idx, depth);
    }

    result<spec_node> mapping(int indent, int depth) {
        spec_node obj = spec_node::make_object();
        std::unordered_set<std::string> seen;
        while (true) {
            skip_blank();
            if (eof()) {
                break;
            }
            const auto& ln = lines_[idx_];
            if (ln.indent < indent) {
                break;
            }
            if (ln.indent > indent) {
                return error(idx_, "unexpected indentation");
            }
            if (is_sequence_entry(ln.content)) {
                return error(idx_, "sequence entry inside a mapping");
            }
            auto colon = find_mapping_colon(ln.content);
            if (colon == std::string_view::npos) {
                return error(idx_, "expected 'key: value'");
            }
            std::string key = normalize_key(ln.content.substr(0, colon));
            std::string_view val = trim_view(ln.content.substr(colon + 1));
            size_t line_idx = idx_;
            ++idx_;

            auto child = value(val, indent, line_idx, depth + 1);
            if (!child) {
                return child;
            }
            if (!seen.insert(key).second) {
                return error(line_idx, "duplicate key '" + key + "'");
            }
            obj.set(std::move(key), std::move(*child));
        }
        return obj;
    }

    result<spec_node> sequence(int indent, int depth) {
        spec_node arr = spec_node::make_array();
        while (true) {
            skip_blank();
            if (eof()) {
                break;
            }
            auto& ln = lines_[idx_];
            if (ln.indent != indent || !is_sequence_entry(ln.content)) {
                if (ln.indent > indent) {
                    return error(idx_, "unexpected indentation");
                }
                break;
            }
            std::string_view item = ln.content.substr(1);
            size_t offset = 1;
            while (!item.empty() && item.front() == ' ') {
                item.remove_prefix(1);
                ++offset;
            }
            if (item.empty()) {
                size_t line_idx = idx_;
                ++idx_;
                auto child = value({}, indent, line_idx, depth + 1);
                if (!child) {
                    return child;
                }
                arr.push_back(std::move(*child));
                continue;
            }

            // "- key: value" opens a mapping whose column is the item's column;
            // re-reading the line as if it started there keeps one code path.
            const int item_indent = indent + static_cast<int>(offset);
            if (is_sequence_entry(item) || find_mapping_colon(item) != std::string_view::npos) {
                ln.indent = item_indent;
                ln.content = item;
                auto child = block(item_indent, depth + 1);
                if (!child) {
                    return child;
                }
                arr.push_back(std::move(*child));
                continue;
            }
            size_t line_idx = idx_;
            ++idx_;
            auto child = scalar_value(item, indent, line_idx, depth + 1);
            if (!child) {
                return child;
            }
            arr.push_back(std::move(*child));
        }
        return arr;
    }

    // Value after "key:" or "-". parent_indent is the column of the owner.
    result<spec_node> value(std::string_view text, int parent_indent, size_t line_idx, int depth) {
        if (!text.empty()) {
            return scalar_value(text, parent_indent, line_idx, depth);
        }
        skip_blank();
        if (eof()) {
            return spec_node::make_null();
        }
        const auto& next = lines_[idx_];
        if (next.indent > parent_indent) {
            return block(next.indent, depth);
        }
        if (next.indent == parent_indent && is_sequence_entry(next.content)) {
            return sequence(parent_indent, depth);
        }
        return spec_node::make_null();
    }

    result<spec_node>
    scalar_value(std::string_view text, int parent_indent, size_t line_idx, int depth) {
        // Tags are accepted and ignored.
        if (text.starts_with("!!")) {
            auto space = text.find(' ');
            text = space == std::string_view::npos ? std::string_view{}
                                                   : trim_view(text.substr(space + 1));
            if (text.empty()) {
                return value({}, parent_indent, line_idx, depth);
            }
        }
        char c = text.front();
        if (c == '|' || c == '>') {
            return block_scalar(text, parent_indent);
        }
        if (c == '{' || c == '[') {
            std::string joined(text);
            while (bracket_balance(joined) > 0 && !eof()) {
                if (!lines_[idx_].blank) {
                    joined.push_back(' ');
                    joined.append(lines_[idx_].content);
                }
                ++idx_;
            }
            return flow_parser(joined, line_idx + 1).parse();
        }
        if (c == '\"' || c == '\'') {
            if (auto q = unquote(text)) {
                return spec_node::make_string(std::move(*q));
            }
            return error(line_idx, "malformed quoted scalar");
        }

        // Plain scalars may continue on more-indented lines (folded with spaces).
        std::string folded(text);
        bool continued = false;
        while (!eof() && !lines_[idx_].blank && lines_[idx_].indent > parent_indent &&
               find_mapping_colon(lines_[idx_].content) == std::string_view::npos &&
               !is_sequence_entry(lines_[idx_].content)) {
            folded.push_back(' ');
            folded.append(lines_[idx_].content);
            continued = true;
            ++idx_;
        }
        if (continued) {
            return spec_node::make_string(std::move(folded));
        }
        return plain_scalar(folded);
    }

    result<spec_node> block_scalar(std::string_view header, int parent_indent) {
        const bool literal = header.front() == '|';
        char chomp = ' ';
        for (char h : header.substr(1)) {
            if (h == '-' || h == '+') {
                chomp = h;
            }
        }

        std::vector<std::string_view> body;
        int block_indent = -1;
        while (!eof()) {
            const auto& ln = lines_[idx_];
            bool empty = trim_view(ln.raw).empty();
            if (!empty && ln.indent <= parent_indent) {
                break;
            }
            if (!empty && block_indent < 0) {
                block_indent = ln.indent;
            }
            if (empty) {
                body.emplace_back();
            } else if (ln.indent < block_indent) {
                break;
            } else {
                body.push_back(ln.raw.substr(static_cast<size_t>(block_indent)));
            }
            ++idx_;
        }

        size_t trailing = 0;
        while (!body.empty() && body.back().empty()) {
            body.pop_back();
            ++trailing;
        }

        std::string out;
        for (size_t i = 0; i < body.size(); ++i) {
            if (i == 0) {
                out.append(body[i]);
                continue;
            }
            if (literal) {
                out.push_back('\n');
            } else if (body[i].empty() || body[i - 1].empty() || body[i].front() == ' ' ||
                       body[i - 1].front() == ' ') {
                out.push_back('\n');
            } else {
                out.push_back(' ');
            }
            out.append(body[i]);
        }

        if (!body.empty()) {
            if (chomp == ' ') {
                out.push_back('\n');
            } else if (chomp == '+') {
                out.append(trailing + 1, '\n');
            }
        }
        return spec_node::make_string(std::move(out));
    }

    std::vector<yaml_line> lines_;
    size_t idx_ = 0;
};

} // namespace

result<spec_node> parse_json(std::string_view text) {
    json_cursor cur{text.data(), text.data() + text.size()};
    auto root = parse_json_value(cur, 0);
    if (!root) {
        return root;
    }
    cur.skip_ws();
    if (!cur.eof()) {
        return fail(error_code::parse_error, at_offset(cur.pos()), "trailing characters");
    }
    return root;
}

result<spec_node> parse_yaml(std::string_view text) {
    return yaml_parser(text).parse();
}

result<spec_document> load_from_string(std::string_view text) {
    auto trimmed = trim_view(text);
    if (trimmed.empty()) {
        return fail(error_code::parse_error, {}, "document is empty");
    }
    bool is_json = trimmed.front() == '{' || trimmed.front() == '[';
    auto root = is_json ? parse_json(trimmed) : parse_yaml(text);
    if (!root) {
        return std::unexpected(root.error());
    }
    if (!root->is_object()) {
        return fail(error_code::structural_error, "#", "document root is not a mapping");
    }
    return spec_document{std::move(*root), text.size()};
}

result<spec_document> load_from_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(error_code::io_error, path.string(), "cannot open file");
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return fail(error_code::io_error, path.string(), "read failed");
    }
    auto doc = load_from_string(oss.str());
    if (!doc && doc.error().location.empty()) {
        doc.error().location = path.string();
    }
    return doc;
}

} // namespace mcpgen
