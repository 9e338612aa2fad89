#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mcpgen {

enum class error_code : int {
    ok = 0,
    unsupported_dialect = 1,
    unresolved_reference = 2,
    ambiguous_request_body = 3,
    duplicate_operation_id = 4,
    operation_count_exceeded = 5,
    structural_error = 6,
    parse_error = 7,
    io_error = 8,
};

} // namespace mcpgen

namespace std {
template <> struct is_error_code_enum<mcpgen::error_code> : true_type {};
} // namespace std

namespace mcpgen {

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "mcpgen"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::unsupported_dialect:
            return "unsupported or missing specification version";
        case ec::unresolved_reference:
            return "reference target does not exist";
        case ec::ambiguous_request_body:
            return "more than one request body declared";
        case ec::duplicate_operation_id:
            return "duplicate operation identifier";
        case ec::operation_count_exceeded:
            return "operation count exceeds the configured maximum";
        case ec::structural_error:
            return "malformed document structure";
        case ec::parse_error:
            return "failed to parse document text";
        case ec::io_error:
            return "failed to read document";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

// An error plus where in the document it happened: a pointer string such as
// "#/components/schemas/Pet" or an operation such as "POST /pets".
struct spec_error {
    std::error_code code;
    std::string location;
    std::string detail;

    spec_error() = default;
    spec_error(std::error_code c) : code(c) {}
    spec_error(error_code c, std::string where = {}, std::string what = {})
        : code(make_error_code(c)), location(std::move(where)), detail(std::move(what)) {}

    [[nodiscard]] std::string message() const {
        std::string out = code.message();
        if (!location.empty()) {
            out += " at ";
            out += location;
        }
        if (!detail.empty()) {
            out += ": ";
            out += detail;
        }
        return out;
    }

    friend bool operator==(const spec_error& e, error_code c) noexcept {
        return e.code == make_error_code(c);
    }
};

template <typename T> using result = std::expected<T, spec_error>;

inline std::unexpected<spec_error>
fail(error_code c, std::string location = {}, std::string detail = {}) {
    return std::unexpected(spec_error{c, std::move(location), std::move(detail)});
}

} // namespace mcpgen
