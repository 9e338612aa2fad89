#include "mcpgen/core/dialect.hpp"

namespace mcpgen {

namespace {

// Versions may arrive as YAML numbers (swagger: 2.0), so both strings and
// number literals are read through text().
std::string version_text(const spec_node& root, std::string_view key) {
    const auto* v = root.find(key);
    if (!v || !(v->is_string() || v->is_number())) {
        return {};
    }
    return v->text();
}

bool has_minor_prefix(std::string_view version, std::string_view major_minor) noexcept {
    if (!version.starts_with(major_minor)) {
        return false;
    }
    return version.size() == major_minor.size() || version[major_minor.size()] == '.';
}

} // namespace

std::string_view dialect_to_string(dialect d) noexcept {
    switch (d) {
    case dialect::swagger_2:
        return "swagger_2";
    case dialect::openapi_3_0:
        return "openapi_3_0";
    case dialect::openapi_3_1:
        return "openapi_3_1";
    }
    return "unknown";
}

const spec_node* dialect_adapter::components_child(std::string_view key) const noexcept {
    const auto* components = root().object_at("components");
    return components ? components->object_at(key) : nullptr;
}

std::string swagger2_adapter::version() const {
    return version_text(root(), "swagger");
}

std::string swagger2_adapter::base_url() const {
    auto host = root().string_or("host");
    if (host.empty()) {
        return {};
    }
    std::string scheme = "https";
    if (const auto* schemes = root().array_at("schemes")) {
        if (!schemes->items().empty() && schemes->items().front().is_string()) {
            scheme = schemes->items().front().text();
        }
    }
    std::string url = scheme + "://" + std::string(host);
    auto base_path = root().string_or("basePath");
    if (!base_path.empty() && base_path != "/") {
        if (base_path.front() != '/') {
            url.push_back('/');
        }
        url += base_path;
    }
    return url;
}

std::vector<std::string> swagger2_adapter::servers() const {
    std::vector<std::string> out;
    auto host = root().string_or("host");
    if (host.empty()) {
        return out;
    }
    auto base_path = std::string(root().string_or("basePath"));
    if (base_path == "/") {
        base_path.clear();
    }
    if (const auto* schemes = root().array_at("schemes")) {
        for (const auto& s : schemes->items()) {
            if (s.is_string()) {
                out.push_back(s.text() + "://" + std::string(host) + base_path);
            }
        }
    }
    if (out.empty()) {
        out.push_back(base_url());
    }
    return out;
}

const spec_node* swagger2_adapter::schema_registry_root() const noexcept {
    return root().object_at("definitions");
}

const spec_node* swagger2_adapter::security_schemes_root() const noexcept {
    return root().object_at("securityDefinitions");
}

const spec_node* swagger2_adapter::parameters_root() const noexcept {
    return root().object_at("parameters");
}

const spec_node* swagger2_adapter::responses_root() const noexcept {
    return root().object_at("responses");
}

std::string openapi3_adapter::version() const {
    return version_text(root(), "openapi");
}

std::string openapi3_adapter::base_url() const {
    const auto* servers = root().array_at("servers");
    if (!servers) {
        return {};
    }
    for (const auto& s : servers->items()) {
        auto url = s.string_or("url");
        if (!url.empty()) {
            return std::string(url);
        }
    }
    return {};
}

std::vector<std::string> openapi3_adapter::servers() const {
    std::vector<std::string> out;
    if (const auto* servers = root().array_at("servers")) {
        for (const auto& s : servers->items()) {
            auto url = s.string_or("url");
            if (!url.empty()) {
                out.emplace_back(url);
            }
        }
    }
    return out;
}

const spec_node* openapi3_adapter::schema_registry_root() const noexcept {
    return components_child("schemas");
}

const spec_node* openapi3_adapter::security_schemes_root() const noexcept {
    return components_child("securitySchemes");
}

const spec_node* openapi3_adapter::parameters_root() const noexcept {
    return components_child("parameters");
}

const spec_node* openapi3_adapter::request_bodies_root() const noexcept {
    return components_child("requestBodies");
}

const spec_node* openapi3_adapter::responses_root() const noexcept {
    return components_child("responses");
}

result<std::unique_ptr<dialect_adapter>> detect_dialect(const spec_document& doc) {
    const auto& root = doc.root;
    if (!root.is_object()) {
        return fail(error_code::unsupported_dialect, "#", "document root is not a mapping");
    }

    auto swagger = version_text(root, "swagger");
    if (!swagger.empty()) {
        if (swagger == "2.0" || swagger == "2") {
            return std::make_unique<swagger2_adapter>(doc);
        }
        return fail(error_code::unsupported_dialect, "#/swagger", "version " + swagger);
    }

    auto openapi = version_text(root, "openapi");
    if (!openapi.empty()) {
        if (has_minor_prefix(openapi, "3.0")) {
            return std::make_unique<openapi3_adapter>(doc, dialect::openapi_3_0);
        }
        if (has_minor_prefix(openapi, "3.1")) {
            return std::make_unique<openapi3_adapter>(doc, dialect::openapi_3_1);
        }
        return fail(error_code::unsupported_dialect, "#/openapi", "version " + openapi);
    }

    return fail(error_code::unsupported_dialect, "#", "no 'swagger' or 'openapi' version field");
}

} // namespace mcpgen
