#pragma once

#include "result.hpp"
#include "spec_node.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgen {

enum class dialect : uint8_t { swagger_2, openapi_3_0, openapi_3_1 };

std::string_view dialect_to_string(dialect d) noexcept;

// Uniform view over the dialect-dependent layout of a document. Everything
// downstream of detection talks to this interface only.
class dialect_adapter {
public:
    explicit dialect_adapter(const spec_document& doc) noexcept : doc_(&doc) {}
    virtual ~dialect_adapter() = default;

    dialect_adapter(const dialect_adapter&) = delete;
    dialect_adapter& operator=(const dialect_adapter&) = delete;

    [[nodiscard]] virtual dialect tag() const noexcept = 0;
    // The version text as declared ("2.0", "3.0.3", ...).
    [[nodiscard]] virtual std::string version() const = 0;

    // "" when the document declares no base.
    [[nodiscard]] virtual std::string base_url() const = 0;
    [[nodiscard]] virtual std::vector<std::string> servers() const = 0;

    [[nodiscard]] virtual const spec_node* schema_registry_root() const noexcept = 0;
    [[nodiscard]] virtual const spec_node* security_schemes_root() const noexcept = 0;
    [[nodiscard]] virtual const spec_node* parameters_root() const noexcept = 0;
    [[nodiscard]] virtual const spec_node* request_bodies_root() const noexcept = 0;
    [[nodiscard]] virtual const spec_node* responses_root() const noexcept = 0;
    [[nodiscard]] virtual std::string_view schema_pointer_prefix() const noexcept = 0;

    [[nodiscard]] virtual bool has_request_body_field() const noexcept = 0;
    [[nodiscard]] virtual bool supports_ref_siblings() const noexcept = 0;
    [[nodiscard]] virtual bool supports_alternatives() const noexcept = 0;
    [[nodiscard]] virtual std::string_view nullable_keyword() const noexcept = 0;

    [[nodiscard]] const spec_document& document() const noexcept { return *doc_; }
    [[nodiscard]] const spec_node& root() const noexcept { return doc_->root; }

protected:
    const spec_node* components_child(std::string_view key) const noexcept;

private:
    const spec_document* doc_;
};

class swagger2_adapter final : public dialect_adapter {
public:
    using dialect_adapter::dialect_adapter;

    dialect tag() const noexcept override { return dialect::swagger_2; }
    std::string version() const override;
    std::string base_url() const override;
    std::vector<std::string> servers() const override;

    const spec_node* schema_registry_root() const noexcept override;
    const spec_node* security_schemes_root() const noexcept override;
    const spec_node* parameters_root() const noexcept override;
    const spec_node* request_bodies_root() const noexcept override { return nullptr; }
    const spec_node* responses_root() const noexcept override;
    std::string_view schema_pointer_prefix() const noexcept override { return "#/definitions/"; }

    bool has_request_body_field() const noexcept override { return false; }
    bool supports_ref_siblings() const noexcept override { return false; }
    bool supports_alternatives() const noexcept override { return false; }
    std::string_view nullable_keyword() const noexcept override { return "x-nullable"; }
};

class openapi3_adapter final : public dialect_adapter {
public:
    openapi3_adapter(const spec_document& doc, dialect d) noexcept
        : dialect_adapter(doc), tag_(d) {}

    dialect tag() const noexcept override { return tag_; }
    std::string version() const override;
    std::string base_url() const override;
    std::vector<std::string> servers() const override;

    const spec_node* schema_registry_root() const noexcept override;
    const spec_node* security_schemes_root() const noexcept override;
    const spec_node* parameters_root() const noexcept override;
    const spec_node* request_bodies_root() const noexcept override;
    const spec_node* responses_root() const noexcept override;
    std::string_view schema_pointer_prefix() const noexcept override {
        return "#/components/schemas/";
    }

    bool has_request_body_field() const noexcept override { return true; }
    bool supports_ref_siblings() const noexcept override { return tag_ == dialect::openapi_3_1; }
    bool supports_alternatives() const noexcept override { return true; }
    std::string_view nullable_keyword() const noexcept override { return "nullable"; }

private:
    dialect tag_;
};

// Fails with unsupported_dialect when neither a "swagger: 2.0" nor an
// "openapi: 3.0.x / 3.1.x" indicator is present.
result<std::unique_ptr<dialect_adapter>> detect_dialect(const spec_document& doc);

} // namespace mcpgen
