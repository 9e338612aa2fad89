#pragma once

#include "result.hpp"
#include "spec_node.hpp"

#include <filesystem>
#include <string_view>

namespace mcpgen {

result<spec_node> parse_json(std::string_view text);

// Block-style YAML as API descriptions use it: mappings, sequences, flow
// collections, quoted and block scalars. Anchors, aliases and tags are not
// interpreted.
result<spec_node> parse_yaml(std::string_view text);

// Picks JSON when the text starts with '{' or '[', YAML otherwise.
result<spec_document> load_from_string(std::string_view text);
result<spec_document> load_from_file(const std::filesystem::path& path);

} // namespace mcpgen
