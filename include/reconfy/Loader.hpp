/**
 * @file Loader.hpp
 * @brief Reading and writing documents
 *
 * Converts between document text and the Node tree:
 * - JSON (using nlohmann::json; key order is kept, comments are skipped)
 * - TOML (using toml++; tables come back in key order)
 * - YAML (using yaml-cpp; node comments are written out on save)
 *
 * Mappings / tables / objects become Sections, everything else a Value.
 * A document root must be a mapping; an empty YAML document loads as an
 * empty Section.
 */

#ifndef RECONFY_LOADER_HPP
#define RECONFY_LOADER_HPP

#include "reconfy/Node.hpp"

#include <string>

namespace reconfy {

// ============================================================================
// Parsing (text → tree)
// ============================================================================

/**
 * @brief Parse a JSON document
 * @param text Document text
 * @param origin Name used in error messages
 * @throws DocumentParseError on syntax errors or a non-object root
 */
Node parse_json_document(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Parse a TOML document
 * @throws DocumentParseError on syntax errors
 */
Node parse_toml_document(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Parse a YAML document
 *
 * Plain scalars are typed by the YAML core schema: null (~, null, empty),
 * booleans (true/false in any common case), integers, floats (including
 * .inf and .nan); everything else, and every quoted scalar, is a string.
 *
 * @throws DocumentParseError on syntax errors or a non-mapping root
 */
Node parse_yaml_document(const std::string& text, const std::string& origin = "<string>");

// ============================================================================
// Serialization (tree → text)
// ============================================================================

std::string dump_json(const Node& root, int indent = 2);
std::string dump_toml(const Node& root);

// Strings that would read back as another type are double-quoted.
std::string dump_yaml(const Node& root);

// ============================================================================
// Files
// ============================================================================

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension
 *
 * .json → JSON, .toml → TOML, .yaml / .yml → YAML.
 *
 * @throws FileNotFoundError if the file does not exist
 * @throws DocumentParseError on syntax errors or an unsupported extension
 */
Node load_document(const std::string& path);

/**
 * @brief Write a document in the format implied by the extension
 * @throws DocumentWriteError if the file cannot be opened, or the
 *         extension is not supported
 */
void save_document(const std::string& path, const Node& root);

} // namespace reconfy

#endif // RECONFY_LOADER_HPP
