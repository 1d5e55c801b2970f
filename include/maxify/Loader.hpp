/**
 * @file Loader.hpp
 * @brief Loading project definitions and settings documents
 *
 * Implements loading documents from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * and turning a definition document into candidate projects. A definition
 * document has the shape
 *
 * ```json
 * {"projects": [{"name": "...", "organization": "...", "desc": "...",
 *                "metrics": [{"name": "...", "metric_type": "Integer",
 *                             "desc": "...", "value_range": ["1", "2"],
 *                             "default_value": "1"}]}]}
 * ```
 *
 * The loader never consults or mutates a store.
 */

#ifndef MAXIFY_LOADER_HPP
#define MAXIFY_LOADER_HPP

#include "maxify/Project.hpp"
#include "maxify/Value.hpp"

#include <string>
#include <vector>

namespace maxify {

// ============================================================================
// Document loading
// ============================================================================

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid
 */
Document load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Tables become objects and arrays of tables become arrays of objects, so
 * `[[projects]]` sections produce the same shape as the JSON form.
 *
 * @param path Path to the TOML file
 * @return Parsed document
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Document load_toml_file(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the file has syntax errors
 * @throws ConfigError if the extension is not .json or .toml
 */
Document load_document(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Project definitions
// ============================================================================

/**
 * @brief Build candidate projects from a definition document.
 *
 * Allowed and default values are parsed with the metric's unit parser.
 *
 * @param doc Decoded document
 * @param source Name of the document for messages (e.g. its path)
 * @throws SchemaError if the document does not have the expected shape
 * @throws ConfigError for unknown metric types, duplicate metric or
 *         project names, invalid identities and unparsable values
 */
std::vector<Project> projects_from_document(const Document& doc, const std::string& source = "");

/**
 * @brief load_document() followed by projects_from_document()
 */
std::vector<Project> load_projects(const std::string& path);

} // namespace maxify

#endif // MAXIFY_LOADER_HPP
