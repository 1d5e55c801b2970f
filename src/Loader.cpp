/**
 * @file Loader.cpp
 * @brief Document loading and project definition decoding
 */

#include "maxify/Loader.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Log.hpp"
#include "maxify/Units.hpp"
#include "maxify/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace maxify {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ value to a document node.
 */
Document toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Document(node.as_string()->get());

        case toml::node_type::integer:
            return Document(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Document(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Document(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Document(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Document(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Document(ss.str());
        }

        case toml::node_type::array: {
            Document arr = Document::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Document obj = Document::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Document(nullptr);
    }
}

std::string index_path(const std::string& base, size_t i) {
    return base + "[" + std::to_string(i) + "]";
}

std::string key_path(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

std::optional<std::string> optional_string(const Document& obj, const std::string& key,
                                           const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw SchemaError(key_path(path, key), "expected a string, got " + type_name(*it));
    }
    return it->get<std::string>();
}

std::string required_string(const Document& obj, const std::string& key, const std::string& path) {
    auto value = optional_string(obj, key, path);
    if (!value) {
        throw SchemaError(key_path(path, key), "missing required key");
    }
    return *value;
}

/**
 * @brief Text form of a value_range / default_value entry.
 *
 * Numbers are converted to their text form and go through the unit
 * parser like any other entry.
 */
std::string value_text(const Document& node, const std::string& path) {
    if (node.is_string()) {
        return node.get<std::string>();
    }
    if (node.is_number()) {
        return node.dump();
    }
    throw SchemaError(path, "expected a string or number, got " + type_name(node));
}

Value parse_definition_value(ValueKind kind, const Document& node, const std::string& path) {
    const std::string text = value_text(node, path);
    try {
        return parse_value(kind, text);
    } catch (const ParsingError& e) {
        throw ConfigError("Invalid value at '" + path + "': " + e.what());
    }
}

Metric metric_from_node(const Document& node, const std::string& path) {
    if (!node.is_object()) {
        throw SchemaError(path, "expected an object, got " + type_name(node));
    }

    const std::string name = required_string(node, "name", path);
    const std::string type = required_string(node, "metric_type", path);

    ValueKind kind;
    try {
        kind = parse_value_kind(type);
    } catch (const ConfigError& e) {
        throw ConfigError("Invalid definition at '" + key_path(path, "metric_type") + "': " + e.what());
    }

    std::optional<std::vector<Value>> allowed;
    auto range = node.find("value_range");
    if (range != node.end() && !range->is_null()) {
        const std::string range_path = key_path(path, "value_range");
        if (!range->is_array()) {
            throw SchemaError(range_path, "expected an array, got " + type_name(*range));
        }
        allowed.emplace();
        for (size_t i = 0; i < range->size(); ++i) {
            allowed->push_back(parse_definition_value(kind, (*range)[i], index_path(range_path, i)));
        }
    }

    std::optional<Value> default_value;
    auto def = node.find("default_value");
    if (def != node.end() && !def->is_null()) {
        default_value = parse_definition_value(kind, *def, key_path(path, "default_value"));
    }

    try {
        return Metric(name, kind, optional_string(node, "desc", path),
                      std::move(allowed), std::move(default_value));
    } catch (const ConfigError& e) {
        throw ConfigError("Invalid definition at '" + path + "': " + e.what());
    }
}

Project project_from_node(const Document& node, const std::string& path) {
    if (!node.is_object()) {
        throw SchemaError(path, "expected an object, got " + type_name(node));
    }

    const std::string name = required_string(node, "name", path);
    if (name.empty()) {
        throw SchemaError(key_path(path, "name"), "must not be empty");
    }

    Project project(name,
                    optional_string(node, "organization", path),
                    optional_string(node, "desc", path));

    auto metrics = node.find("metrics");
    if (metrics != node.end() && !metrics->is_null()) {
        const std::string metrics_path = key_path(path, "metrics");
        if (!metrics->is_array()) {
            throw SchemaError(metrics_path, "expected an array, got " + type_name(*metrics));
        }
        for (size_t i = 0; i < metrics->size(); ++i) {
            project.add_metric(metric_from_node((*metrics)[i], index_path(metrics_path, i)));
        }
    }

    return project;
}

} // anonymous namespace

// ============================================================================
// JSON File Loading
// ============================================================================

Document load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content;
    try {
        content = read_file(path);
    } catch (const FileNotFoundError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigParseError(path, 0, 0, std::string("Failed to read file: ") + e.what());
    }

    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

// ============================================================================
// TOML File Loading
// ============================================================================

Document load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_value_to_json(table);
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Document load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported file type: '" + ext + "' (expected .json or .toml)");
}

// ============================================================================
// Project definitions
// ============================================================================

std::vector<Project> projects_from_document(const Document& doc, const std::string& source) {
    if (!doc.is_object()) {
        throw SchemaError("<root>", "expected an object, got " + type_name(doc));
    }
    auto projects = doc.find("projects");
    if (projects == doc.end()) {
        throw SchemaError("projects", "missing required key");
    }
    if (!projects->is_array()) {
        throw SchemaError("projects", "expected an array, got " + type_name(*projects));
    }

    std::vector<Project> out;
    std::set<std::string> seen;
    for (size_t i = 0; i < projects->size(); ++i) {
        Project project = project_from_node((*projects)[i], index_path("projects", i));
        if (!seen.insert(to_lower(project.qualified_name())).second) {
            throw ConfigError("Duplicate project definition '" + project.qualified_name() + "'"
                              + (source.empty() ? std::string() : " in '" + source + "'"));
        }
        out.push_back(std::move(project));
    }

    log_debug("Loaded {} project definition(s){}", out.size(),
              source.empty() ? std::string() : " from '" + source + "'");
    return out;
}

std::vector<Project> load_projects(const std::string& path) {
    return projects_from_document(load_document(path), path);
}

} // namespace maxify
