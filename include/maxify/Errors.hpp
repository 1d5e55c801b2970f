/**
 * @file Errors.hpp
 * @brief Exception types for maxify
 *
 * Error taxonomy:
 * - MaxifyError: Base class
 * - ParsingError: Text does not match the grammar of its value kind
 * - ConfigError: Invalid project definition or settings
 *   - FileNotFoundError, ConfigParseError, SchemaError
 * - ProjectConflictError: Import aborted on qualified-name collisions
 * - ModelError: A write violates a model invariant
 *   - ValueNotAllowedError
 * - StoreError: Persistence failure or store misuse
 */

#ifndef MAXIFY_ERRORS_HPP
#define MAXIFY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace maxify {

/**
 * @brief Base class for all maxify exceptions
 */
class MaxifyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Text could not be parsed as the declared value kind
 */
class ParsingError : public MaxifyError {
public:
    /**
     * @brief Construct with the kind being parsed and the offending input
     * @param kind Value kind name (e.g., "Duration")
     * @param text Full input text
     * @param fragment The specific token that failed, empty if the whole
     *        text is at fault
     */
    ParsingError(std::string kind, std::string text, std::string fragment = "")
        : MaxifyError(format_message(kind, text, fragment))
        , kind_(std::move(kind))
        , text_(std::move(text))
        , fragment_(std::move(fragment))
    {}

    const std::string& kind() const noexcept { return kind_; }
    const std::string& text() const noexcept { return text_; }
    const std::string& fragment() const noexcept { return fragment_; }

private:
    std::string kind_;
    std::string text_;
    std::string fragment_;

    static std::string format_message(const std::string& kind,
                                      const std::string& text,
                                      const std::string& fragment) {
        std::string msg = "Invalid " + kind + " expression: '" + text + "'";
        if (!fragment.empty() && fragment != text) {
            msg += " (at '" + fragment + "')";
        }
        return msg;
    }
};

/**
 * @brief Base class for configuration errors
 *
 * Raised for structurally invalid project definitions, unknown metric
 * types, duplicate metric names and invalid settings.
 */
class ConfigError : public MaxifyError {
public:
    using MaxifyError::MaxifyError;
};

/**
 * @brief Definition or settings file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Definition file syntax error (JSON/TOML)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line Line of the error (0 if unknown)
     * @param column Column of the error (0 if unknown)
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Document does not have the expected shape
 *
 * The path uses the document structure, for example
 * "projects[0].metrics[2].metric_type".
 */
class SchemaError : public ConfigError {
public:
    SchemaError(std::string path, std::string details)
        : ConfigError("Invalid definition at '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Import aborted because incoming projects already exist
 *
 * Contains every conflicting qualified name.
 */
class ProjectConflictError : public MaxifyError {
public:
    /**
     * @brief Construct with list of conflicting names
     * @param names Qualified names of the conflicting projects
     */
    explicit ProjectConflictError(std::vector<std::string> names)
        : MaxifyError(format_message(names))
        , names_(std::move(names))
    {}

    /**
     * @brief Get the conflicting qualified names
     */
    const std::vector<std::string>& names() const noexcept {
        return names_;
    }

private:
    std::vector<std::string> names_;

    static std::string format_message(const std::vector<std::string>& names) {
        std::ostringstream oss;
        oss << "Projects already exist: [";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << names[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief A write violates a model invariant
 */
class ModelError : public MaxifyError {
public:
    using MaxifyError::MaxifyError;
};

/**
 * @brief Value is not in the metric's set of allowed values
 */
class ValueNotAllowedError : public ModelError {
public:
    /**
     * @brief Construct with metric name and the rejected value
     * @param metric Name of the metric being written
     * @param value Display form of the rejected value
     */
    ValueNotAllowedError(std::string metric, std::string value)
        : ModelError("Value " + value + " is not allowed for metric '" + metric + "'")
        , metric_(std::move(metric))
        , value_(std::move(value))
    {}

    const std::string& metric() const noexcept { return metric_; }
    const std::string& value() const noexcept { return value_; }

private:
    std::string metric_;
    std::string value_;
};

/**
 * @brief Persistence failure or invalid use of the store
 */
class StoreError : public MaxifyError {
public:
    explicit StoreError(const std::string& message, int code = 0)
        : MaxifyError(message)
        , code_(code)
    {}

    /**
     * @brief SQLite result code, 0 when the error is not from SQLite
     */
    int code() const noexcept { return code_; }

private:
    int code_;
};

} // namespace maxify

#endif // MAXIFY_ERRORS_HPP
