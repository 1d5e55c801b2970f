#ifndef MAXIFY_SETTINGS_HPP
#define MAXIFY_SETTINGS_HPP

#include "maxify/Import.hpp"
#include "maxify/Log.hpp"
#include "maxify/Value.hpp"

#include <map>
#include <optional>
#include <string>

namespace maxify {

/**
 * @brief Options for loading application settings from multiple sources.
 */
struct SettingsOptions {
    std::optional<std::string> file_path;       // .json or .toml settings file
    bool use_environment = true;                // read MAXIFY_<KEY> variables
    std::string env_prefix = "MAXIFY";
    std::map<std::string, Document> overrides;  // final precedence
};

/**
 * @brief Application settings (not project definitions).
 *
 * Keys:
 * - data_path: SQLite store file
 * - log_level: debug | info | warn | error | off
 * - import_strategy: abort | merge | overwrite
 */
class Settings {
public:
    /**
     * @brief Wrap a settings document
     * @throws ConfigError if a known key has an invalid value
     */
    explicit Settings(Document data);

    // Load using the precedence: defaults -> file -> env -> overrides
    static Settings load(const SettingsOptions& opts = SettingsOptions());

    // Built-in defaults; data_path is $HOME/.maxify.db or maxify.db
    static Document defaults();

    const Document& data() const noexcept { return data_; }

    std::string data_path() const;
    LogLevel log_level() const;
    ImportStrategy import_strategy() const;

    std::string to_json_string(int indent = 2) const;

private:
    Document data_;

    const std::string& string_at(const std::string& key) const;
    void validate() const;
};

} // namespace maxify

#endif // MAXIFY_SETTINGS_HPP
