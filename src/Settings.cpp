#include "maxify/Settings.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Loader.hpp"
#include "maxify/Merge.hpp"
#include "maxify/Util.hpp"

#include <cstdlib>
#include <vector>

namespace maxify {

namespace {
    const char* const kDataPath = "data_path";
    const char* const kLogLevel = "log_level";
    const char* const kImportStrategy = "import_strategy";

    Document environment_layer(const std::string& prefix, const Document& known) {
        // Prefix is normalized to end with '_'
        std::string normalized = prefix;
        while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
        normalized += "_";

        Document layer = Document::object();
        for (const auto& [name, value] : enumerate_environment()) {
            if (!starts_with(name, normalized)) continue;
            std::string key = to_lower(name.substr(normalized.size()));
            if (key.empty() || !known.contains(key)) continue;
            layer[key] = value;
        }
        return layer;
    }
}

Settings::Settings(Document data) : data_(std::move(data)) {
    validate();
}

Document Settings::defaults() {
    const char* home = std::getenv("HOME");
    std::string data_path = (home && *home) ? std::string(home) + "/.maxify.db" : "maxify.db";
    return Document{
        {kDataPath, data_path},
        {kLogLevel, "warn"},
        {kImportStrategy, "abort"},
    };
}

Settings Settings::load(const SettingsOptions& opts) {
    std::vector<Document> layers;

    // 1) defaults
    layers.push_back(defaults());

    // 2) file
    if (opts.file_path.has_value()) {
        Document file = load_document(*opts.file_path);
        if (!file.is_object()) {
            throw SchemaError("<root>", "settings must be an object, got " + type_name(file));
        }
        layers.push_back(std::move(file));
    }

    // 3) env
    if (opts.use_environment) {
        layers.push_back(environment_layer(opts.env_prefix, layers.front()));
    }

    // 4) overrides
    Document overrides = Document::object();
    for (const auto& [k, v] : opts.overrides) {
        overrides[k] = v;
    }
    layers.push_back(std::move(overrides));

    return Settings(deep_merge_all(layers));
}

const std::string& Settings::string_at(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        throw SchemaError(key, "missing required setting");
    }
    if (!it->is_string()) {
        throw SchemaError(key, "expected a string, got " + type_name(*it));
    }
    return it->get_ref<const std::string&>();
}

void Settings::validate() const {
    if (!data_.is_object()) {
        throw SchemaError("<root>", "settings must be an object, got " + type_name(data_));
    }
    if (string_at(kDataPath).empty()) {
        throw SchemaError(kDataPath, "must not be empty");
    }
    (void)parse_log_level(string_at(kLogLevel));
    (void)parse_import_strategy(string_at(kImportStrategy));
}

std::string Settings::data_path() const {
    return string_at(kDataPath);
}

LogLevel Settings::log_level() const {
    return parse_log_level(string_at(kLogLevel));
}

ImportStrategy Settings::import_strategy() const {
    return parse_import_strategy(string_at(kImportStrategy));
}

std::string Settings::to_json_string(int indent) const {
    return data_.dump(indent);
}

} // namespace maxify
