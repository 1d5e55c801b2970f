/**
 * @file Merge.cpp
 * @brief Implementation of document and project merging
 */

#include "maxify/Merge.hpp"
#include "maxify/Log.hpp"
#include "maxify/Units.hpp"

namespace maxify {

Document deep_merge(const Document& base, const Document& override_val) {
    // If override is null, return base (null doesn't override)
    if (override_val.is_null()) {
        return base;
    }

    if (base.is_null()) {
        return override_val;
    }

    // Both are objects → recursive merge
    if (base.is_object() && override_val.is_object()) {
        Document result = base;

        for (auto it = override_val.begin(); it != override_val.end(); ++it) {
            const auto& key = it.key();
            if (result.contains(key)) {
                result[key] = deep_merge(result[key], it.value());
            } else {
                result[key] = it.value();
            }
        }

        return result;
    }

    // Non-object replaces everything
    return override_val;
}

Document deep_merge_all(const std::vector<Document>& sources) {
    if (sources.empty()) {
        return Document::object();
    }

    Document result = sources[0];
    for (size_t i = 1; i < sources.size(); ++i) {
        result = deep_merge(result, sources[i]);
    }

    return result;
}

std::vector<MergeWarning> merge_project(Project& existing, const Project& incoming) {
    std::vector<MergeWarning> warnings;
    const std::string project_name = existing.qualified_name();

    existing.set_description(incoming.description());

    for (const auto& metric : incoming.metrics()) {
        Metric* current = existing.find_metric(metric.name());

        if (!current) {
            existing.add_metric(metric);
            log_info("Merge '{}': added metric '{}'", project_name, metric.name());
            continue;
        }

        if (current->kind() == metric.kind()) {
            current->refresh_from(metric);
            log_info("Merge '{}': refreshed metric '{}'", project_name, metric.name());
            continue;
        }

        MergeWarning warning{
            project_name,
            metric.name(),
            current->kind(),
            metric.kind(),
            "Metric '" + metric.name() + "' of project '" + project_name + "' is "
                + value_kind_name(current->kind()) + " but the definition declares "
                + value_kind_name(metric.kind()) + "; kept the existing definition"};
        log_warn("{}", warning.message);
        warnings.push_back(std::move(warning));
    }

    return warnings;
}

} // namespace maxify
