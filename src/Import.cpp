/**
 * @file Import.cpp
 * @brief Implementation of the import strategies
 */

#include "maxify/Import.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Loader.hpp"
#include "maxify/Log.hpp"
#include "maxify/Util.hpp"

#include <optional>
#include <set>

namespace maxify {

ImportStrategy parse_import_strategy(const std::string& text) {
    const std::string lower = to_lower(trim(text));
    if (lower == "abort" || lower == "a") return ImportStrategy::Abort;
    if (lower == "merge" || lower == "m") return ImportStrategy::Merge;
    if (lower == "overwrite" || lower == "replace" || lower == "r") return ImportStrategy::Overwrite;
    throw ConfigError("Unknown import strategy: '" + text + "' (expected abort, merge or overwrite)");
}

std::string import_strategy_name(ImportStrategy strategy) {
    switch (strategy) {
        case ImportStrategy::Abort: return "abort";
        case ImportStrategy::Merge: return "merge";
        case ImportStrategy::Overwrite: return "overwrite";
    }
    return "unknown";
}

ImportResult import_projects(ProjectStore& store,
                             std::vector<Project> candidates,
                             ImportStrategy strategy) {
    log_info("Importing {} project(s) with strategy '{}'",
             candidates.size(), import_strategy_name(strategy));

    return store.transaction([&]() {
        ImportResult result;

        std::set<std::string> seen;
        std::vector<std::string> conflicts;
        for (const auto& candidate : candidates) {
            const std::string qn = candidate.qualified_name();
            if (!seen.insert(to_lower(qn)).second) {
                throw ConfigError("Project '" + qn + "' is defined more than once");
            }
            if (store.contains(qn)) {
                conflicts.push_back(qn);
            }
        }

        if (!conflicts.empty()) {
            log_info("{} project(s) already exist", conflicts.size());
            if (strategy == ImportStrategy::Abort) {
                throw ProjectConflictError(conflicts);
            }
        }

        for (auto& candidate : candidates) {
            std::optional<Project> existing = store.get(candidate.qualified_name());

            if (!existing) {
                store.save(candidate);
                log_info("Created project '{}'", candidate.qualified_name());
                result.projects.push_back(std::move(candidate));
                continue;
            }

            if (strategy == ImportStrategy::Overwrite) {
                store.remove(*existing);
                store.save(candidate);
                log_info("Replaced project '{}'", candidate.qualified_name());
                result.projects.push_back(std::move(candidate));
                continue;
            }

            auto warnings = merge_project(*existing, candidate);
            store.save(*existing);
            log_info("Merged project '{}'", existing->qualified_name());
            result.warnings.insert(result.warnings.end(), warnings.begin(), warnings.end());
            result.projects.push_back(std::move(*existing));
        }

        return result;
    });
}

ImportResult import_config(ProjectStore& store, const std::string& path, ImportStrategy strategy) {
    return import_projects(store, load_projects(path), strategy);
}

} // namespace maxify
