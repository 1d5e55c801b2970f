/**
 * @file Import.hpp
 * @brief Import of project definitions into a store
 *
 * Strategies for candidates whose qualified name already exists:
 * - Abort: fail with ProjectConflictError naming every conflict
 * - Overwrite: delete the existing project (tasks and data included) and
 *   save the candidate
 * - Merge: reconcile the candidate into the existing project
 *   (see merge_project())
 *
 * Candidates without a conflict are saved as new projects. The whole
 * import runs in one store transaction: on any error nothing is written.
 */

#ifndef MAXIFY_IMPORT_HPP
#define MAXIFY_IMPORT_HPP

#include "maxify/Merge.hpp"
#include "maxify/Project.hpp"
#include "maxify/Store.hpp"

#include <string>
#include <vector>

namespace maxify {

enum class ImportStrategy {
    Abort,
    Merge,
    Overwrite
};

/**
 * @brief Parse "abort", "merge" or "overwrite" (case-insensitive), also
 *        "replace" and the prompt letters "a", "m", "r"
 * @throws ConfigError for anything else
 */
ImportStrategy parse_import_strategy(const std::string& text);

std::string import_strategy_name(ImportStrategy strategy);

struct ImportResult {
    std::vector<Project> projects;      ///< projects as persisted
    std::vector<MergeWarning> warnings;
};

/**
 * @brief Persist candidate projects under a conflict strategy
 *
 * @throws ConfigError if two candidates share a qualified name
 * @throws ProjectConflictError under Abort when any candidate exists
 * @throws StoreError if a scope is already active or on SQLite failure
 */
ImportResult import_projects(ProjectStore& store,
                             std::vector<Project> candidates,
                             ImportStrategy strategy = ImportStrategy::Abort);

/**
 * @brief Load a definition file and import its projects
 */
ImportResult import_config(ProjectStore& store,
                           const std::string& path,
                           ImportStrategy strategy = ImportStrategy::Abort);

} // namespace maxify

#endif // MAXIFY_IMPORT_HPP
