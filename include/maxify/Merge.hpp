/**
 * @file Merge.hpp
 * @brief Merging of settings layers and of project definitions
 *
 * Two kinds of merge live here:
 * - deep_merge() combines decoded documents (settings layers)
 * - merge_project() reconciles an incoming project definition into a
 *   persisted project without losing recorded data
 */

#ifndef MAXIFY_MERGE_HPP
#define MAXIFY_MERGE_HPP

#include "maxify/Project.hpp"
#include "maxify/Value.hpp"

#include <string>
#include <vector>

namespace maxify {

/**
 * @brief Deep merge two documents
 *
 * Merging rules:
 * - Both objects: Recursive merge (keys from both are combined)
 * - Otherwise the override replaces the base; a null override keeps base
 *
 * ```cpp
 * Document base = {{"log", {{"level", "warn"}, {"file", "a"}}}};
 * Document over = {{"log", {{"level", "debug"}}}};
 * auto result = deep_merge(base, over);
 * // Result: {"log": {"file": "a", "level": "debug"}}
 * ```
 *
 * @param base Base document (lower precedence)
 * @param override_val Override document (higher precedence)
 * @return Merged result
 */
Document deep_merge(const Document& base, const Document& override_val);

/**
 * @brief Deep merge multiple documents in precedence order (lowest first)
 */
Document deep_merge_all(const std::vector<Document>& sources);

/**
 * @brief A metric definition the merge refused to apply
 */
struct MergeWarning {
    std::string project;        ///< qualified name
    std::string metric;
    ValueKind existing_kind;
    ValueKind incoming_kind;
    std::string message;
};

/**
 * @brief Reconcile an incoming definition into an existing project
 *
 * - the description is replaced by the incoming one
 * - metrics not present on the existing project are added
 * - metrics with the same name and kind get the incoming description,
 *   allowed values and default value
 * - metrics with the same name and a different kind are left untouched
 *   and reported as warnings
 *
 * Tasks and data points of the existing project are never touched.
 *
 * @return One warning per skipped metric
 */
std::vector<MergeWarning> merge_project(Project& existing, const Project& incoming);

} // namespace maxify

#endif // MAXIFY_MERGE_HPP
