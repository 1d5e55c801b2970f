/**
 * @file Commands.hpp
 * @brief Command handlers behind the maxify command-line tool
 *
 * Each handler writes its report to the given stream and returns the
 * process exit status. Failures are reported by exception; the caller
 * decides how to present them.
 */

#ifndef MAXIFY_COMMANDS_HPP
#define MAXIFY_COMMANDS_HPP

#include "maxify/Import.hpp"
#include "maxify/Store.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace maxify {

/**
 * @brief List projects grouped by organization ("default" for none)
 */
int cmd_projects(const ProjectStore& store, std::ostream& out);

/**
 * @brief Import a definition file and list the imported projects
 * @throws ProjectConflictError under ImportStrategy::Abort
 */
int cmd_import(ProjectStore& store, const std::string& path,
               ImportStrategy strategy, std::ostream& out);

/**
 * @brief List a project's metric definitions
 * @throws ModelError if the project does not exist
 */
int cmd_metrics(const ProjectStore& store, const std::string& project, std::ostream& out);

/**
 * @brief List tasks matching a glob, optionally with every metric total
 * @throws ModelError if the project does not exist
 */
int cmd_tasks(const ProjectStore& store, const std::string& project,
              const std::string& pattern, bool details, std::ostream& out);

/**
 * @brief Record one or more (metric, value text) pairs on a task and save
 *
 * Either every value is recorded and the project saved, or nothing is.
 *
 * @throws ModelError for an unknown project or metric, or a rejected value
 * @throws ParsingError if a value does not parse
 */
int cmd_record(ProjectStore& store, const std::string& project, const std::string& task,
               const std::vector<std::pair<std::string, std::string>>& values,
               std::ostream& out);

} // namespace maxify

#endif // MAXIFY_COMMANDS_HPP
