#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "maxify/Commands.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Log.hpp"
#include "maxify/Settings.hpp"
#include "maxify/Store.hpp"

using namespace maxify;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("maxify", "Track per-task metrics for software projects");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("d,data", "Path to the project store (SQLite file)", cxxopts::value<std::string>())
            ("s,settings", "Path to a JSON/TOML settings file", cxxopts::value<std::string>())
            ("l,log-level", "debug | info | warn | error | off", cxxopts::value<std::string>())
            ("strategy", "Import conflict strategy: abort | merge | overwrite", cxxopts::value<std::string>())
            ("details", "Show every metric total for each task")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: projects | import FILE [--strategy S] | metrics PROJECT"
                         " | tasks PROJECT [PATTERN] [--details]"
                         " | record PROJECT TASK METRIC VALUE [METRIC VALUE ...]\n";
            return 0;
        }

        // Settings: defaults -> settings file -> env -> flags
        SettingsOptions load;
        if (result.count("settings")) load.file_path = result["settings"].as<std::string>();
        if (result.count("data")) load.overrides["data_path"] = result["data"].as<std::string>();
        if (result.count("log-level")) load.overrides["log_level"] = result["log-level"].as<std::string>();
        if (result.count("strategy")) load.overrides["import_strategy"] = result["strategy"].as<std::string>();

        Settings settings = Settings::load(load);
        set_log_level(settings.log_level());

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw ConfigError("insufficient arguments for command '" + cmd + "'");
            }
        };

        ProjectStore store(settings.data_path());

        if (cmd == "projects") {
            return cmd_projects(store, std::cout);
        }

        if (cmd == "import") {
            expect_args(2);
            return cmd_import(store, cmdv[1], settings.import_strategy(), std::cout);
        }

        if (cmd == "metrics") {
            expect_args(2);
            return cmd_metrics(store, cmdv[1], std::cout);
        }

        if (cmd == "tasks") {
            expect_args(2);
            const std::string pattern = cmdv.size() > 2 ? cmdv[2] : "*";
            return cmd_tasks(store, cmdv[1], pattern, result.count("details") > 0, std::cout);
        }

        if (cmd == "record") {
            expect_args(5);
            if ((cmdv.size() - 3) % 2 != 0) {
                throw ConfigError("Missing value for metric '" + cmdv.back() + "'");
            }
            std::vector<std::pair<std::string, std::string>> values;
            for (size_t i = 3; i + 1 < cmdv.size(); i += 2) {
                values.emplace_back(cmdv[i], cmdv[i + 1]);
            }
            return cmd_record(store, cmdv[1], cmdv[2], values, std::cout);
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ProjectConflictError& conflict) {
        std::cerr << "Error: " << conflict.what() << "\n"
                  << "Re-run with --strategy merge or --strategy overwrite to resolve.\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
