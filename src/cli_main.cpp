#include <cxxopts.hpp>
#include <iostream>
#include <optional>
#include "reconfy/Errors.hpp"
#include "reconfy/Loader.hpp"
#include "reconfy/Settings.hpp"
#include "reconfy/Updater.hpp"

using namespace reconfy;

namespace {

void print_routes(std::ostream& os, const char* label, const std::vector<Route>& routes, char sep) {
    for (const auto& r : routes) {
        os << "  " << label << " " << r.join(sep) << "\n";
    }
}

void print_report(std::ostream& os, const UpdateReport& report, char sep) {
    os << "user version:     " << report.user_version.value_or("(none)") << "\n";
    os << "defaults version: " << report.defaults_version.value_or("(none)") << "\n";
    for (const auto& step : report.relocations) {
        os << "  moved   " << step.from.join(sep) << " -> " << step.to.join(sep)
           << " (" << step.version_id << ")\n";
    }
    print_routes(os, "ignored", report.ignored, sep);
    print_routes(os, "added  ", report.merge.added, sep);
    print_routes(os, "removed", report.merge.removed, sep);
    print_routes(os, "replaced", report.merge.replaced, sep);
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("reconfy", "Migrate a configuration document to the schema of its defaults");
        options.positional_help("COMMAND");

        options.add_options()
            ("u,user", "Path to the user document (JSON/TOML/YAML)", cxxopts::value<std::string>())
            ("d,defaults", "Path to the defaults document", cxxopts::value<std::string>())
            ("r,rules", "Path to the migration rules file", cxxopts::value<std::string>())
            ("o,out", "Write the migrated document here instead of over --user", cxxopts::value<std::string>())
            ("dry-run", "Print the migrated document instead of saving it")
            ("v,verbose", "Print what the migration did to stderr")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: migrate | check | dump\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        if (!result.count("user")) {
            std::cerr << "Error: --user is required\n";
            return 1;
        }
        const std::string user_path = result["user"].as<std::string>();
        Node user = load_document(user_path);

        // DUMP
        if (cmd == "dump") {
            std::cout << dump_json(user, 2) << "\n";
            return 0;
        }

        if (!result.count("defaults")) {
            std::cerr << "Error: --defaults is required for `" << cmd << "`\n";
            return 1;
        }
        const Node defaults = load_document(result["defaults"].as<std::string>());

        UpdaterSettings settings;
        if (result.count("rules")) {
            settings = load_settings_file(result["rules"].as<std::string>());
        }

        // CHECK
        if (cmd == "check") {
            const VersionCheck check = check_versions(user, defaults, settings);
            std::cout << "user:     " << check.user_version.value_or("(none)") << "\n";
            std::cout << "defaults: " << check.defaults_version << "\n";
            std::cout << status_name(check.status) << "\n";
            return check_exit_code(check.status);
        }

        // MIGRATE
        if (cmd == "migrate") {
            const bool dry_run = result.count("dry-run") > 0;
            const std::string out_path = result.count("out") ? result["out"].as<std::string>() : user_path;

            // The CLI always persists unless asked not to
            settings.auto_save = !dry_run;
            SaveHook save = [&out_path](const Node& doc) { save_document(out_path, doc); };

            UpdateReport report = update(user, defaults, settings, save);

            if (result.count("verbose")) {
                print_report(std::cerr, report, settings.separator);
            }
            if (dry_run) {
                std::cout << dump_json(user, 2) << "\n";
            }
            std::ostream& status = dry_run ? std::cerr : std::cout;
            status << outcome_name(report.outcome);
            if (report.saved) status << " (wrote " << out_path << ")";
            status << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const DowngradeNotAllowed& dna) {
        std::cerr << "Error: " << dna.what() << "\n";
        return check_exit_code(VersionStatus::Ahead);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
