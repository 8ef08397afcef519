//
// Created by gregorian-rayne on 2/10/26.
//

#include "pinch/cli/commands/command.hpp"
#include "pinch/version.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage(std::ostream& out) {
        out << "\n" << pinch::PROJECT_NAME << " - module dependency graphs and pinch points\n"
            << "\n"
            << "USAGE:\n"
            << "    " << pinch::PROJECT_SHORT_NAME << " <COMMAND> [OPTIONS]\n"
            << "\n"
            << "COMMANDS:\n";

        auto commands = pinch::cli::CommandRegistry::instance().list();
        std::ranges::sort(commands, {}, [](const pinch::cli::Command* cmd) { return cmd->name(); });
        for (const auto* cmd : commands) {
            std::string name(cmd->name());
            name.resize(std::max<std::size_t>(name.size(), 12), ' ');
            out << "    " << name << "  " << cmd->description() << "\n";
        }

        out << "\n"
            << "GLOBAL OPTIONS:\n"
            << "    -h, --help      Show this help message\n"
            << "    --version       Print the version and exit\n"
            << "\n"
            << "Run '" << pinch::PROJECT_SHORT_NAME << " <COMMAND> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    using namespace pinch::cli;

    try {
        if (argc < 2) {
            print_usage(std::cerr);
            return kExitUsage;
        }

        const std::string command_name = argv[1];
        if (command_name == "-h" || command_name == "--help" || command_name == "help") {
            print_usage(std::cout);
            return kExitSuccess;
        }
        if (command_name == "--version" || command_name == "version") {
            std::cout << pinch::PROJECT_SHORT_NAME << " " << pinch::VERSION_STRING << "\n";
            return kExitSuccess;
        }

        Command* command = CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "Unknown command: " << command_name << "\n";
            print_usage(std::cerr);
            return kExitUsage;
        }

        const std::vector<std::string> rest(argv + 2, argv + argc);
        const auto parsed = parse_arguments(rest, command->arguments());
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.error << "\n";
            std::cerr << "Run '" << pinch::PROJECT_SHORT_NAME << " " << command_name
                      << " --help' for usage.\n";
            return kExitUsage;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return kExitSuccess;
        }

        if (const auto problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "Error: " << problem << "\n";
            return kExitUsage;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitError;
    }
}
