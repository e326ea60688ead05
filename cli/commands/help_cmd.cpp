//
// Created by gregorian-rayne on 10/12/26.
//

#include "gk/cli/commands/command.hpp"
#include "gk/version.hpp"

#include <iomanip>
#include <iostream>

namespace gk::cli
{
    void print_overview() {
        std::cout << PROJECT_NAME << " " << VERSION_STRING
                  << " - static review of pull request changes\n\n";
        std::cout << "Usage: " << PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* command : CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(10) << command->name()
                      << command->description() << "\n";
        }
        std::cout << "\nRun '" << PROJECT_SHORT_NAME << " help <command>' for command options.\n";
    }

    /**
     * Help command - lists commands or shows one command's options.
     */
    class HelpCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "help";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show available commands or help for one command";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.positional().empty()) {
                print_overview();
                return 0;
            }

            const auto& target = args.positional().front();
            const Command* command = CommandRegistry::instance().find(target);
            if (command == nullptr) {
                print_error("Unknown command '" + target + "'");
                return 1;
            }
            command->print_help();
            return 0;
        }
    };

    /**
     * Version command.
     */
    class VersionCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "version";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Print the version";
        }

        [[nodiscard]] int execute(const ParsedArgs&) override {
            std::cout << PROJECT_SHORT_NAME << " " << VERSION_STRING << "\n";
            return 0;
        }
    };

    namespace {
        struct HelpCommandRegistrar {
            HelpCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<HelpCommand>());
                CommandRegistry::instance().register_command(std::make_unique<VersionCommand>());
            }
        } help_registrar;
    }

}  // namespace gk::cli
