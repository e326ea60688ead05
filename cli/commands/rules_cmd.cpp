//
// Created by gregorian-rayne on 10/12/26.
//

#include "gk/cli/commands/command.hpp"
#include "gk/cli/formatter.hpp"

#include "gk/analyzers/runner.hpp"
#include "gk/utils/string_utils.hpp"

#include <iostream>

namespace gk::cli
{
    namespace {

        std::string describe_languages(const std::vector<Language>& languages) {
            if (languages.empty()) {
                return "all";
            }
            std::vector<std::string> names;
            names.reserve(languages.size());
            for (const auto language : languages) {
                names.emplace_back(to_string(language));
            }
            return string_utils::join(names, ", ");
        }

    }  // namespace

    /**
     * Rules command - lists what every analyzer checks.
     */
    class RulesCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "rules";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List the rules of every registered analyzer";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"analyzer", 'a', "Only list rules of this analyzer", false, true, "", "NAME"},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            const auto runner = analyzers::make_default_runner();
            const auto filter = args.get("analyzer");
            bool matched = false;

            for (const auto* analyzer : runner.list_analyzers()) {
                if (filter && string_utils::to_lower(*filter) != string_utils::to_lower(analyzer->name())) {
                    continue;
                }
                matched = true;

                print_heading(std::cout, std::string(analyzer->name()) + ": " + std::string(analyzer->description()));

                Table table({
                    {"Rule", 0, false},
                    {"Severity", 0, false},
                    {"Languages", 0, false},
                    {"Message", 70, false},
                });
                for (const auto& rule : analyzer->rules()) {
                    table.add_row({
                        rule.id,
                        string_utils::to_upper(to_string(rule.severity)),
                        describe_languages(rule.languages),
                        rule.message
                    });
                }
                table.render(std::cout);
                std::cout << "\n";

                if (is_verbose()) {
                    for (const auto& rule : analyzer->rules()) {
                        std::cout << "  " << rule.id << " [" << colorize_severity(rule.severity) << "]: " << rule.pattern << "\n";
                    }
                    std::cout << "\n";
                }
            }

            if (filter && !matched) {
                print_error("Unknown analyzer: " + *filter);
                return 1;
            }
            return 0;
        }
    };

    namespace {
        struct RulesCommandRegistrar {
            RulesCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<RulesCommand>()
                );
            }
        } rules_registrar;
    }

}  // namespace gk::cli
