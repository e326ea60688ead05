//
// Created by gregorian-rayne on 10/12/26.
//

#include "gk/cli/commands/command.hpp"
#include "gk/cli/formatter.hpp"

#include "gk/diff/diff_parser.hpp"
#include "gk/utils/json_utils.hpp"

#include <iostream>
#include <optional>

namespace gk::cli
{
    /**
     * Diff command - shows how a unified diff patch is interpreted.
     */
    class DiffCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "diff";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Parse a unified diff patch and list its hunks and changed lines";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gatekeeper diff [OPTIONS] <patch-file>\n"
                   "\n"
                   "Examples:\n"
                   "  git diff HEAD~1 -- app.py > app.patch && gatekeeper diff app.patch\n"
                   "  gatekeeper diff --hunks-only app.patch";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"hunks-only", 0, "Only list hunk headers", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one patch file. Use 'gatekeeper diff <patch-file>'";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            const std::string& path = args.positional().front();
            auto text = json_utils::read_text(path);
            if (text.is_err()) {
                print_error(text.error().to_string());
                return 1;
            }

            if (diff::is_binary_patch(text.value())) {
                print("Binary patch: no changed lines.");
                return 0;
            }

            auto hunks = diff::parse(text.value());
            if (hunks.is_err()) {
                print_error(hunks.error().with_context(path).to_string());
                return 1;
            }

            Table hunk_table({
                {"Hunk", 0, true},
                {"Old start", 0, true},
                {"Old count", 0, true},
                {"New start", 0, true},
                {"New count", 0, true},
                {"Added", 0, true},
                {"Section", 0, false},
            });

            std::size_t index = 1;
            for (const auto& hunk : hunks.value()) {
                std::size_t added = 0;
                for (const auto& line : hunk.lines) {
                    if (line.kind == DiffLineKind::Added) {
                        ++added;
                    }
                }
                hunk_table.add_row({
                    std::to_string(index++),
                    std::to_string(hunk.old_start),
                    std::to_string(hunk.old_count),
                    std::to_string(hunk.new_start),
                    std::to_string(hunk.new_count),
                    std::to_string(added),
                    format_path(hunk.section, 40)
                });
            }

            print_heading(std::cout, "Hunks");
            hunk_table.render(std::cout);

            if (args.get_flag("hunks-only")) {
                return 0;
            }

            const ChangedLineSet lines = diff::collect_added_lines(hunks.value());

            Table line_table({
                {"Line", 0, true},
                {"Content", 100, false},
            });
            std::optional<std::size_t> previous;
            for (const auto& line : lines) {
                // Break between runs of consecutive line numbers.
                if (previous && line.number != *previous + 1) {
                    line_table.add_separator();
                }
                previous = line.number;
                line_table.add_row({std::to_string(line.number), line.content});
            }

            std::cout << "\n";
            print_heading(std::cout, "Changed lines (" + format_count(lines.size()) + ")");
            line_table.render(std::cout);
            return 0;
        }
    };

    namespace {
        struct DiffCommandRegistrar {
            DiffCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<DiffCommand>()
                );
            }
        } diff_registrar;
    }

}  // namespace gk::cli
