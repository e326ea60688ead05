//
// Created by gregorian-rayne on 10/12/26.
//

#include "gk/cli/commands/command.hpp"

#include "gk/core/config.hpp"
#include "gk/utils/json_utils.hpp"

#include <filesystem>

namespace gk::cli
{
    namespace fs = std::filesystem;

    /**
     * Init command - writes a starter settings file.
     */
    class InitCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "init";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Write a starter gatekeeper.toml";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gatekeeper init [OPTIONS] [path]\n"
                   "\n"
                   "Examples:\n"
                   "  gatekeeper init\n"
                   "  gatekeeper init --force ci/gatekeeper.toml";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"force", 0, "Overwrite an existing file", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Expected at most one path";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            const fs::path path = args.positional().empty()
                ? fs::path("gatekeeper.toml")
                : fs::path(args.positional().front());

            if (std::error_code ec; fs::exists(path, ec) && !args.get_flag("force")) {
                print_error(path.string() + " already exists (use --force to overwrite)");
                return 1;
            }

            const auto content = config::Settings::starter().to_string();
            if (auto written = json_utils::write_text(path, content); written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }

            print("Wrote " + path.string());
            return 0;
        }
    };

    namespace {
        struct InitCommandRegistrar {
            InitCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<InitCommand>()
                );
            }
        } init_registrar;
    }

}  // namespace gk::cli
