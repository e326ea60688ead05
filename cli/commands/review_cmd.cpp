//
// Created by gregorian-rayne on 10/12/26.
//

#include "gk/cli/commands/command.hpp"
#include "gk/cli/formatter.hpp"

#include "gk/core/config.hpp"
#include "gk/io/payload.hpp"
#include "gk/pipeline.hpp"
#include "gk/utils/json_utils.hpp"

#include <filesystem>
#include <iostream>

namespace gk::cli
{
    namespace fs = std::filesystem;

    namespace {

        constexpr auto kDefaultConfigFile = "gatekeeper.toml";

        Verbosity verbosity_for(const config::LogLevel level) {
            switch (level) {
                case config::LogLevel::Quiet:   return Verbosity::Quiet;
                case config::LogLevel::Info:    return Verbosity::Normal;
                case config::LogLevel::Verbose: return Verbosity::Verbose;
                case config::LogLevel::Debug:   return Verbosity::Debug;
            }
            return Verbosity::Normal;
        }

        /**
         * True when the review meets the --fail-on threshold.
         */
        bool meets_threshold(const Review& review, const std::string& fail_on) {
            if (fail_on == "error") {
                return review.severity_counts.error > 0;
            }
            if (fail_on == "warning") {
                return review.severity_counts.error + review.severity_counts.warning > 0;
            }
            return false;
        }

    }  // namespace

    /**
     * Review command - runs the analyzers over a pull request payload.
     */
    class ReviewCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "review";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Review the changed lines of a pull request payload";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: gatekeeper review [OPTIONS] <payload.json>\n"
                   "\n"
                   "The payload is either {\"pull_request_id\": ..., \"files\": [...]}\n"
                   "or the file list returned by GitHub's pull request files endpoint.\n"
                   "\n"
                   "Examples:\n"
                   "  gatekeeper review pr.json\n"
                   "  gatekeeper review --max-line-length 100 --max-inline-comments 20 pr.json\n"
                   "  gatekeeper review --format json --output review.json --fail-on error pr.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "Settings file (default: ./gatekeeper.toml if present)", false, true, "", "FILE"},
                {"max-line-length", 0, "Maximum line length for the lint analyzer", false, true, "", "N"},
                {"max-inline-comments", 0, "Maximum inline comments in the review (0 disables)", false, true, "", "N"},
                {"format", 'f', "Output format (markdown, json)", false, true, "", "FORMAT"},
                {"output", 'o', "Write the review to FILE instead of stdout", false, true, "", "FILE"},
                {"threads", 'j', "Worker threads (0 = all cores, 1 = sequential)", false, true, "", "N"},
                {"fail-on", 0, "Exit with 2 when findings reach this severity (error, warning, never)", false, true, "never", "LEVEL"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one payload file. Use 'gatekeeper review <payload.json>'";
            }
            if (const auto fail_on = args.get_or("fail-on", "never");
                fail_on != "error" && fail_on != "warning" && fail_on != "never") {
                return "Invalid --fail-on value '" + fail_on + "' (expected error, warning or never)";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            auto settings_result = load_settings(args);
            if (settings_result.is_err()) {
                print_error(settings_result.error().to_string());
                return 1;
            }
            config::Settings settings = std::move(settings_result).value();

            set_verbosity(verbosity_for(settings.logging.level));
            apply_common_flags(args);
            print_debug("Effective settings:\n" + settings.to_string());

            const std::string payload_path = args.positional().front();
            auto pull_request = io::load_pull_request(payload_path);
            if (pull_request.is_err()) {
                print_error(pull_request.error().to_string());
                return 1;
            }
            print_verbose("Loaded " + std::to_string(pull_request.value().files.size()) +
                          " file(s) from " + payload_path);

            ReviewPipeline pipeline(analyzers::make_default_runner(), PipelineOptions{settings.runtime.threads});
            auto outcome_result = pipeline.run(pull_request.value(), settings.review);
            if (outcome_result.is_err()) {
                print_error(outcome_result.error().to_string());
                return 1;
            }
            const PipelineOutcome& outcome = outcome_result.value();

            for (const auto& diagnostic : outcome.diagnostics) {
                print_warning(describe(diagnostic));
            }
            print_verbose("Analyzed " + format_count(outcome.files_analyzed) + " file(s), " +
                          format_count(outcome.changed_lines_analyzed) + " changed line(s), " +
                          format_count(outcome.review.total_findings) + " finding(s)");

            std::string rendered;
            if (settings.output.format == config::OutputFormat::Json) {
                auto document = io::review_to_json(outcome.review);
                document["diagnostics"] = io::diagnostics_to_json(outcome.diagnostics);
                rendered = json_utils::to_string(document, 2) + "\n";
            } else {
                rendered = outcome.review.summary_markdown;
            }

            if (auto output_file = args.get("output")) {
                if (auto written = json_utils::write_text(*output_file, rendered); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print("Review written to " + *output_file);
            } else {
                std::cout << rendered;
            }

            if (meets_threshold(outcome.review, args.get_or("fail-on", "never"))) {
                print_verbose("Findings reached the --fail-on threshold");
                return 2;
            }
            return 0;
        }

    private:
        /**
         * File, then environment, then command-line flags.
         */
        Result<config::Settings, Error> load_settings(const ParsedArgs& args) const {
            config::Settings settings;

            if (auto path = args.get("config")) {
                auto loaded = config::Settings::load_from_file(*path);
                if (loaded.is_err()) {
                    return loaded;
                }
                settings = std::move(loaded).value();
            } else if (std::error_code ec; fs::exists(kDefaultConfigFile, ec)) {
                auto loaded = config::Settings::load_from_file(kDefaultConfigFile);
                if (loaded.is_err()) {
                    return loaded;
                }
                settings = std::move(loaded).value();
            }

            if (auto env = settings.apply_environment(); env.is_err()) {
                return Result<config::Settings, Error>::failure(env.error());
            }

            if (auto value = args.get("max-line-length")) {
                auto parsed = config::parse_integer(*value, "--max-line-length");
                if (parsed.is_err()) {
                    return Result<config::Settings, Error>::failure(parsed.error());
                }
                settings.review.max_line_length = parsed.value();
            }

            if (auto value = args.get("max-inline-comments")) {
                auto parsed = config::parse_integer(*value, "--max-inline-comments");
                if (parsed.is_err()) {
                    return Result<config::Settings, Error>::failure(parsed.error());
                }
                settings.review.max_inline_comments = parsed.value();
            }

            if (auto value = args.get("threads")) {
                auto parsed = config::parse_integer(*value, "--threads");
                if (parsed.is_err()) {
                    return Result<config::Settings, Error>::failure(parsed.error());
                }
                if (parsed.value() < 0) {
                    return Result<config::Settings, Error>::failure(
                        Error::config_error("--threads must not be negative", *value));
                }
                settings.runtime.threads = static_cast<std::size_t>(parsed.value());
            }

            if (auto value = args.get("format")) {
                const auto format = config::output_format_from_string(*value);
                if (!format) {
                    return Result<config::Settings, Error>::failure(
                        Error::config_error("Unknown output format", *value));
                }
                settings.output.format = *format;
            }

            return Result<config::Settings, Error>::success(std::move(settings));
        }
    };

    namespace {
        struct ReviewCommandRegistrar {
            ReviewCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ReviewCommand>()
                );
            }
        } review_registrar;
    }

}  // namespace gk::cli
