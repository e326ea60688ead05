//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef GK_SECURITY_ANALYZER_HPP
#define GK_SECURITY_ANALYZER_HPP

/**
 * @file security_analyzer.hpp
 * @brief Dangerous call patterns in added source lines.
 */

#include "gk/analyzers/analyzer.hpp"

namespace gk::analyzers {

    /**
     * Scans added lines of recognized source files for:
     * - Dynamic code execution (eval, exec, Function constructor)
     * - Unsafe deserialization (pickle, yaml.load, unserialize, ...)
     * - Hard-coded secret-like tokens
     * - Shell commands assembled by string concatenation
     *
     * Files without a recognized source extension are skipped.
     */
    class SecurityPatternAnalyzer : public IAnalyzer {
    public:
        SecurityPatternAnalyzer();

        [[nodiscard]] std::string_view name() const noexcept override {
            return "SecurityPattern";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Dynamic execution, unsafe deserialization, secrets and shell injection";
        }

        [[nodiscard]] bool applies_to(std::string_view path) const override;

        [[nodiscard]] std::vector<PatternRule> rules() const override;

        [[nodiscard]] Result<std::vector<Finding>, Error> analyze(
            std::string_view path,
            const ChangedLineSet& lines,
            const config::ReviewLimits& limits
        ) const override;

    private:
        std::vector<CompiledRule> rules_;
    };

}  // namespace gk::analyzers

#endif //GK_SECURITY_ANALYZER_HPP
