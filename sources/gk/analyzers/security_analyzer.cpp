//
// Created by gregorian-rayne on 10/6/26.
//

#include "gk/analyzers/security_analyzer.hpp"
#include "gk/diff/diff_parser.hpp"

namespace gk::analyzers
{
    namespace {

        using L = Language;

        std::vector<PatternRule> security_rule_table() {
            return {
                // Dynamic code execution
                {"DYNAMIC_EVAL", R"((^|[^\w.$])eval\s*\()", Severity::Error,
                 "Avoid `eval()` on changed lines; use safer parsing.",
                 {L::Python, L::JavaScript, L::TypeScript, L::Php, L::Ruby}, false, std::nullopt},
                {"PY_EXEC_USAGE", R"((^|[^\w.])exec\s*\()", Severity::Error,
                 "Avoid `exec()` on changed lines.", {L::Python}, false, std::nullopt},
                {"JS_FUNCTION_CONSTRUCTOR", R"(\bnew\s+Function\s*\()", Severity::Error,
                 "`new Function()` compiles code from strings at runtime.",
                 {L::JavaScript, L::TypeScript}, false, std::nullopt},

                // Unsafe deserialization
                {"PY_PICKLE_LOAD", R"(\bc?[Pp]ickle\.loads?\s*\()", Severity::Warning,
                 "pickle.loads/load can execute arbitrary code on untrusted input.",
                 {L::Python}, false, std::nullopt},
                {"PY_MARSHAL_LOAD", R"(\bmarshal\.loads?\s*\()", Severity::Warning,
                 "marshal.loads/load is not safe for untrusted input.", {L::Python}, false, std::nullopt},
                {"PY_YAML_LOAD", R"(\byaml\.load\s*\()", Severity::Warning,
                 "Use yaml.safe_load instead of yaml.load.", {L::Python}, false,
                 std::string(R"(SafeLoader|safe_load)")},
                {"PHP_UNSERIALIZE", R"(\bunserialize\s*\()", Severity::Warning,
                 "unserialize() on untrusted input enables object injection.", {L::Php}, false, std::nullopt},
                {"RUBY_MARSHAL_LOAD", R"(\bMarshal\.load\b)", Severity::Warning,
                 "Marshal.load can instantiate arbitrary objects from untrusted input.",
                 {L::Ruby}, false, std::nullopt},
                {"JAVA_OBJECT_INPUT_STREAM", R"(\bObjectInputStream\s*\()", Severity::Warning,
                 "Java deserialization of untrusted streams enables gadget-chain attacks.",
                 {L::Java, L::Kotlin, L::Scala}, false, std::nullopt},
                {"CSHARP_BINARY_FORMATTER", R"(\bBinaryFormatter\b)", Severity::Warning,
                 "BinaryFormatter is insecure for untrusted data.", {L::CSharp}, false, std::nullopt},

                // Secrets
                {"HARDCODED_SECRET",
                 R"((password|passwd|pwd|secret|api[_-]?key|access[_-]?token|auth[_-]?token|private[_-]?key)\w*["']?\s*(:=|=|:)\s*["'][^"'\s]{8,}["'])",
                 Severity::Error,
                 "Possible hard-coded secret; load credentials from the environment or a secret store.",
                 {}, true, std::nullopt},
                {"AWS_ACCESS_KEY", R"(\b(AKIA|ASIA)[0-9A-Z]{16}\b)", Severity::Error,
                 "AWS access key id committed in source.", {}, false, std::nullopt},
                {"PRIVATE_KEY_BLOCK", R"(-----BEGIN ([A-Z]+ )?PRIVATE KEY-----)", Severity::Error,
                 "Private key material committed in source.", {}, false, std::nullopt},

                // Shell injection
                {"PY_SUBPROCESS_SHELL_TRUE", R"(\bsubprocess\.\w+\([^)]*shell\s*=\s*True)", Severity::Error,
                 "subprocess with shell=True on changed line may enable command injection.",
                 {L::Python}, false, std::nullopt},
                {"PY_OS_SYSTEM_CONCAT", R"(\bos\.(system|popen)\s*\(\s*(f["']|[^)]*(\+|%|\.format\()))", Severity::Error,
                 "Shell command built from string formatting may enable command injection.",
                 {L::Python}, false, std::nullopt},
                {"JS_CHILD_PROCESS_CONCAT", R"((^|[^\w.]|child_process\.)exec(Sync)?\s*\(\s*([^)]*\+|`[^`]*\$\{))",
                 Severity::Error,
                 "child_process command built from string concatenation may enable command injection.",
                 {L::JavaScript, L::TypeScript}, false, std::nullopt},
                {"JAVA_RUNTIME_EXEC_CONCAT", R"(\bRuntime\.getRuntime\(\)\.exec\s*\([^)]*\+)", Severity::Error,
                 "Runtime.exec with a concatenated command may enable command injection.",
                 {L::Java, L::Kotlin, L::Scala}, false, std::nullopt},
                {"PHP_SHELL_EXEC_VAR", R"(\b(shell_exec|system|passthru|exec|popen|proc_open)\s*\([^)]*\$)", Severity::Error,
                 "Shell command built from a PHP variable may enable command injection.",
                 {L::Php}, false, std::nullopt},
                {"C_SYSTEM_CONCAT", R"((^|[^\w.])(std::)?(system|popen)\s*\([^)]*\+)", Severity::Warning,
                 "system()/popen() with a concatenated command may enable command injection.",
                 {L::C, L::Cpp}, false, std::nullopt},
                {"SHELL_EVAL_VAR", R"((^|[;&|]\s*)eval\s+[^;&|]*\$)", Severity::Warning,
                 "eval of expanded variables in shell scripts may enable command injection.",
                 {L::Shell}, false, std::nullopt},
            };
        }

    }  // namespace

    SecurityPatternAnalyzer::SecurityPatternAnalyzer()
        : rules_(compile_rules(security_rule_table()))
    {}

    bool SecurityPatternAnalyzer::applies_to(const std::string_view path) const {
        return diff::is_source_file(path);
    }

    std::vector<PatternRule> SecurityPatternAnalyzer::rules() const {
        std::vector<PatternRule> result;
        result.reserve(rules_.size());
        for (const auto& rule : rules_) {
            result.push_back(rule.rule());
        }
        return result;
    }

    Result<std::vector<Finding>, Error> SecurityPatternAnalyzer::analyze(
        const std::string_view path,
        const ChangedLineSet& lines,
        const config::ReviewLimits& limits
    ) const {
        (void)limits;

        if (!applies_to(path)) {
            return Result<std::vector<Finding>, Error>::success({});
        }

        return Result<std::vector<Finding>, Error>::success(
            apply_rules(rules_, path, diff::detect_language(path), lines, name())
        );
    }

}  // namespace gk::analyzers
