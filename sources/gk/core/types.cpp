//
// Created by gregorian-rayne on 10/3/26.
//

#include "gk/types.hpp"
#include "gk/utils/string_utils.hpp"

namespace gk {

    const char* to_string(const Language language) noexcept {
        switch (language) {
            case Language::Text:       return "text";
            case Language::C:          return "c";
            case Language::Cpp:        return "cpp";
            case Language::CSharp:     return "csharp";
            case Language::Go:         return "go";
            case Language::Java:       return "java";
            case Language::JavaScript: return "javascript";
            case Language::Kotlin:     return "kotlin";
            case Language::Php:        return "php";
            case Language::Python:     return "python";
            case Language::Ruby:       return "ruby";
            case Language::Rust:       return "rust";
            case Language::Scala:      return "scala";
            case Language::Shell:      return "shell";
            case Language::Sql:        return "sql";
            case Language::Swift:      return "swift";
            case Language::TypeScript: return "typescript";
        }
        return "text";
    }

    std::optional<Severity> severity_from_string(const std::string_view text) {
        const auto lower = string_utils::to_lower(string_utils::trim(text));
        if (lower == "info") return Severity::Info;
        if (lower == "warning") return Severity::Warning;
        if (lower == "error") return Severity::Error;
        return std::nullopt;
    }

    std::optional<ChangeKind> change_kind_from_string(const std::string_view text) {
        const auto lower = string_utils::to_lower(string_utils::trim(text));
        if (lower == "added") return ChangeKind::Added;
        if (lower == "removed") return ChangeKind::Removed;
        if (lower == "renamed") return ChangeKind::Renamed;
        if (lower == "modified" || lower == "copied" || lower == "changed" || lower == "unchanged") {
            return ChangeKind::Modified;
        }
        return std::nullopt;
    }

}  // namespace gk
