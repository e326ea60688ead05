//
// Created by gregorian-rayne on 10/3/26.
//

#include "gk/diff/diff_parser.hpp"
#include "gk/utils/string_utils.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <optional>
#include <regex>
#include <unordered_map>

namespace gk::diff
{
    namespace {

        using string_utils::starts_with;

        const std::regex& hunk_header_regex() {
            static const std::regex pattern(
                R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@ ?(.*)$)"
            );
            return pattern;
        }

        std::optional<std::size_t> to_size(const std::ssub_match& match, const std::size_t fallback) {
            if (!match.matched) {
                return fallback;
            }

            std::size_t value = 0;
            const auto* first = &*match.first;
            const auto* last = first + match.length();
            if (auto [ptr, ec] = std::from_chars(first, last, value); ec != std::errc{} || ptr != last) {
                return std::nullopt;
            }
            return value;
        }

        std::string line_context(const std::size_t index) {
            return "line " + std::to_string(index + 1);
        }

        Result<Hunk, Error> parse_header(const std::string_view line, const std::size_t index) {
            const std::string header(line);
            std::smatch match;
            if (!std::regex_match(header, match, hunk_header_regex())) {
                return Result<Hunk, Error>::failure(
                    Error::parse_error("Malformed hunk header", line_context(index))
                );
            }

            const auto old_start = to_size(match[1], 0);
            const auto old_count = to_size(match[2], 1);
            const auto new_start = to_size(match[3], 0);
            const auto new_count = to_size(match[4], 1);
            if (!old_start || !old_count || !new_start || !new_count) {
                return Result<Hunk, Error>::failure(
                    Error::parse_error("Hunk header value out of range", line_context(index))
                );
            }

            if (*new_start == 0 && *new_count > 0) {
                return Result<Hunk, Error>::failure(
                    Error::parse_error("Hunk declares new lines starting at line 0", line_context(index))
                );
            }

            Hunk hunk;
            hunk.old_start = *old_start;
            hunk.old_count = *old_count;
            hunk.new_start = *new_start;
            hunk.new_count = *new_count;
            hunk.section = match[5].str();
            return Result<Hunk, Error>::success(std::move(hunk));
        }

        /**
         * First new-file line the next hunk may start at.
         */
        std::size_t next_free_line(const Hunk& hunk) {
            std::size_t next = hunk.new_start;
            for (const auto& line : hunk.lines) {
                if (line.new_line) {
                    next = *line.new_line + 1;
                }
            }
            return std::max(next, hunk.new_start + (hunk.new_count == 0 ? 1 : 0));
        }

        bool starts_before(const Hunk& hunk, const std::size_t next_free) {
            // A pure deletion names the line after which it happens.
            const std::size_t first = hunk.new_count == 0 ? hunk.new_start + 1 : hunk.new_start;
            return first < next_free;
        }

        const std::unordered_map<std::string, Language>& extension_map() {
            static const std::unordered_map<std::string, Language> map = {
                {".c", Language::C},
                {".h", Language::C},
                {".cc", Language::Cpp},
                {".cpp", Language::Cpp},
                {".cxx", Language::Cpp},
                {".hpp", Language::Cpp},
                {".hh", Language::Cpp},
                {".cs", Language::CSharp},
                {".go", Language::Go},
                {".java", Language::Java},
                {".js", Language::JavaScript},
                {".jsx", Language::JavaScript},
                {".mjs", Language::JavaScript},
                {".kt", Language::Kotlin},
                {".php", Language::Php},
                {".py", Language::Python},
                {".rb", Language::Ruby},
                {".rs", Language::Rust},
                {".scala", Language::Scala},
                {".sh", Language::Shell},
                {".bash", Language::Shell},
                {".sql", Language::Sql},
                {".swift", Language::Swift},
                {".ts", Language::TypeScript},
                {".tsx", Language::TypeScript},
            };
            return map;
        }

    }  // namespace

    Result<std::vector<Hunk>, Error> parse(const std::string_view patch_text) {
        std::vector<Hunk> hunks;
        if (is_binary_patch(patch_text)) {
            return Result<std::vector<Hunk>, Error>::success(std::move(hunks));
        }

        const auto lines = string_utils::split_lines(patch_text);
        std::optional<Hunk> current;
        std::size_t next_line = 0;
        std::size_t next_free = 1;
        std::size_t old_seen = 0;
        std::size_t new_seen = 0;

        auto close_current = [&] {
            if (current) {
                next_free = next_free_line(*current);
                hunks.push_back(std::move(*current));
                current.reset();
            }
        };

        for (std::size_t i = 0; i < lines.size(); ++i) {
            const std::string_view line = lines[i];

            if (starts_with(line, "@@")) {
                close_current();

                auto header = parse_header(line, i);
                if (header.is_err()) {
                    return Result<std::vector<Hunk>, Error>::failure(header.error());
                }

                if (starts_before(header.value(), next_free)) {
                    return Result<std::vector<Hunk>, Error>::failure(
                        Error::parse_error("Hunk overlaps the previous hunk", line_context(i))
                    );
                }

                current = std::move(header).value();
                next_line = current->new_start;
                old_seen = 0;
                new_seen = 0;
                continue;
            }

            if (!current) {
                continue;
            }

            if (starts_with(line, "diff ")) {
                close_current();
                continue;
            }

            if (starts_with(line, "\\")) {
                continue;
            }

            // "+++i;" is the added line "++i;" while the hunk still has lines
            // to come; once its declared counts are used up, "---"/"+++"
            // start the headers of the next file section.
            const bool consumed = old_seen >= current->old_count && new_seen >= current->new_count;
            if (consumed && (starts_with(line, "+++") || starts_with(line, "---"))) {
                continue;
            }

            DiffLine diff_line;
            if (starts_with(line, "+")) {
                diff_line.kind = DiffLineKind::Added;
                diff_line.content = std::string(line.substr(1));
                diff_line.new_line = next_line++;
                ++new_seen;
            } else if (starts_with(line, "-")) {
                diff_line.kind = DiffLineKind::Removed;
                diff_line.content = std::string(line.substr(1));
                ++old_seen;
            } else {
                diff_line.kind = DiffLineKind::Context;
                diff_line.content = std::string(line.empty() ? line : line.substr(1));
                diff_line.new_line = next_line++;
                ++old_seen;
                ++new_seen;
            }
            current->lines.push_back(std::move(diff_line));
        }

        close_current();
        return Result<std::vector<Hunk>, Error>::success(std::move(hunks));
    }

    ChangedLineSet collect_added_lines(const std::vector<Hunk>& hunks) {
        ChangedLineSet result;

        for (const auto& hunk : hunks) {
            for (const auto& line : hunk.lines) {
                if (line.kind != DiffLineKind::Added || !line.new_line) {
                    continue;
                }
                if (!result.empty() && result.back().number >= *line.new_line) {
                    continue;
                }
                result.push_back(ChangedLine{*line.new_line, line.content});
            }
        }

        return result;
    }

    Result<ChangedLineSet, Error> changed_lines(const std::string_view patch_text) {
        return parse(patch_text).map(collect_added_lines);
    }

    Result<ChangedLineSet, Error> changed_lines(const FilePatch& file) {
        if (file.status == ChangeKind::Removed) {
            return Result<ChangedLineSet, Error>::success({});
        }

        auto result = changed_lines(file.patch);
        if (result.is_err()) {
            return Result<ChangedLineSet, Error>::failure(result.error().with_context(file.path));
        }
        return result;
    }

    bool is_binary_patch(const std::string_view patch_text) noexcept {
        if (string_utils::trim(patch_text).empty()) {
            return true;
        }

        const bool has_hunk = starts_with(patch_text, "@@") ||
                              string_utils::contains(patch_text, "\n@@");
        if (has_hunk) {
            return false;
        }

        return string_utils::contains(patch_text, "GIT binary patch") ||
               starts_with(patch_text, "Binary files ") ||
               string_utils::contains(patch_text, "\nBinary files ");
    }

    Language detect_language(const std::string_view path) {
        const auto extension = string_utils::to_lower(
            std::filesystem::path(path).extension().string()
        );

        const auto& map = extension_map();
        if (const auto it = map.find(extension); it != map.end()) {
            return it->second;
        }
        return Language::Text;
    }

}  // namespace gk::diff
