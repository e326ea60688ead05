//
// Created by gregorian-rayne on 10/10/26.
//

#include "gk/io/payload.hpp"

namespace gk::io
{
    namespace {

        Result<std::string, Error> optional_string(const json& obj, const char* key, const std::size_t index) {
            if (!obj.contains(key) || obj.at(key).is_null()) {
                return Result<std::string, Error>::success("");
            }
            auto value = json_utils::get<std::string>(obj, key);
            if (value.is_err()) {
                return Result<std::string, Error>::failure(
                    Error::parse_error(std::string("Field '") + key + "' must be a string",
                                       "files[" + std::to_string(index) + "]")
                );
            }
            return value;
        }

        Result<FilePatch, Error> parse_file(const json& entry, const std::size_t index) {
            const std::string where = "files[" + std::to_string(index) + "]";
            if (!entry.is_object()) {
                return Result<FilePatch, Error>::failure(
                    Error::parse_error("File entry must be an object", where)
                );
            }

            auto filename = optional_string(entry, "filename", index);
            if (filename.is_err()) {
                return Result<FilePatch, Error>::failure(filename.error());
            }
            auto status = optional_string(entry, "status", index);
            if (status.is_err()) {
                return Result<FilePatch, Error>::failure(status.error());
            }
            auto patch = optional_string(entry, "patch", index);
            if (patch.is_err()) {
                return Result<FilePatch, Error>::failure(patch.error());
            }

            FilePatch file;
            file.path = std::move(filename).value();
            file.patch = std::move(patch).value();

            if (!status.value().empty()) {
                const auto kind = change_kind_from_string(status.value());
                if (!kind) {
                    return Result<FilePatch, Error>::failure(
                        Error::parse_error("Unknown file status '" + status.value() + "'", where)
                    );
                }
                file.status = *kind;
            }

            return Result<FilePatch, Error>::success(std::move(file));
        }

        Result<std::string, Error> pull_request_id(const json& payload) {
            if (!payload.contains("pull_request_id") || payload.at("pull_request_id").is_null()) {
                return Result<std::string, Error>::success("");
            }
            const auto& id = payload.at("pull_request_id");
            if (id.is_string()) {
                return Result<std::string, Error>::success(id.get<std::string>());
            }
            if (id.is_number_integer()) {
                return Result<std::string, Error>::success(id.dump());
            }
            return Result<std::string, Error>::failure(
                Error::parse_error("pull_request_id must be a string or an integer")
            );
        }

    }  // namespace

    Result<PullRequest, Error> parse_pull_request(const json& payload) {
        PullRequest pull_request;
        const json* files = nullptr;

        if (payload.is_array()) {
            files = &payload;
        } else if (payload.is_object()) {
            auto id = pull_request_id(payload);
            if (id.is_err()) {
                return Result<PullRequest, Error>::failure(id.error());
            }
            pull_request.id = std::move(id).value();

            if (!payload.contains("files") || !payload.at("files").is_array()) {
                return Result<PullRequest, Error>::failure(
                    Error::parse_error("Payload must contain a 'files' array")
                );
            }
            files = &payload.at("files");
        } else {
            return Result<PullRequest, Error>::failure(
                Error::parse_error("Payload must be an object or an array of files")
            );
        }

        for (std::size_t i = 0; i < files->size(); ++i) {
            auto file = parse_file((*files)[i], i);
            if (file.is_err()) {
                return Result<PullRequest, Error>::failure(file.error());
            }
            if (file.value().path.empty()) {
                continue;
            }
            pull_request.files.push_back(std::move(file).value());
        }

        return Result<PullRequest, Error>::success(std::move(pull_request));
    }

    Result<PullRequest, Error> parse_pull_request_text(const std::string_view text) {
        return json_utils::parse(text).and_then([](const json& payload) {
            return parse_pull_request(payload);
        });
    }

    Result<PullRequest, Error> load_pull_request(const std::filesystem::path& path) {
        auto payload = json_utils::read_file(path);
        if (payload.is_err()) {
            return Result<PullRequest, Error>::failure(payload.error());
        }
        auto pull_request = parse_pull_request(payload.value());
        if (pull_request.is_err()) {
            return Result<PullRequest, Error>::failure(pull_request.error().with_context(path.string()));
        }
        return pull_request;
    }

    json review_to_json(const Review& review) {
        json comments = json::array();
        for (const auto& comment : review.inline_comments) {
            comments.push_back({
                {"path", comment.path},
                {"line", comment.line},
                {"side", "RIGHT"},
                {"body", comment.message},
                {"severity", to_string(comment.severity)},
                {"rule_id", comment.rule_id}
            });
        }

        json files = json::array();
        for (const auto& row : review.file_rows) {
            files.push_back({
                {"path", row.path},
                {"error", row.counts.error},
                {"warning", row.counts.warning},
                {"info", row.counts.info}
            });
        }

        json result = {
            {"body", review.summary_markdown},
            {"event", "COMMENT"},
            {"total_findings", review.total_findings},
            {"severity_counts", {
                {"error", review.severity_counts.error},
                {"warning", review.severity_counts.warning},
                {"info", review.severity_counts.info}
            }},
            {"files", std::move(files)},
            {"comments", std::move(comments)}
        };
        if (!review.pull_request_id.empty()) {
            result["pull_request_id"] = review.pull_request_id;
        }
        return result;
    }

    json diagnostics_to_json(const Diagnostics& diagnostics) {
        json result = json::array();
        for (const auto& diagnostic : diagnostics) {
            json entry = {
                {"kind", to_string(diagnostic.kind)},
                {"path", diagnostic.path},
                {"code", error_code_to_string(diagnostic.error.code())},
                {"message", diagnostic.error.message()}
            };
            if (!diagnostic.analyzer.empty()) {
                entry["analyzer"] = diagnostic.analyzer;
            }
            if (diagnostic.error.context()) {
                entry["context"] = *diagnostic.error.context();
            }
            result.push_back(std::move(entry));
        }
        return result;
    }

}  // namespace gk::io
