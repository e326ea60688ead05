//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef GK_PAYLOAD_HPP
#define GK_PAYLOAD_HPP

/**
 * @file payload.hpp
 * @brief Reading pull request payloads and writing reviews as JSON.
 *
 * Accepted input shapes:
 *
 * @code
 *     { "pull_request_id": "42", "files": [ ... ] }
 *     [ { "filename": "app.py", "status": "modified", "patch": "@@ ..." } ]
 * @endcode
 *
 * The second form is the body of GitHub's "list pull request files"
 * endpoint. A file without a patch (binary or too large) is kept with an
 * empty patch and yields no changed lines.
 */

#include "gk/diagnostic.hpp"
#include "gk/result.hpp"
#include "gk/types.hpp"
#include "gk/utils/json_utils.hpp"

#include <filesystem>
#include <string_view>

namespace gk::io {

    using json = nlohmann::json;

    [[nodiscard]] Result<PullRequest, Error> parse_pull_request(const json& payload);

    [[nodiscard]] Result<PullRequest, Error> parse_pull_request_text(std::string_view text);

    [[nodiscard]] Result<PullRequest, Error> load_pull_request(const std::filesystem::path& path);

    /**
     * Review in the shape of a GitHub "create review" request body, plus
     * the severity table. Every comment targets the RIGHT side.
     */
    [[nodiscard]] json review_to_json(const Review& review);

    [[nodiscard]] json diagnostics_to_json(const Diagnostics& diagnostics);

}  // namespace gk::io

#endif //GK_PAYLOAD_HPP
