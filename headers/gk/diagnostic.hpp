//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef GATEKEEPER_DIAGNOSTIC_HPP
#define GATEKEEPER_DIAGNOSTIC_HPP

/**
 * @file diagnostic.hpp
 * @brief Non-fatal events recorded during a review run.
 *
 * The pipeline never writes to a stream. Anything worth logging (a file
 * that failed to parse, an analyzer that failed on one file) is returned
 * as a Diagnostic and the caller decides how to report it.
 */

#include "gk/error.hpp"

#include <string>
#include <vector>

namespace gk {

    enum class DiagnosticKind {
        FileSkipped,       ///< Patch failed to parse; file excluded from analysis
        AnalyzerDegraded,  ///< Analyzer failed for one file; its findings are missing
        FindingDiscarded   ///< Finding referenced a line outside the changed lines
    };

    struct Diagnostic {
        DiagnosticKind kind;
        std::string path;
        std::string analyzer;
        Error error;
    };

    using Diagnostics = std::vector<Diagnostic>;

    inline const char* to_string(DiagnosticKind kind) noexcept {
        switch (kind) {
            case DiagnosticKind::FileSkipped:      return "file_skipped";
            case DiagnosticKind::AnalyzerDegraded: return "analyzer_degraded";
            case DiagnosticKind::FindingDiscarded: return "finding_discarded";
        }
        return "unknown";
    }

    /**
     * One-line description for log output.
     */
    inline std::string describe(const Diagnostic& diagnostic) {
        std::string text = to_string(diagnostic.kind);
        text += ": ";
        text += diagnostic.path;
        if (!diagnostic.analyzer.empty()) {
            text += " [" + diagnostic.analyzer + "]";
        }
        text += " ";
        text += diagnostic.error.to_string();
        return text;
    }

}  // namespace gk

#endif //GATEKEEPER_DIAGNOSTIC_HPP
