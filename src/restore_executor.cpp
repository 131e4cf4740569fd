/**
 * @file restore_executor.cpp
 * @brief Restore stage names and classification of psql restore output.
 */

#include "restore_executor.hpp"

std::string_view restoreStageName(RestoreStage stage) {
    switch (stage) {
        case RestoreStage::Pending: return "PENDING";
        case RestoreStage::Verifying: return "VERIFYING";
        case RestoreStage::Draining: return "DRAINING";
        case RestoreStage::Sanitizing: return "SANITIZING";
        case RestoreStage::Restoring: return "RESTORING";
        case RestoreStage::Complete: return "COMPLETE";
        case RestoreStage::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

RestoreDiagnostics classifyRestoreOutput(std::string_view stderrText) {
    RestoreDiagnostics diagnostics;
    while (!stderrText.empty()) {
        auto end = stderrText.find('\n');
        std::string_view line = stderrText.substr(0, end);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.find("ERROR:") != std::string_view::npos) {
            diagnostics.errorLines.emplace_back(line);
        } else if (line.find("WARNING:") != std::string_view::npos || line.find("NOTICE:") != std::string_view::npos) {
            diagnostics.warningLines.emplace_back(line);
        }
        if (end == std::string_view::npos) {
            break;
        }
        stderrText.remove_prefix(end + 1);
    }
    return diagnostics;
}
