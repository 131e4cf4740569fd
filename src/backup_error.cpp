#include "backup_error.hpp"
#include <format>

std::string_view errorKindName(BackupErrorKind kind) {
    switch (kind) {
        case BackupErrorKind::DumpFailed: return "DumpFailed";
        case BackupErrorKind::BackupNotFound: return "BackupNotFound";
        case BackupErrorKind::SanitizeIOFailure: return "SanitizeIOFailure";
        case BackupErrorKind::ConnectionDrainWarning: return "ConnectionDrainWarning";
        case BackupErrorKind::RestoreTimeout: return "RestoreTimeout";
        case BackupErrorKind::RestoreFailed: return "RestoreFailed";
        case BackupErrorKind::CleanupWarning: return "CleanupWarning";
        case BackupErrorKind::InvalidConnection: return "InvalidConnection";
        case BackupErrorKind::InvalidFilename: return "InvalidFilename";
        case BackupErrorKind::ImportFailed: return "ImportFailed";
        case BackupErrorKind::DeleteFailed: return "DeleteFailed";
    }
    return "Unknown";
}

bool isFatal(BackupErrorKind kind) {
    return kind != BackupErrorKind::ConnectionDrainWarning && kind != BackupErrorKind::CleanupWarning;
}

std::string describe(const BackupError& error) {
    return std::format("{}: {}", errorKindName(error.kind), error.message);
}
