#include <core/error/backup_error.h>

namespace wledbackup::core {

std::string_view BackupErrorKindToString(BackupErrorKind kind) {
    switch (kind) {
    case BackupErrorKind::kTransport:
        return "transport";
    case BackupErrorKind::kHttpStatus:
        return "http-status";
    case BackupErrorKind::kMalformedConfig:
        return "malformed-config";
    case BackupErrorKind::kIdentity:
        return "identity";
    case BackupErrorKind::kFileWrite:
        return "file-write";
    }
    return "unknown";
}

IdentityError::IdentityError(IdentityErrorKind kind)
    : BackupError(BackupErrorKind::kIdentity, std::string(Message(kind)))
    , identity_kind_(kind) {}

std::string_view IdentityError::Message(IdentityErrorKind kind) {
    switch (kind) {
    case IdentityErrorKind::kMissingId:
        return "Missing 'id' field in cfg.json";
    case IdentityErrorKind::kMissingName:
        return "Missing 'name' field in cfg.json";
    case IdentityErrorKind::kNameNotString:
        return "Expected 'name' to be a string in cfg.json";
    case IdentityErrorKind::kBlankName:
        return "Hostname is empty or contains only whitespace";
    }
    return "Invalid cfg.json";
}

} // namespace wledbackup::core
