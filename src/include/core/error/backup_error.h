#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace wledbackup::core {

enum class BackupErrorKind {
    kTransport,       // connection refused, timeout, name resolution
    kHttpStatus,      // non-2xx response
    kMalformedConfig, // cfg.json is not valid JSON
    kIdentity,        // cfg.json has no usable id.name
    kFileWrite,
};

std::string_view BackupErrorKindToString(BackupErrorKind kind);

// Per-device failure. Caught at the device boundary and turned into a BackupOutcome.
class BackupError : public std::runtime_error {
public:
    BackupError(BackupErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    BackupErrorKind kind() const noexcept { return kind_; }

private:
    BackupErrorKind kind_;
};

enum class IdentityErrorKind {
    kMissingId,
    kMissingName,
    kNameNotString,
    kBlankName,
};

class IdentityError : public BackupError {
public:
    explicit IdentityError(IdentityErrorKind kind);

    IdentityErrorKind identity_kind() const noexcept { return identity_kind_; }

    static std::string_view Message(IdentityErrorKind kind);

private:
    IdentityErrorKind identity_kind_;
};

// Process-level: the mDNS socket could not be set up.
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wledbackup::core
