#pragma once

#include "core/error/backup_error.h"
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wledbackup::core {

// Filename stem of a device's backup files. Never empty.
struct BackupTarget {
    std::string identifier;

    bool operator==(const BackupTarget&) const = default;
};

enum class BackupStatus {
    kSuccess,
    kFailure,
};

struct BackupOutcome {
    std::string hostname;
    std::optional<BackupTarget> target; // 身份解析之前失败时为空
    BackupStatus status = BackupStatus::kSuccess;
    std::optional<BackupErrorKind> error_kind;
    std::string reason;
    std::vector<std::filesystem::path> saved_files;

    bool ok() const { return status == BackupStatus::kSuccess; }
};

struct BatchResult {
    std::vector<BackupOutcome> outcomes;

    bool Succeeded() const {
        return std::all_of(outcomes.begin(), outcomes.end(), [](const BackupOutcome& outcome) {
            return outcome.ok();
        });
    }

    std::size_t FailedCount() const {
        return static_cast<std::size_t>(
            std::count_if(outcomes.begin(), outcomes.end(), [](const BackupOutcome& outcome) {
                return !outcome.ok();
            }));
    }
};

} // namespace wledbackup::core
