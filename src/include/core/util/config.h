/*
    config.h
    Application settings, optionally loaded from a TOML file.

    Example config.toml:

        [backup]
        out-dir = "/backup"
        search-secs = 10
        service-type = "_wled._tcp.local."
        identity-policy = "hostname"   # or "config"
        jobs = 4
        http-timeout-secs = 30

        [log]
        level = "debug"
        file = "/var/log/wled-backup.log"

    Usage:
    - Load the default file (if any) or an explicit one:
        wledbackup::core::InitConfig();
        wledbackup::core::InitConfig("/etc/wled-backup.toml");
    - Read a setting:
        std::filesystem::path dir = wledbackup::core::settings.out_dir;
    - Command-line flags are applied on top of the loaded values by main.
*/

#pragma once

#include <core/backup/identity_policy_kind.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <toml++/toml.h>

namespace wledbackup::core {

inline toml::table config;

struct Settings {
    std::filesystem::path out_dir = ".";            // Directory to save backups in
    std::uint64_t search_secs = 4;                  // Discovery quiet period
    std::string service_type = "_wled._tcp.local."; // mDNS service to browse
    IdentityPolicyKind identity_policy = IdentityPolicyKind::kConfigDerived;
    std::size_t jobs = 1;                           // Devices backed up concurrently
    std::uint64_t http_timeout_secs = 30;
    std::string log_level = "info";
    std::filesystem::path log_file; // Empty: stdout only
};

inline Settings settings;

// Loads `explicit_path` (errors are thrown) or the default config file if it exists
// (errors are logged and defaults kept).
void InitConfig(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

// Copies every recognised key of `table` into `target`. Invalid values are logged and skipped.
void ApplyConfig(const toml::table& table, Settings& target);

} // namespace wledbackup::core
