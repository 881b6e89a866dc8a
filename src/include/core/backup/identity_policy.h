#pragma once

#include <core/backup/identity_policy_kind.h>
#include <core/model/backup_outcome.h>
#include <core/model/device_record.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wledbackup::core {

// One file backed up per device.
struct BackupResource {
    std::string_view kind;  // "cfg", "presets"
    std::string_view route; // "/cfg.json", ...
};

// Decides the filename stem of a device and which resources are saved under it.
class IdentityPolicy {
public:
    virtual ~IdentityPolicy() = default;

    virtual IdentityPolicyKind kind() const = 0;

    // Whether /cfg.json has to be fetched and parsed before Resolve().
    virtual bool RequiresConfig() const = 0;

    // In the order they are fetched and written.
    virtual const std::vector<BackupResource>& Resources() const = 0;

    // Throws IdentityError when no identifier can be derived.
    virtual BackupTarget Resolve(const DeviceRecord& record,
                                 const std::optional<nlohmann::json>& config) const
        = 0;

    virtual std::string FileName(const BackupTarget& target, const BackupResource& resource) const = 0;
};

class ConfigDerivedPolicy : public IdentityPolicy {
public:
    IdentityPolicyKind kind() const override { return IdentityPolicyKind::kConfigDerived; }
    bool RequiresConfig() const override { return true; }
    const std::vector<BackupResource>& Resources() const override;
    BackupTarget Resolve(const DeviceRecord& record,
                         const std::optional<nlohmann::json>& config) const override;
    std::string FileName(const BackupTarget& target, const BackupResource& resource) const override;
};

class HostnameDerivedPolicy : public IdentityPolicy {
public:
    IdentityPolicyKind kind() const override { return IdentityPolicyKind::kHostnameDerived; }
    bool RequiresConfig() const override { return false; }
    const std::vector<BackupResource>& Resources() const override;
    BackupTarget Resolve(const DeviceRecord& record,
                         const std::optional<nlohmann::json>& config) const override;
    std::string FileName(const BackupTarget& target, const BackupResource& resource) const override;
};

std::unique_ptr<IdentityPolicy> MakeIdentityPolicy(IdentityPolicyKind kind);

// id.name of a cfg.json document, returned untrimmed. Throws IdentityError.
std::string HostnameFromConfig(const nlohmann::json& cfg_json);

// "foo.local." -> "foo"; falls back to "wled" when nothing precedes the first dot.
std::string StemFromHostname(std::string_view hostname);

} // namespace wledbackup::core
