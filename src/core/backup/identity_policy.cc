#include <core/backup/identity_policy.h>
#include <core/constant/route.h>
#include <core/error/backup_error.h>

namespace wledbackup::core {

namespace {

constexpr std::string_view kFallbackStem = "wled";
constexpr std::string_view kWhitespace = " \t\n\v\f\r";

const BackupResource kConfigResource{"cfg", ApiRoute::kConfig};
const BackupResource kPresetsResource{"presets", ApiRoute::kPresets};

} // namespace

std::string HostnameFromConfig(const nlohmann::json& cfg_json) {
    if (!cfg_json.is_object() || !cfg_json.contains("id")) {
        throw IdentityError(IdentityErrorKind::kMissingId);
    }
    const auto& id = cfg_json.at("id");
    if (!id.is_object() || !id.contains("name")) {
        throw IdentityError(IdentityErrorKind::kMissingName);
    }
    const auto& name = id.at("name");
    if (!name.is_string()) {
        throw IdentityError(IdentityErrorKind::kNameNotString);
    }
    const auto& hostname = name.get_ref<const std::string&>();
    if (hostname.find_first_not_of(kWhitespace) == std::string::npos) {
        throw IdentityError(IdentityErrorKind::kBlankName);
    }
    return hostname;
}

std::string StemFromHostname(std::string_view hostname) {
    auto stem = hostname.substr(0, hostname.find('.'));
    if (stem.empty()) {
        return std::string(kFallbackStem);
    }
    return std::string(stem);
}

const std::vector<BackupResource>& ConfigDerivedPolicy::Resources() const {
    static const std::vector<BackupResource> resources{kConfigResource, kPresetsResource};
    return resources;
}

BackupTarget ConfigDerivedPolicy::Resolve(const DeviceRecord& /*record*/,
                                          const std::optional<nlohmann::json>& config) const {
    if (!config) {
        throw IdentityError(IdentityErrorKind::kMissingId);
    }
    return BackupTarget{HostnameFromConfig(*config)};
}

std::string ConfigDerivedPolicy::FileName(const BackupTarget& target,
                                          const BackupResource& resource) const {
    return target.identifier + "_" + std::string(resource.kind) + ".json";
}

const std::vector<BackupResource>& HostnameDerivedPolicy::Resources() const {
    static const std::vector<BackupResource> resources{kPresetsResource};
    return resources;
}

BackupTarget HostnameDerivedPolicy::Resolve(const DeviceRecord& record,
                                            const std::optional<nlohmann::json>& /*config*/) const {
    return BackupTarget{StemFromHostname(record.hostname)};
}

std::string HostnameDerivedPolicy::FileName(const BackupTarget& target,
                                            const BackupResource& /*resource*/) const {
    return target.identifier + ".json";
}

std::unique_ptr<IdentityPolicy> MakeIdentityPolicy(IdentityPolicyKind kind) {
    switch (kind) {
    case IdentityPolicyKind::kHostnameDerived:
        return std::make_unique<HostnameDerivedPolicy>();
    case IdentityPolicyKind::kConfigDerived:
        break;
    }
    return std::make_unique<ConfigDerivedPolicy>();
}

} // namespace wledbackup::core
