#pragma once

#include <optional>
#include <string_view>

namespace wledbackup::core {

enum class IdentityPolicyKind {
    kConfigDerived,   // id.name from cfg.json, files <name>_cfg.json + <name>_presets.json
    kHostnameDerived, // advertised hostname prefix, file <name>.json
};

inline std::string_view IdentityPolicyKindToString(IdentityPolicyKind kind) {
    switch (kind) {
    case IdentityPolicyKind::kConfigDerived:
        return "config";
    case IdentityPolicyKind::kHostnameDerived:
        return "hostname";
    }
    return "config";
}

inline std::optional<IdentityPolicyKind> IdentityPolicyKindFromString(std::string_view text) {
    if (text == "config") {
        return IdentityPolicyKind::kConfigDerived;
    }
    if (text == "hostname") {
        return IdentityPolicyKind::kHostnameDerived;
    }
    return std::nullopt;
}

} // namespace wledbackup::core
