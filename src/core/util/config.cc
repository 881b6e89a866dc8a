#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace wledbackup::core {

namespace {

template<typename T>
std::optional<T> readPositive(const toml::table& table,
                              std::string_view key,
                              std::int64_t max = std::numeric_limits<std::int64_t>::max()) {
    auto value = table[key].value<std::int64_t>();
    if (!value) {
        if (table.contains(key)) {
            spdlog::warn("Config key \"{}\" must be an integer, ignored.", key);
        }
        return std::nullopt;
    }
    if (*value <= 0) {
        spdlog::warn("Config key \"{}\" must be positive, got {}, ignored.", key, *value);
        return std::nullopt;
    }
    if (*value > max) {
        spdlog::warn("Config key \"{}\" must be at most {}, got {}, ignored.", key, max, *value);
        return std::nullopt;
    }
    return static_cast<T>(*value);
}

void loadBackupSection(const toml::table& backup, Settings& target) {
    if (auto out_dir = backup["out-dir"].value<std::string>()) {
        target.out_dir = *out_dir;
    }
    // search-secs may be 0: one immediate poll, nothing waited for.
    if (auto search_secs = backup["search-secs"].value<std::int64_t>()) {
        if (*search_secs < 0) {
            spdlog::warn("Config key \"search-secs\" must not be negative, ignored.");
        } else if (static_cast<std::uint64_t>(*search_secs) > mdns::kMaxSearchSecs) {
            spdlog::warn("Config key \"search-secs\" must be at most {}, ignored.",
                         mdns::kMaxSearchSecs);
        } else {
            target.search_secs = static_cast<std::uint64_t>(*search_secs);
        }
    }
    if (auto service_type = backup["service-type"].value<std::string>()) {
        target.service_type = *service_type;
    }
    if (auto policy = backup["identity-policy"].value<std::string>()) {
        if (auto kind = IdentityPolicyKindFromString(*policy)) {
            target.identity_policy = *kind;
        } else {
            spdlog::warn("Unknown identity-policy \"{}\", expected config or hostname.", *policy);
        }
    }
    if (auto jobs = readPositive<std::size_t>(backup, "jobs")) {
        target.jobs = *jobs;
    }
    constexpr auto kMaxTimeout = static_cast<std::int64_t>(transfer::kMaxHttpTimeoutSecs);
    if (auto timeout = readPositive<std::uint64_t>(backup, "http-timeout-secs", kMaxTimeout)) {
        target.http_timeout_secs = *timeout;
    }
}

void loadLogSection(const toml::table& log, Settings& target) {
    if (auto level = log["level"].value<std::string>()) {
        target.log_level = *level;
    }
    if (auto file = log["file"].value<std::string>()) {
        target.log_file = *file;
    }
}

} // namespace

void ApplyConfig(const toml::table& table, Settings& target) {
    if (const auto* backup = table["backup"].as_table()) {
        loadBackupSection(*backup, target);
    }
    if (const auto* log = table["log"].as_table()) {
        loadLogSection(*log, target);
    }
}

void InitConfig(const std::optional<std::filesystem::path>& explicit_path) {
    if (explicit_path) {
        if (!std::filesystem::exists(*explicit_path)) {
            throw std::runtime_error("Config file \"" + explicit_path->string() + "\" does not exist");
        }
        try {
            config = toml::parse_file(explicit_path->string());
        } catch (const toml::parse_error& err) {
            throw std::runtime_error("\"" + explicit_path->string()
                                     + "\" could not be parsed: " + std::string(err.description()));
        }
        ApplyConfig(config, settings);
        return;
    }

    const auto& path = path::kDefaultConfigFile;
    if (!std::filesystem::exists(path)) {
        spdlog::debug("No config file at \"{}\", using defaults.", path.string());
        return;
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be opened for parsing: {}", path.string(), err.description());
        config = toml::table{};
        return;
    }
    ApplyConfig(config, settings);
}

} // namespace wledbackup::core
