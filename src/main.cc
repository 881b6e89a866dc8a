#include <chrono>
#include <cli/argument_parser.h>
#include <core/backup/backup_orchestrator.h>
#include <core/backup/identity_policy.h>
#include <core/constant/exit_code.h>
#include <core/error/backup_error.h>
#include <core/network/client/resource_fetcher.h>
#include <core/network/discovery/discovery_collector.h>
#include <core/network/discovery/mdns_browser.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>

#ifndef WLEDBACKUP_VERSION
#define WLEDBACKUP_VERSION "0.0.0"
#endif

using namespace wledbackup;
using namespace wledbackup::core;

namespace {

void applyOptions(const cli::CliOptions& options, Settings& target) {
    if (options.out_dir) {
        target.out_dir = *options.out_dir;
    }
    if (options.search_secs) {
        target.search_secs = *options.search_secs;
    }
    if (options.policy) {
        target.identity_policy = *IdentityPolicyKindFromString(*options.policy);
    }
    if (options.jobs) {
        target.jobs = *options.jobs;
    }
    if (options.log_level) {
        target.log_level = *options.log_level;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp(std::cerr);
        return exit_code::kFatal;
    }
    if (options.show_help) {
        cli::ArgumentParser::ShowHelp(std::cout);
        return exit_code::kSuccess;
    }
    if (options.show_version) {
        std::cout << "wled-backup " << WLEDBACKUP_VERSION << '\n';
        return exit_code::kSuccess;
    }

    try {
        if (options.config_path) {
            InitConfig(std::filesystem::path(*options.config_path));
        } else {
            InitConfig();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return exit_code::kFatal;
    }
    applyOptions(options, settings);

    std::unique_ptr<Logger> logger;
    try {
        logger = std::make_unique<Logger>(
#ifdef WLEDBACKUP_DEBUG
            Logger::Level::debug,
#else
            Logger::ParseLevel(settings.log_level),
#endif
            settings.log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: failed to open log file: " << e.what() << '\n';
        return exit_code::kFatal;
    }

    std::error_code ec;
    std::filesystem::create_directories(settings.out_dir, ec);
    if (ec) {
        spdlog::error("Failed to create output directory \"{}\": {}",
                      settings.out_dir.string(),
                      ec.message());
        return exit_code::kFatal;
    }

    spdlog::info("Saving backups to {}, searching for {} seconds...",
                 settings.out_dir.string(),
                 settings.search_secs);

    std::vector<DeviceRecord> devices;
    try {
        MdnsBrowser browser;
        DiscoveryCollector collector(browser, settings.service_type);
        devices = collector.Collect(std::chrono::seconds(settings.search_secs));
    } catch (const DiscoveryError& e) {
        spdlog::error("{}", e.what());
        return exit_code::kFatal;
    }

    HttpResourceFetcher fetcher(std::chrono::seconds(settings.http_timeout_secs));
    auto policy = MakeIdentityPolicy(settings.identity_policy);
    spdlog::debug("Identity policy: {}, jobs: {}",
                  IdentityPolicyKindToString(policy->kind()),
                  settings.jobs);
    BackupOrchestrator orchestrator(fetcher, *policy, settings.jobs);

    auto result = orchestrator.BackupAll(devices, settings.out_dir);
    if (!result.Succeeded()) {
        spdlog::error("{} device(s) failed", result.FailedCount());
        for (const auto& outcome : result.outcomes) {
            if (!outcome.ok()) {
                spdlog::error("  {} [{}]",
                              outcome.hostname,
                              outcome.error_kind ? BackupErrorKindToString(*outcome.error_kind)
                                                 : std::string_view("unexpected"));
            }
        }
        return exit_code::kBackupFailed;
    }

    spdlog::info("Finished");
    return exit_code::kSuccess;
}
