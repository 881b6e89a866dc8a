#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <core/backup/backup_orchestrator.h>
#include <core/backup/backup_writer.h>
#include <core/constant/route.h>
#include <core/error/backup_error.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using json = nlohmann::json;

namespace wledbackup::core {

BackupOrchestrator::BackupOrchestrator(ResourceFetcher& fetcher,
                                       const IdentityPolicy& policy,
                                       std::size_t jobs)
    : fetcher_(fetcher)
    , policy_(policy)
    , jobs_(std::max<std::size_t>(jobs, 1)) {}

std::string BackupOrchestrator::fetchResource(const DeviceRecord& record,
                                              const boost::asio::ip::address& address,
                                              std::string_view route) {
    auto response = fetcher_.Fetch(address, record.port, route);
    if (response.status < 200 || response.status >= 300) {
        throw BackupError(BackupErrorKind::kHttpStatus,
                          "GET " + DescribeUrl(address, record.port, route) + " returned HTTP "
                              + std::to_string(response.status));
    }
    return std::move(response.body);
}

std::optional<BackupOutcome> BackupOrchestrator::BackupDevice(const DeviceRecord& record,
                                                              const std::filesystem::path& out_dir) {
    if (record.addresses.empty()) {
        spdlog::debug("Skipping {}: no address advertised", record.hostname);
        return std::nullopt;
    }
    const auto& address = *record.addresses.begin();

    spdlog::info("Backing up {}", record.hostname);
    BackupOutcome outcome;
    outcome.hostname = record.hostname;

    try {
        // cfg.json 必须先完整取回并解析，身份确定之前不写任何文件
        std::optional<std::string> config_body;
        std::optional<json> config;
        if (policy_.RequiresConfig()) {
            config_body = fetchResource(record, address, ApiRoute::kConfig);
            try {
                config = json::parse(*config_body);
            } catch (const json::exception& e) {
                throw BackupError(BackupErrorKind::kMalformedConfig,
                                  std::string("Invalid cfg.json: ") + e.what());
            }
        }

        auto target = policy_.Resolve(record, config);
        outcome.target = target;
        spdlog::info("  host name: {}", target.identifier);

        for (const auto& resource : policy_.Resources()) {
            std::string body;
            if (resource.route == ApiRoute::kConfig && config_body) {
                body = std::move(*config_body);
                config_body.reset();
            } else {
                body = fetchResource(record, address, resource.route);
            }
            auto file_name = policy_.FileName(target, resource);
            outcome.saved_files.push_back(BackupWriter::Write(out_dir, file_name, body));
            spdlog::info("  saved: {}", file_name);
        }
        spdlog::info("  SUCCESS");
    } catch (const BackupError& e) {
        outcome.status = BackupStatus::kFailure;
        outcome.error_kind = e.kind();
        outcome.reason = e.what();
        spdlog::error("  FAILED: {}", e.what());
    } catch (const std::exception& e) {
        // 非预期错误同样只影响当前设备
        outcome.status = BackupStatus::kFailure;
        outcome.error_kind.reset();
        outcome.reason = e.what();
        spdlog::error("  FAILED: {}", e.what());
    }
    return outcome;
}

BatchResult BackupOrchestrator::BackupAll(const std::vector<DeviceRecord>& records,
                                          const std::filesystem::path& out_dir) {
    BatchResult result;

    if (jobs_ == 1 || records.size() <= 1) {
        for (const auto& record : records) {
            if (auto outcome = BackupDevice(record, out_dir)) {
                result.outcomes.push_back(std::move(*outcome));
            }
        }
    } else {
        std::mutex result_mutex;
        net::thread_pool pool(std::min(jobs_, records.size()));
        for (const auto& record : records) {
            net::post(pool, [this, &record, &out_dir, &result, &result_mutex]() {
                auto outcome = BackupDevice(record, out_dir);
                if (outcome) {
                    std::lock_guard<std::mutex> lock(result_mutex);
                    result.outcomes.push_back(std::move(*outcome));
                }
            });
        }
        pool.join();
    }

    spdlog::info("Backed up {}/{} devices",
                 result.outcomes.size() - result.FailedCount(),
                 result.outcomes.size());
    return result;
}

} // namespace wledbackup::core
