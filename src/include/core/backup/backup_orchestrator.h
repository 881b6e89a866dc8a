#pragma once

#include <core/backup/identity_policy.h>
#include <core/model/backup_outcome.h>
#include <core/model/device_record.h>
#include <core/network/client/resource_fetcher.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wledbackup::core {

// Fetches each device's resources and writes them under the identity the policy derives.
// One device's failure never stops the others.
class BackupOrchestrator {
public:
    BackupOrchestrator(ResourceFetcher& fetcher, const IdentityPolicy& policy, std::size_t jobs = 1);

    // Sequential when jobs == 1, otherwise up to `jobs` devices at a time.
    BatchResult BackupAll(const std::vector<DeviceRecord>& records,
                          const std::filesystem::path& out_dir);

    // nullopt when the record has no address: the device is skipped, not failed.
    std::optional<BackupOutcome> BackupDevice(const DeviceRecord& record,
                                              const std::filesystem::path& out_dir);

private:
    std::string fetchResource(const DeviceRecord& record,
                              const boost::asio::ip::address& address,
                              std::string_view route);

    ResourceFetcher& fetcher_;
    const IdentityPolicy& policy_;
    std::size_t jobs_;
};

} // namespace wledbackup::core
