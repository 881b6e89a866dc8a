#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace wledbackup::core {

class BackupWriter {
public:
    // Writes `bytes` to out_dir/file_name through a ".part" sibling that is renamed into
    // place, so the destination is either complete or untouched. Returns the destination.
    // Throws BackupError(kFileWrite).
    static std::filesystem::path Write(const std::filesystem::path& out_dir,
                                       const std::string& file_name,
                                       std::string_view bytes);
};

} // namespace wledbackup::core
