#include <core/backup/backup_writer.h>
#include <core/error/backup_error.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace wledbackup::core {

namespace {

void removePartial(const fs::path& partial) {
    std::error_code ec;
    fs::remove(partial, ec);
    if (ec) {
        spdlog::warn("Failed to remove \"{}\": {}", partial.string(), ec.message());
    }
}

} // namespace

fs::path BackupWriter::Write(const fs::path& out_dir,
                             const std::string& file_name,
                             std::string_view bytes) {
    const fs::path destination = out_dir / file_name;
    fs::path partial = destination;
    partial += ".part";

    {
        std::ofstream ofs(partial, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw BackupError(BackupErrorKind::kFileWrite,
                              "Failed to create \"" + partial.string() + "\"");
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            removePartial(partial);
            throw BackupError(BackupErrorKind::kFileWrite,
                              "Failed to write \"" + partial.string() + "\"");
        }
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        removePartial(partial);
        throw BackupError(BackupErrorKind::kFileWrite,
                          "Failed to move \"" + partial.string() + "\" to \""
                              + destination.string() + "\": " + ec.message());
    }
    spdlog::debug("Wrote {} bytes to \"{}\"", bytes.size(), destination.string());
    return destination;
}

} // namespace wledbackup::core
