#include "FileRelocator.hpp"
#include "Logger.hpp"
#include <string>
#include <system_error>

namespace FS = std::filesystem;

bool FileRelocator::Relocate(const FS::path& SourcePath, const FS::path& DestPath)
{
    if (FS::exists(FS::symlink_status(DestPath)))
    {
        Log.Info(std::string("[FileRelocator] Skipped, already exists: ") + DestPath.string());
        return false;
    }

    if (DestPath.has_parent_path())
    {
        FS::create_directories(DestPath.parent_path());
    }

    std::error_code ec;
    FS::rename(SourcePath, DestPath, ec);
    if (ec == std::errc::cross_device_link)
    {
        MoveAcrossDevices(SourcePath, DestPath);
    }
    else if (ec)
    {
        throw FS::filesystem_error("Failed to move entry", SourcePath, DestPath, ec);
    }

    Log.Info(std::string("[FileRelocator] Moved: ") + SourcePath.string() + std::string(" → ") + DestPath.string());
    return true;
}

void FileRelocator::MoveAcrossDevices(const FS::path& SourcePath, const FS::path& DestPath)
{
    try
    {
        FS::copy(SourcePath, DestPath, FS::copy_options::recursive | FS::copy_options::copy_symlinks);
    }
    catch (const FS::filesystem_error&)
    {
        // A half-copied destination would make every retry skip as "already exists".
        std::error_code cleanupEc;
        FS::remove_all(DestPath, cleanupEc);
        throw;
    }
    FS::remove_all(SourcePath);
}
