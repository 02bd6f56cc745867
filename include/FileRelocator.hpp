#pragma once

#include <filesystem>

class FileRelocator
{
public:
    // Moves SourcePath to DestPath unless DestPath already exists.
    // Returns true when moved, false when skipped. Throws std::filesystem::filesystem_error on failure.
    static bool Relocate(const std::filesystem::path& SourcePath, const std::filesystem::path& DestPath);

private:
    static void MoveAcrossDevices(const std::filesystem::path& SourcePath, const std::filesystem::path& DestPath);
};
