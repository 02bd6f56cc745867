#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "RunConfig.hpp"

class FolderScanner
{
public:
    explicit FolderScanner(const RunConfig& Config);

    void Clear();

    // Throws std::filesystem::filesystem_error when RootPath is missing, not a directory, or unreadable.
    void Scan(const std::filesystem::path& RootPath);

    const std::vector<std::filesystem::path>& GetArchives() const;

private:
    std::vector<std::filesystem::path> Archives;
    std::string Extension;
    std::string IgnoredFolderName;

    void ScanDirectoryIterative(const std::filesystem::path& Root);

    bool IsArchive(const std::filesystem::path& Path) const;
};
