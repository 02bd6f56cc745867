#pragma once

#include <array>
#include <cstdint>
#include <filesystem>

using ContentDigest = std::array<uint8_t, 32>;

class ContentComparator
{
public:
    // True when DestPath is missing or its BLAKE3 digest differs from SourcePath's.
    // Throws std::filesystem::filesystem_error when either side cannot be read.
    static bool ShouldOverwrite(const std::filesystem::path& SourcePath, const std::filesystem::path& DestPath);

    // Regular files hash their content. Directories hash every regular file below them,
    // in sorted relative-path order, together with its relative path.
    static ContentDigest HashPath(const std::filesystem::path& Path);

private:
    static ContentDigest HashFile(const std::filesystem::path& FilePath);
    static ContentDigest HashDirectory(const std::filesystem::path& DirPath);
};
