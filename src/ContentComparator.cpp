#include "ContentComparator.hpp"
#include <blake3.h>
#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    constexpr size_t HASH_BUFFER_SIZE = 64 * 1024;

    // Distinct leading tags keep a file and a directory from ever producing the same digest.
    constexpr uint8_t FILE_TAG = 'F';
    constexpr uint8_t DIRECTORY_TAG = 'D';

    [[noreturn]] void ThrowReadFailure(const std::string& What, const FS::path& Path)
    {
        std::error_code ec;
        FS::status(Path, ec);
        if (!ec)
        {
            ec = std::make_error_code(std::errc::io_error);
        }
        throw FS::filesystem_error(What, Path, ec);
    }
}

bool ContentComparator::ShouldOverwrite(const FS::path& SourcePath, const FS::path& DestPath)
{
    if (!FS::exists(FS::symlink_status(DestPath)))
    {
        return true;
    }

    if (FS::is_directory(SourcePath) != FS::is_directory(DestPath))
    {
        return true;
    }

    return HashPath(SourcePath) != HashPath(DestPath);
}

ContentDigest ContentComparator::HashPath(const FS::path& Path)
{
    const FS::file_status Status = FS::status(Path);

    if (FS::is_directory(Status))
    {
        return HashDirectory(Path);
    }
    if (FS::is_regular_file(Status))
    {
        return HashFile(Path);
    }

    throw FS::filesystem_error("Cannot hash path, not a regular file or directory", Path, std::make_error_code(std::errc::invalid_argument));
}

ContentDigest ContentComparator::HashFile(const FS::path& FilePath)
{
    std::ifstream File(FilePath, std::ios::binary);
    if (!File.is_open())
    {
        ThrowReadFailure("Failed to open file for hashing", FilePath);
    }

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);
    blake3_hasher_update(&Hasher, &FILE_TAG, sizeof(FILE_TAG));

    std::vector<char> Buffer(HASH_BUFFER_SIZE);
    while (File)
    {
        File.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
        const std::streamsize BytesRead = File.gcount();
        if (BytesRead > 0)
        {
            blake3_hasher_update(&Hasher, Buffer.data(), static_cast<size_t>(BytesRead));
        }
    }

    if (File.bad())
    {
        ThrowReadFailure("Failed while reading file for hashing", FilePath);
    }

    ContentDigest Digest{};
    blake3_hasher_finalize(&Hasher, Digest.data(), Digest.size());
    return Digest;
}

ContentDigest ContentComparator::HashDirectory(const FS::path& DirPath)
{
    std::vector<FS::path> Files;
    for (const auto& Entry : FS::recursive_directory_iterator(DirPath))
    {
        if (Entry.is_regular_file())
        {
            Files.push_back(FS::relative(Entry.path(), DirPath));
        }
    }
    std::sort(Files.begin(), Files.end());

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);
    blake3_hasher_update(&Hasher, &DIRECTORY_TAG, sizeof(DIRECTORY_TAG));

    for (const auto& RelativePath : Files)
    {
        const std::string Name = RelativePath.generic_string();
        blake3_hasher_update(&Hasher, Name.data(), Name.size() + 1); // include the terminator as separator

        const ContentDigest FileDigest = HashFile(DirPath / RelativePath);
        blake3_hasher_update(&Hasher, FileDigest.data(), FileDigest.size());
    }

    ContentDigest Digest{};
    blake3_hasher_finalize(&Hasher, Digest.data(), Digest.size());
    return Digest;
}
