#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

class ExtractionError : public std::runtime_error
{
public:
    explicit ExtractionError(const std::string& Message) : std::runtime_error(Message) {}
};

class ArchiveExtractor
{
public:
    // Expands every entry of ArchivePath below Destination, creating Destination if needed.
    // Entries (and hardlink targets) with absolute paths or ".." components are skipped. Throws ExtractionError.
    static size_t ExtractAll(const std::filesystem::path& ArchivePath, const std::filesystem::path& Destination);

private:
    static bool IsSafeEntryPath(const std::string& EntryPath);
};
