#include "ArchiveExtractor.hpp"
#include "Logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace FS = std::filesystem;

namespace
{
    using ArchiveReadPtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
    using ArchiveWritePtr = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

    constexpr size_t READ_BLOCK_SIZE = 10240;

    std::string ErrorString(struct archive* Archive)
    {
        const char* Message = archive_error_string(Archive);
        return Message ? std::string(Message) : std::string("unknown libarchive error");
    }
}

bool ArchiveExtractor::IsSafeEntryPath(const std::string& EntryPath)
{
    if (EntryPath.empty())
    {
        return false;
    }

    FS::path Normalized = FS::path(EntryPath).lexically_normal();
    if (Normalized.is_absolute() || Normalized.has_root_name() || Normalized.has_root_directory())
    {
        return false;
    }

    for (const auto& Part : Normalized)
    {
        if (Part == "..")
        {
            return false;
        }
    }
    return true;
}

size_t ArchiveExtractor::ExtractAll(const FS::path& ArchivePath, const FS::path& Destination)
{
    std::error_code ec;
    FS::create_directories(Destination, ec);
    if (ec)
    {
        throw ExtractionError("Failed to create extraction folder " + Destination.string() + ": " + ec.message());
    }

    ArchiveReadPtr In(archive_read_new(), &archive_read_free);
    ArchiveWritePtr Out(archive_write_disk_new(), &archive_write_free);
    if (!In || !Out)
    {
        throw ExtractionError("Failed to initialize libarchive extraction.");
    }

    archive_read_support_filter_all(In.get());
    // Formats are listed explicitly; format_all would also accept mtree text files.
    archive_read_support_format_zip(In.get());
    archive_read_support_format_7zip(In.get());
    archive_read_support_format_tar(In.get());
    archive_read_support_format_rar(In.get());
    archive_write_disk_set_options(Out.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(Out.get());

    const std::string ArchiveName = ArchivePath.string();
    if (archive_read_open_filename(In.get(), ArchiveName.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK)
    {
        throw ExtractionError("Failed to open archive " + ArchiveName + ": " + ErrorString(In.get()));
    }

    size_t EntriesWritten = 0;
    struct archive_entry* Entry = nullptr;
    int Result = ARCHIVE_OK;

    while ((Result = archive_read_next_header(In.get(), &Entry)) == ARCHIVE_OK || Result == ARCHIVE_WARN)
    {
        const char* RawName = archive_entry_pathname(Entry);
        const std::string EntryName = RawName ? RawName : "";

        if (!IsSafeEntryPath(EntryName))
        {
            Log.Warning(std::string("[ArchiveExtractor] Skipping unsafe entry '") + EntryName + "' in " + ArchiveName);
            archive_read_data_skip(In.get());
            continue;
        }

        // Hardlink targets are archive-relative too and must stay inside Destination.
        const char* RawLink = archive_entry_hardlink(Entry);
        const std::string LinkName = RawLink ? RawLink : "";
        if (!LinkName.empty() && !IsSafeEntryPath(LinkName))
        {
            Log.Warning(std::string("[ArchiveExtractor] Skipping unsafe hardlink '") + EntryName + "' -> '" + LinkName + "' in " + ArchiveName);
            archive_read_data_skip(In.get());
            continue;
        }

        const std::string TargetPath = (Destination / FS::path(EntryName).lexically_normal()).string();
        archive_entry_set_pathname(Entry, TargetPath.c_str());
        if (!LinkName.empty())
        {
            const std::string LinkPath = (Destination / FS::path(LinkName).lexically_normal()).string();
            archive_entry_set_hardlink(Entry, LinkPath.c_str());
        }

        if (archive_write_header(Out.get(), Entry) < ARCHIVE_WARN)
        {
            throw ExtractionError("Failed to create " + TargetPath + ": " + ErrorString(Out.get()));
        }

        if (archive_entry_filetype(Entry) != AE_IFDIR)
        {
            const void* Buffer = nullptr;
            size_t Size = 0;
            la_int64_t Offset = 0;

            while (true)
            {
                int BlockResult = archive_read_data_block(In.get(), &Buffer, &Size, &Offset);
                if (BlockResult == ARCHIVE_EOF)
                {
                    break;
                }
                if (BlockResult < ARCHIVE_WARN)
                {
                    throw ExtractionError("Failed to read entry '" + EntryName + "' from " + ArchiveName + ": " + ErrorString(In.get()));
                }
                if (archive_write_data_block(Out.get(), Buffer, Size, Offset) < ARCHIVE_WARN)
                {
                    throw ExtractionError("Failed to write " + TargetPath + ": " + ErrorString(Out.get()));
                }
            }
        }

        if (archive_write_finish_entry(Out.get()) < ARCHIVE_WARN)
        {
            throw ExtractionError("Failed to finish " + TargetPath + ": " + ErrorString(Out.get()));
        }
        ++EntriesWritten;
    }

    if (Result != ARCHIVE_EOF)
    {
        throw ExtractionError("Failed to read archive " + ArchiveName + ": " + ErrorString(In.get()));
    }

    if (archive_write_close(Out.get()) != ARCHIVE_OK)
    {
        throw ExtractionError("Failed to finalize extraction of " + ArchiveName + ": " + ErrorString(Out.get()));
    }
    archive_read_close(In.get());

    return EntriesWritten;
}
