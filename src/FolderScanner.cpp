#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stack>
#include <system_error>

#include "FolderScanner.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string ToLower(std::string Input)
    {
        std::transform(Input.begin(), Input.end(), Input.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Input;
    }
}

FolderScanner::FolderScanner(const RunConfig& Config)
    : Extension(ToLower(Config.ArchiveExtension)), IgnoredFolderName(Config.TempFolderName)
{
}

const std::vector<FS::path>& FolderScanner::GetArchives() const
{
    return Archives;
}

void FolderScanner::Clear()
{
    Archives.clear();
}

bool FolderScanner::IsArchive(const FS::path& Path) const
{
    return ToLower(Path.extension().string()) == Extension;
}

void FolderScanner::Scan(const FS::path& RootPath)
{
    const FS::file_status Status = FS::status(RootPath);

    if (!FS::exists(Status))
    {
        Log.Error("[Scanner] Root folder does not exist: " + RootPath.string());
        throw FS::filesystem_error("Root folder does not exist", RootPath, std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (!FS::is_directory(Status))
    {
        Log.Error("[Scanner] Root folder is not a directory: " + RootPath.string());
        throw FS::filesystem_error("Root folder is not a directory", RootPath, std::make_error_code(std::errc::not_a_directory));
    }

    const size_t FoundBefore = Archives.size();
    ScanDirectoryIterative(RootPath);

    if (Archives.size() == FoundBefore)
    {
        Log.Warning("[Scanner] No " + Extension + " files found under " + RootPath.string());
    }
    else
    {
        Log.Info("[Scanner] Found " + std::to_string(Archives.size() - FoundBefore) + " archive(s) under " + RootPath.string());
    }
}

void FolderScanner::ScanDirectoryIterative(const FS::path& Root)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                try
                {
                    // Skip symbolic links to avoid loops.
                    if (FS::is_symlink(Entry.symlink_status()))
                    {
                        continue;
                    }
                    if (Entry.is_directory())
                    {
                        if (Entry.path().filename() == IgnoredFolderName)
                        {
                            Log.Info(std::string("[Scanner] Skipping extraction folder: ") + Entry.path().string());
                            continue;
                        }
                        DirStack.push(Entry.path());
                    }
                    else if (Entry.is_regular_file() && IsArchive(Entry.path()))
                    {
                        Log.Info(std::string("[Scanner] Found: ") + Entry.path().string());
                        Archives.push_back(Entry.path());
                    }
                }
                catch (const FS::filesystem_error& e)
                {
                    Log.Error(std::string("[Scanner] Filesystem error accessing entry: ") + e.what() + std::string(" Path: ") + Entry.path().string());
                }
            }
        }
        catch (const FS::filesystem_error& e)
        {
            // The root itself must be readable; anything below it is logged and skipped.
            if (Current == Root)
            {
                throw;
            }
            Log.Error(std::string("[Scanner] Filesystem error iterating directory: ") + e.what() + std::string(" Path: ") + Current.string());
        }
    }
}
