#include "WorkItem.hpp"

namespace FS = std::filesystem;

WorkItem WorkItem::FromArchive(const FS::path& ArchivePath, const RunConfig& Config)
{
    WorkItem Item;
    Item.ArchivePath = ArchivePath;
    Item.AccountFolder = ArchivePath.parent_path();
    Item.AccountName = Item.AccountFolder.filename().string();
    Item.TempRoot = Item.AccountFolder / Config.TempFolderName;
    Item.ContentFolder = Item.TempRoot / Config.ContentFolderName;
    return Item;
}

std::string ItemStatusToString(ItemStatus Status)
{
    switch (Status)
    {
    case ItemStatus::Completed:        return "Completed";
    case ItemStatus::NoContent:        return "NoContent";
    case ItemStatus::ExtractionFailed: return "ExtractionFailed";
    case ItemStatus::MergeFailed:      return "MergeFailed";
    case ItemStatus::Crashed:          return "Crashed";
    default:                           return "Unknown";
    }
}

bool ItemResult::IsFailure() const
{
    return Status == ItemStatus::ExtractionFailed || Status == ItemStatus::MergeFailed || Status == ItemStatus::Crashed;
}
