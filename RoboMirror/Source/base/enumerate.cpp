// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "enumerate.h"
#include <cstdlib>
#include <rbm/file_path.h>

using namespace rbm;
using namespace robo;


namespace
{
//FAT file systems store modification times with 2 second precision, but we don't care
constexpr int64_t FILE_TIME_TOLERANCE_SEC = 1;

inline
bool isHiddenName(const Zstring& itemName) { return !itemName.empty() && itemName[0] == Zstr('.'); }

inline
bool sameFileTime(const timespec& lhs, const timespec& rhs)
{
    const int64_t diffNs = (static_cast<int64_t>(lhs.tv_sec) - rhs.tv_sec) * 1000'000'000 + (lhs.tv_nsec - rhs.tv_nsec);
    return std::llabs(diffNs) <= FILE_TIME_TOLERANCE_SEC * 1000'000'000;
}

inline
bool isOlder(const timespec& lhs, const timespec& rhs)
{
    return lhs.tv_sec != rhs.tv_sec ? lhs.tv_sec < rhs.tv_sec : lhs.tv_nsec < rhs.tv_nsec;
}
}


SourceScanner::SourceScanner(const JobConfig& cfg, const AbstractFileSystem& afs, ScanStatus* status) : //throw ErrorSourceNotFound
    cfg_(cfg),
    afs_(afs),
    status_(status),
    filter_(cfg.includeFiles, cfg.excludeFiles, cfg.excludeFolders)
{
    try
    {
        sourceRoot_ = afs_.getResolvedPath(cfg_.sourcePath); //throw FileError
        readFolder(Zstring()); //throw FileError
    }
    catch (const FileError& e) { throw ErrorSourceNotFound(replaceCpy(_("Cannot read folder %x."), L"%x", fmtPath(cfg_.sourcePath)), e.toString()); }
}


void SourceScanner::readFolder(const Zstring& relPath) //throw FileError
{
    std::vector<Zstring> subFolders;

    afs_.traverseFolder(appendPath(sourceRoot_, relPath),
    [&](const AFS::FileInfo& fi)
    {
        if (status_) ++status_->itemsScanned;

        if (!fi.isRegular) //pipes, devices and sockets would block or fail on open()
            return;
        if (cfg_.skipHidden && isHiddenName(fi.itemName))
            return;

        const Zstring& relPathFile = appendPath(relPath, fi.itemName);
        pendingFiles_.push_back({appendPath(sourceRoot_, relPathFile), relPathFile, fi.fileSize, fi.modTime});
    },
    [&](const AFS::FolderInfo& fi)
    {
        if (status_) ++status_->itemsScanned;

        if (cfg_.skipHidden && isHiddenName(fi.itemName))
            return;
        if (!filter_.passFolderFilter(fi.itemName)) //prune complete subtree
            return;

        subFolders.push_back(appendPath(relPath, fi.itemName));
    },
    [&](const AFS::SymlinkInfo& /*si*/)
    {
        if (status_) ++status_->itemsScanned; //symlinks are not followed and not copied
    }); //throw FileError

    for (const Zstring& relPathSub : subFolders)
        folders_.push_back(relPathSub);

    if (cfg_.includeSubfolders)
        //reverse: process sub folders in the order they were read
        pendingFolders_.insert(pendingFolders_.end(), subFolders.rbegin(), subFolders.rend());
}


bool SourceScanner::passSizeFilter(uint64_t fileSize) const
{
    if (cfg_.minFileSize && fileSize < *cfg_.minFileSize)
        return false;
    if (cfg_.maxFileSize && fileSize > *cfg_.maxFileSize)
        return false;
    return true;
}


std::optional<SkipReason> SourceScanner::diffAgainstTarget(const CandidateFile& file) const
{
    std::optional<AFS::ItemDetails> targetDetails;
    try
    {
        targetDetails = afs_.getItemDetailsIfExists(appendPath(cfg_.targetPath, file.relPath)); //throw FileError
    }
    catch (FileError&) { return std::nullopt; } //inaccessible target: leave it to the transfer to report the error

    if (!targetDetails || targetDetails->type != AFS::ItemType::file)
        return std::nullopt;

    if (!cfg_.includeSame &&
        targetDetails->fileSize == file.fileSize &&
        sameFileTime(targetDetails->modTime, file.modTime))
        return SkipReason::identical;

    if (cfg_.excludeOlder && !isOlder(targetDetails->modTime, file.modTime))
        return SkipReason::newerAtTarget;

    return std::nullopt;
}


std::optional<ScanItem> SourceScanner::getNext()
{
    for (;;)
    {
        while (!pendingFiles_.empty())
        {
            CandidateFile file = std::move(pendingFiles_.front());
            pendingFiles_.pop_front();

            if (!filter_.passFileFilter(getItemName(file.relPath)) ||
                !passSizeFilter(file.fileSize))
                continue;

            if (status_) ++status_->filesFound;

            const std::optional<SkipReason> skipReason = diffAgainstTarget(file);
            return ScanItem{std::move(file), skipReason};
        }

        if (pendingFolders_.empty())
            return std::nullopt;

        const Zstring relPath = pendingFolders_.back();
        pendingFolders_.pop_back();
        try
        {
            readFolder(relPath); //throw FileError
        }
        catch (const FileError& e) { warnings_.push_back(e.toString()); } //continue with the remaining folders
    }
}


ScanResult robo::scanSource(const JobConfig& cfg, const AbstractFileSystem& afs, ScanStatus* status) //throw ErrorSourceNotFound
{
    SourceScanner scanner(cfg, afs, status); //throw ErrorSourceNotFound

    ScanResult result;
    while (std::optional<ScanItem> item = scanner.getNext())
        if (item->skipReason)
            result.filesSkipped.push_back(std::move(*item));
        else
            result.filesToCopy.push_back(std::move(item->file));

    result.sourceRoot = scanner.getSourceRoot();
    result.warnings   = scanner.getWarnings();

    if (cfg.includeSubfolders)
        result.folders = scanner.getFolders();
    return result;
}
