// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "reconcile.h"
#include <rbm/file_path.h>
#include "transfer.h"

using namespace rbm;
using namespace robo;


namespace
{
struct ExtraItem
{
    Zstring targetPath;
    AFS::ItemType type = AFS::ItemType::file;
    uint64_t fileSize = 0;
};


class ExtraItemCollector : public AFS::TraverserCallback
{
public:
    ExtraItemCollector(const Zstring& sourceRoot, const JobConfig& cfg, const AbstractFileSystem& afs, std::vector<std::wstring>& warnings) :
        sourceRoot_(sourceRoot), cfg_(cfg), afs_(afs), warnings_(warnings) {}

    //no hidden item or filter exclusion here: existence at source alone decides
    void onFile(const AFS::FileInfo& fi, const Zstring& relPath) override
    {
        if (!existsInSource(relPath))
            extraFiles_.push_back({appendPath(cfg_.targetPath, relPath), AFS::ItemType::file, fi.fileSize});
    }

    void onSymlink(const AFS::SymlinkInfo& si, const Zstring& relPath) override
    {
        if (!existsInSource(relPath))
            extraFiles_.push_back({appendPath(cfg_.targetPath, relPath), AFS::ItemType::symlink, 0});
    }

    AFS::TraverseControl onFolder(const AFS::FolderInfo& fi, const Zstring& relPath) override
    {
        if (!existsInSource(relPath))
        {
            extraFolders_.push_back({appendPath(cfg_.targetPath, relPath), AFS::ItemType::folder, 0});
            return AFS::TraverseControl::skipSubtree; //entirely extraneous
        }
        return cfg_.includeSubfolders ? AFS::TraverseControl::descend : AFS::TraverseControl::skipSubtree;
    }

    void reportDirError(const FileError& e, const Zstring& relPath) override { warnings_.push_back(e.toString()); }

    const std::vector<ExtraItem>& getExtraFiles  () const { return extraFiles_; }
    const std::vector<ExtraItem>& getExtraFolders() const { return extraFolders_; } //in discovery order

private:
    ExtraItemCollector           (const ExtraItemCollector&) = delete;
    ExtraItemCollector& operator=(const ExtraItemCollector&) = delete;

    //map via the relative path: never by substring replacement of the root!
    bool existsInSource(const Zstring& relPath)
    {
        try
        {
            return static_cast<bool>(afs_.getItemTypeIfExists(appendPath(sourceRoot_, relPath))); //throw FileError
        }
        catch (const FileError& e)
        {
            warnings_.push_back(e.toString());
            return true; //when in doubt: keep target item
        }
    }

    const Zstring sourceRoot_;
    const JobConfig& cfg_;
    const AbstractFileSystem& afs_;
    std::vector<std::wstring>& warnings_;

    std::vector<ExtraItem> extraFiles_;
    std::vector<ExtraItem> extraFolders_;
};
}


void robo::reconcileTarget(const Zstring& sourceRoot, const JobConfig& cfg, const AbstractFileSystem& afs,
                           const std::function<void(const OperationOutcome& outcome)>& onOutcome,
                           const std::function<void(const std::wstring& msg, ProcessCallback::MsgType type)>& logMessage)
{
    std::vector<std::wstring> warnings;
    ExtraItemCollector collector(sourceRoot, cfg, afs, warnings);
    try
    {
        if (!afs.getItemTypeIfExists(cfg.targetPath)) //throw FileError; e.g. dry run: target was never created
            return;

        afs.traverseFolderRecursive(cfg.targetPath, collector); //throw FileError
    }
    catch (const FileError& e) { warnings.push_back(e.toString()); }

    for (const std::wstring& msg : warnings)
        logMessage(msg, ProcessCallback::MsgType::warning);

    //1. files and symlinks
    for (const ExtraItem& item : collector.getExtraFiles())
        if (cfg.dryRun)
            onOutcome(OutcomeSkipped{item.targetPath, SkipReason::dryRun, item.fileSize});
        else
            try
            {
                removeFileWithRetry(item.targetPath, item.type, cfg, afs); //throw FileError
                onOutcome(OutcomeDeleted{item.targetPath, false /*isFolder*/});
            }
            catch (const FileError& e) { onOutcome(OutcomeFailed{item.targetPath, e.toString()}); }

    //2. folders: deepest first
    const std::vector<ExtraItem>& extraFolders = collector.getExtraFolders();
    for (auto it = extraFolders.rbegin(); it != extraFolders.rend(); ++it)
        if (cfg.dryRun)
            logMessage(replaceCpy(_("Would delete folder %x"), L"%x", fmtPath(it->targetPath)), ProcessCallback::MsgType::info);
        else
            try
            {
                removeFolderWithRetry(it->targetPath, cfg, afs); //throw FileError
                onOutcome(OutcomeDeleted{it->targetPath, true /*isFolder*/});
            }
            catch (const FileError& e) { logMessage(e.toString(), ProcessCallback::MsgType::warning); } //non-fatal
}
