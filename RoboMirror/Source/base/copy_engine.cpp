// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "copy_engine.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <rbm/thread.h>
#include <rbm/file_path.h>
#include "enumerate.h"
#include "transfer.h"
#include "reconcile.h"

using namespace rbm;
using namespace robo;


namespace
{
//actor pattern: workers post finished transfers, the coordinating thread applies them
class AsyncCallback
{
public:
    //non-blocking: context of worker thread
    void updateDataProcessed(int64_t bytesDelta) { bytesDeltaProcessed_ += bytesDelta; } //noexcept!

    //context of worker thread
    void reportFinished(TransferResult&& result)
    {
        {
            std::lock_guard dummy(lockResult_);
            finished_.push_back(std::move(result));
        }
        conditionNewResult_.notify_all();
    }

    //context of worker thread: unexpected error, e.g. std::bad_alloc
    void reportException(std::exception_ptr e)
    {
        {
            std::lock_guard dummy(lockResult_);
            if (!exception_)
                exception_ = e;
        }
        conditionNewResult_.notify_all();
    }

    //context of coordinating thread: wait for at least one result or timeout
    std::vector<TransferResult> fetchFinished(std::chrono::milliseconds timeout)
    {
        std::unique_lock dummy(lockResult_);
        conditionNewResult_.wait_for(dummy, timeout, [this] { return !finished_.empty() || exception_; });

        if (exception_)
            std::rethrow_exception(exception_);

        std::vector<TransferResult> results;
        results.swap(finished_);
        return results;
    }

    //context of coordinating thread
    int64_t fetchBytesProcessed() { return bytesDeltaProcessed_.exchange(0); }

private:
    std::mutex lockResult_;
    std::vector<TransferResult> finished_;
    std::exception_ptr exception_;
    std::condition_variable conditionNewResult_;

    std::atomic<int64_t> bytesDeltaProcessed_{0};
};


void ensureTargetExists(const JobConfig& cfg, const AbstractFileSystem& afs, const std::function<void(const OperationOutcome& outcome)>& applyOutcome) //throw ErrorTargetCreation
{
    std::vector<Zstring> foldersCreated;
    try
    {
        if (const std::optional<AFS::ItemType> type = afs.getItemTypeIfExists(cfg.targetPath)) //throw FileError
        {
            if (*type == AFS::ItemType::folder ||
                (*type == AFS::ItemType::symlink && afs.getItemTypeIfExists(afs.getResolvedPath(cfg.targetPath)) == AFS::ItemType::folder)) //throw FileError
                return;

            throw FileError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(cfg.targetPath))));
        }
        foldersCreated = afs.createFolderIfMissingRecursion(cfg.targetPath); //throw FileError
    }
    catch (const FileError& e) { throw ErrorTargetCreation(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(cfg.targetPath)), e.toString()); }

    for (const Zstring& folderPath : foldersCreated)
        applyOutcome(OutcomeFolderCreated{folderPath});
}


ScanResult enumerateSource(const JobConfig& cfg, const AbstractFileSystem& afs, ProcessCallback& callback) //throw ErrorSourceNotFound, X
{
    ScanStatus status;

    //status updates are interleaved with the folder walk
    std::future<ScanResult> futScan = runAsync([&cfg, &afs, &status] { return scanSource(cfg, afs, &status); });

    while (futScan.wait_for(UI_UPDATE_INTERVAL) != std::future_status::ready)
        callback.reportScanProgress(status.itemsScanned, status.filesFound); //throw X

    callback.reportScanProgress(status.itemsScanned, status.filesFound); //throw X
    return futScan.get(); //throw ErrorSourceNotFound
}


void createSourceFolders(const ScanResult& scan, const JobConfig& cfg, const AbstractFileSystem& afs,
                         const std::function<void(const OperationOutcome& outcome)>& applyOutcome)
{
    for (const Zstring& relPath : scan.folders) //parents first
    {
        const Zstring& targetFolderPath = appendPath(cfg.targetPath, relPath);
        try
        {
            for (const Zstring& folderPath : afs.createFolderIfMissingRecursion(targetFolderPath)) //throw FileError
                applyOutcome(OutcomeFolderCreated{folderPath});
        }
        catch (const FileError& e) { applyOutcome(OutcomeFailed{targetFolderPath, e.toString()}); }
    }
}


void transferAll(const std::vector<CandidateFile>& files, const JobConfig& cfg, const AbstractFileSystem& afs, ProcessCallback& callback, //throw X
                 const std::function<void(const OperationOutcome& outcome)>& applyOutcome)
{
    AsyncCallback acb;
    //declared after "acb": worker threads are stopped and joined before "acb" goes out of scope
    ThreadGroup<std::function<void()>> tg(cfg.threadCount, Zstr("Transfer"));

    const size_t threadCount = cfg.threadCount;
    size_t nextPos = 0;
    size_t activeCount = 0; //dispatched, but not yet applied

    auto dispatchNext = [&]
    {
        const CandidateFile& file = files[nextPos++];
        ++activeCount;

        tg.run([&file, &cfg, &afs, &acb]
        {
            const Zstring& targetPath = appendPath(cfg.targetPath, file.relPath);
            try
            {
                acb.reportFinished(transferFile(file, targetPath, cfg, afs, //throw ThreadStopRequest
                                                [&acb, bytesReported = uint64_t(0)](uint64_t bytesWritten, uint64_t /*bytesTotal*/) mutable
                {
                    acb.updateDataProcessed(static_cast<int64_t>(bytesWritten) - static_cast<int64_t>(bytesReported));
                    bytesReported = bytesWritten;
                }));
            }
            catch (ThreadStopRequest&) { throw; }
            catch (...) { acb.reportException(std::current_exception()); } //forward to coordinating thread
        });
    };

    //self-refilling pipeline: never more than "threadCount" transfers in flight
    while (activeCount < threadCount && nextPos < files.size())
        dispatchNext();

    int itemsDone = 0;
    int64_t bytesDone = 0;

    while (activeCount > 0)
    {
        std::vector<TransferResult> results = acb.fetchFinished(UI_UPDATE_INTERVAL); //throw (forwarded worker exception)

        for (TransferResult& result : results)
        {
            --activeCount;
            ++itemsDone;

            for (const Zstring& folderPath : result.foldersCreated)
                applyOutcome(OutcomeFolderCreated{folderPath});

            applyOutcome(result.outcome);

            for (const std::wstring& msg : result.warnings)
                callback.logMessage(msg, ProcessCallback::MsgType::warning); //throw X

            if (nextPos < files.size())
                dispatchNext();
        }

        bytesDone += acb.fetchBytesProcessed();
        callback.updateProgress(itemsDone, bytesDone); //throw X
    }
}


//move all: source folders emptied by the transfer are removed, deepest first
void removeEmptiedSourceFolders(const ScanResult& scan, const AbstractFileSystem& afs, ProcessCallback& callback) //throw X
{
    for (auto it = scan.folders.rbegin(); it != scan.folders.rend(); ++it)
    {
        const Zstring& folderPath = appendPath(scan.sourceRoot, *it);
        try
        {
            bool folderEmpty = true;
            afs.traverseFolder(folderPath,
            [&](const AFS::FileInfo&    /*fi*/) { folderEmpty = false; },
            [&](const AFS::FolderInfo&  /*fi*/) { folderEmpty = false; },
            [&](const AFS::SymlinkInfo& /*si*/) { folderEmpty = false; }); //throw FileError

            if (folderEmpty) //still containing excluded items: keep
                afs.removeFolderPlain(folderPath); //throw FileError
        }
        catch (const FileError& e) { callback.logMessage(e.toString(), ProcessCallback::MsgType::warning); } //throw X
    }
}
}


RunResult robo::runCopyJob(const JobConfig& cfg, const AbstractFileSystem& afs, ProcessCallback& callback) //throw FileError, X
{
    validateConfig(cfg, afs); //throw ErrorSourceNotFound, ErrorSourceNotFolder, ErrorInvalidThreadCount, ErrorInvalidRetryCount, FileError

    RunResult result;

    //single aggregation point
    auto applyOutcome = [&](const OperationOutcome& outcome)
    {
        result.record(outcome);
        callback.reportOutcome(outcome); //throw X
    };

    if (!cfg.dryRun)
        ensureTargetExists(cfg, afs, applyOutcome); //throw ErrorTargetCreation

    callback.initNewPhase(0, 0, ProcessPhase::scan); //throw X
    const ScanResult scan = enumerateSource(cfg, afs, callback); //throw ErrorSourceNotFound, X

    for (const std::wstring& msg : scan.warnings)
        callback.logMessage(msg, ProcessCallback::MsgType::warning); //throw X

    for (const ScanItem& item : scan.filesSkipped)
        applyOutcome(OutcomeSkipped{item.file.sourcePath, *item.skipReason, item.file.fileSize});

    if (cfg.includeEmptyFolders && !cfg.dryRun)
        createSourceFolders(scan, cfg, afs, applyOutcome);

    int64_t bytesTotal = 0;
    for (const CandidateFile& file : scan.filesToCopy)
        bytesTotal += file.fileSize;

    callback.initNewPhase(static_cast<int>(scan.filesToCopy.size()), bytesTotal, ProcessPhase::transfer); //throw X
    transferAll(scan.filesToCopy, cfg, afs, callback, applyOutcome); //throw X

    if (cfg.moveAll && !cfg.dryRun)
        removeEmptiedSourceFolders(scan, afs, callback); //throw X

    if (reconcileRequested(cfg))
    {
        callback.initNewPhase(0, 0, ProcessPhase::reconcile); //throw X
        reconcileTarget(scan.sourceRoot, cfg, afs, applyOutcome,
                        [&](const std::wstring& msg, ProcessCallback::MsgType type) { callback.logMessage(msg, type); }); //throw X
    }

    result.finish();
    return result;
}
