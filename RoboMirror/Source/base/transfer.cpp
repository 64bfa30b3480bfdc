// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "transfer.h"
#include <algorithm>
#include <cstddef>
#include <rbm/thread.h>
#include <rbm/file_path.h>

using namespace rbm;
using namespace robo;


namespace
{
//owned by a single transfer; never shared
struct TransferState
{
    uint64_t bytesWritten = 0;
    uint64_t bytesTotal = 0;
    int attempt = 0;
};


template <class Function> inline
void runWithRetry(int retryCount, std::chrono::milliseconds retryWait, Function fun) //throw FileError
{
    const int attemptsMax = std::max(retryCount, 1); //at least once
    for (int attempt = 1;; ++attempt)
        try
        {
            fun(); //throw FileError
            return;
        }
        catch (FileError&)
        {
            if (attempt >= attemptsMax)
                throw;
            interruptibleSleep(retryWait); //throw ThreadStopRequest
        }
}


void streamFileData(const CandidateFile& file, const Zstring& partialPath, uint64_t resumeOffset, bool resumable, //throw FileError
                    const AbstractFileSystem& afs, TransferState& state, const TransferProgress& onProgress)
{
    const std::unique_ptr<AFS::InputStream> streamIn = afs.getInputStream(file.sourcePath, resumeOffset); //throw FileError, ErrorFileLocked, ErrorPermissionDenied

    const std::unique_ptr<AFS::OutputStream> streamOut = afs.getOutputStream(partialPath, resumable ? //throw FileError, ErrorTargetExisting, ErrorPermissionDenied
                                                                             FileOutputMode::appendResumable :
                                                                             FileOutputMode::createNew);
    std::vector<std::byte> buffer(TRANSFER_CHUNK_SIZE);

    state.bytesWritten = resumeOffset;
    while (state.bytesWritten < state.bytesTotal)
    {
        interruptionPoint(); //throw ThreadStopRequest

        //never write beyond the expected size: partial artifact <= source size
        const size_t chunkSize = static_cast<size_t>(std::min<uint64_t>(TRANSFER_CHUNK_SIZE, state.bytesTotal - state.bytesWritten));

        size_t bytesRead = 0;
        while (bytesRead < chunkSize)
        {
            const size_t bytesReadNow = streamIn->tryRead(buffer.data() + bytesRead, chunkSize - bytesRead); //throw FileError, ErrorFileLocked
            if (bytesReadNow == 0) //source was truncated in the meantime
                throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(file.sourcePath)),
                                replaceCpy(replaceCpy(_("Unexpected end of file after %x of %y bytes."),
                                                      L"%x", numberTo<std::wstring>(state.bytesWritten + bytesRead)),
                                           L"%y", numberTo<std::wstring>(state.bytesTotal)));
            bytesRead += bytesReadNow;
        }

        streamOut->write(buffer.data(), chunkSize); //throw FileError
        state.bytesWritten += chunkSize;

        if (onProgress) onProgress(state.bytesWritten, state.bytesTotal);
    }

    streamOut->finalize(); //throw FileError
}


void copyFileAttempt(const CandidateFile& file, const Zstring& targetPath, const JobConfig& cfg, const AbstractFileSystem& afs, //throw FileError
                     TransferState& state, const TransferProgress& onProgress)
{
    const Zstring partialPath = targetPath + PARTIAL_FILE_ENDING;

    state.bytesTotal   = file.fileSize;
    state.bytesWritten = 0;

    std::optional<uint64_t> resumeOffset; //set: resumable partial artifact found
    if (const std::optional<AFS::ItemDetails> partialDetails = afs.getItemDetailsIfExists(partialPath)) //throw FileError
    {
        if (cfg.resumePartial &&
            partialDetails->type == AFS::ItemType::file &&
            partialDetails->fileSize < file.fileSize)
            resumeOffset = partialDetails->fileSize;
        else //stale
            afs.removeFilePlain(partialPath); //throw FileError
    }

    if (!resumeOffset && file.fileSize < SMALL_FILE_THRESHOLD)
        state.bytesWritten = afs.copyNewFile(file.sourcePath, partialPath, [&](int64_t bytesDelta) //throw FileError, ErrorTargetExisting, ErrorFileLocked
    {
        state.bytesWritten += bytesDelta;
        if (onProgress) onProgress(state.bytesWritten, state.bytesTotal);
    });
    else
        streamFileData(file, partialPath, resumeOffset ? *resumeOffset : 0, cfg.resumePartial, afs, state, onProgress); //throw FileError

    //failure to copy attributes fails the transfer; the complete partial file is discarded by the next attempt
    //order: user.* xattrs need write access => set permissions last
    if (cfg.copyXattr)
        afs.copyExtendedAttributes(file.sourcePath, partialPath); //throw FileError
    if (cfg.copyTimestamps)
        afs.copyFileTimes(file.sourcePath, partialPath); //throw FileError
    if (cfg.copyPermissions)
        afs.copyPermissions(file.sourcePath, partialPath); //throw FileError

    if (const std::optional<AFS::ItemType> targetType = afs.getItemTypeIfExists(targetPath)) //throw FileError
        switch (*targetType)
        {
            case AFS::ItemType::file:
                afs.removeFilePlain(targetPath); //throw FileError
                break;
            case AFS::ItemType::symlink:
                afs.removeSymlinkPlain(targetPath); //throw FileError
                break;
            case AFS::ItemType::folder: //rename() fails with a clear error message
                break;
        }

    //the target path becomes visible only now
    afs.moveAndRenameItem(partialPath, targetPath); //throw FileError, ErrorMoveUnsupported
}
}


TransferResult robo::transferFile(const CandidateFile& file, const Zstring& targetPath, //throw ThreadStopRequest
                                  const JobConfig& cfg, const AbstractFileSystem& afs,
                                  const TransferProgress& onProgress)
{
    TransferResult result;

    if (cfg.dryRun)
    {
        result.outcome = OutcomeSkipped{file.sourcePath, SkipReason::dryRun, file.fileSize};
        return result;
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(targetPath))
        try
        {
            result.foldersCreated = afs.createFolderIfMissingRecursion(*parentPath); //throw FileError
        }
        catch (const FileError& e)
        {
            result.outcome = OutcomeFailed{file.sourcePath, e.toString()};
            return result;
        }

    TransferState state;
    const int attemptsMax = std::max(cfg.retryCount, 1); //at least once
    for (state.attempt = 1;; ++state.attempt)
        try
        {
            copyFileAttempt(file, targetPath, cfg, afs, state, onProgress); //throw FileError
            break;
        }
        catch (const FileError& e)
        {
            if (state.attempt >= attemptsMax)
            {
                result.outcome = OutcomeFailed{file.sourcePath, e.toString()};
                return result;
            }
            interruptibleSleep(cfg.retryWait); //throw ThreadStopRequest
        }

    result.outcome = OutcomeCopied{file.sourcePath, targetPath, state.bytesWritten}; //size may have changed since enumeration

    //source deletion failure does not undo the copy
    if (moveRequested(cfg))
        try
        {
            removeFileWithRetry(file.sourcePath, AFS::ItemType::file, cfg, afs); //throw FileError
        }
        catch (const FileError& e) { result.warnings.push_back(e.toString()); }

    return result;
}


void robo::removeFileWithRetry(const Zstring& filePath, AFS::ItemType type, const JobConfig& cfg, const AbstractFileSystem& afs) //throw FileError
{
    runWithRetry(cfg.deleteRetryCount, cfg.deleteRetryWait, [&] //throw FileError
    {
        if (!afs.getItemTypeIfExists(filePath)) //throw FileError; deleted by previous attempt or externally
            return;

        if (type == AFS::ItemType::symlink)
            afs.removeSymlinkPlain(filePath); //throw FileError
        else
            afs.removeFilePlain(filePath); //throw FileError
    });
}


void robo::removeFolderWithRetry(const Zstring& folderPath, const JobConfig& cfg, const AbstractFileSystem& afs) //throw FileError
{
    runWithRetry(cfg.deleteRetryCount, cfg.deleteRetryWait, [&] //throw FileError
    {
        if (afs.getItemTypeIfExists(folderPath)) //throw FileError
            afs.removeFolderRecursion(folderPath); //throw FileError
    });
}
