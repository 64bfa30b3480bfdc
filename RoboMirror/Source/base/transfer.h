// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef TRANSFER_H_6610293847501928
#define TRANSFER_H_6610293847501928

#include <functional>
#include "structures.h"


namespace robo
{
//in-progress transfers are written to "<target>.rbm_partial" and renamed on completion
const Zchar PARTIAL_FILE_ENDING[] = Zstr(".rbm_partial");

constexpr size_t   TRANSFER_CHUNK_SIZE  = 1024 * 1024;
constexpr uint64_t SMALL_FILE_THRESHOLD = 2 * TRANSFER_CHUNK_SIZE; //below: copy as a whole without resume support

//called after each chunk: bytes written to the target so far (including resumed bytes)
using TransferProgress = std::function<void(uint64_t bytesWritten, uint64_t bytesTotal)>;

struct TransferResult
{
    std::vector<Zstring> foldersCreated; //parents first
    OperationOutcome outcome;
    std::vector<std::wstring> warnings; //e.g. source deletion failed after move
};

//- runs on a worker thread: never touches shared state, the caller records the result
//- file errors are returned as OutcomeFailed after all retries are used up
TransferResult transferFile(const CandidateFile& file, const Zstring& targetPath, //throw ThreadStopRequest
                            const JobConfig& cfg, const AbstractFileSystem& afs,
                            const TransferProgress& onProgress /*optional*/);

//retry policy: JobConfig::deleteRetryCount, JobConfig::deleteRetryWait
void removeFileWithRetry  (const Zstring& filePath,   AFS::ItemType type, const JobConfig& cfg, const AbstractFileSystem& afs); //throw FileError
void removeFolderWithRetry(const Zstring& folderPath,                     const JobConfig& cfg, const AbstractFileSystem& afs); //throw FileError
}

#endif //TRANSFER_H_6610293847501928
