// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef STRUCTURES_H_2093847560192837
#define STRUCTURES_H_2093847560192837

#include <chrono>
#include <ctime>
#include <optional>
#include <variant>
#include <vector>
#include <rbm/zstring.h>
#include <rbm/file_error.h>
#include "../afs/abstract.h"


namespace robo
{
//setup errors: abort the run before the first transfer
DEFINE_NEW_FILE_ERROR(ErrorSourceNotFound)
DEFINE_NEW_FILE_ERROR(ErrorSourceNotFolder)
DEFINE_NEW_FILE_ERROR(ErrorTargetCreation)
DEFINE_NEW_FILE_ERROR(ErrorInvalidThreadCount)
DEFINE_NEW_FILE_ERROR(ErrorInvalidRetryCount)


struct JobConfig
{
    Zstring sourcePath;
    Zstring targetPath;

    bool includeSubfolders   = true;
    bool includeEmptyFolders = true;
    bool skipHidden = true; //names starting with "."

    bool mirror = false; //copy + delete extra target items
    bool purge  = false; //delete extra target items

    bool excludeOlder = false; //skip if target is not older than source
    bool excludeExtra = false; //never delete extra target items
    bool includeSame  = false; //copy even if identical

    int retryCount = 3; //total attempts; 0 is treated as 1
    std::chrono::seconds retryWait{5};

    int threadCount = 8; //maximum number of parallel transfers

    bool resumePartial = true;

    //glob patterns: '*' and '?' only, matched case-insensitively against the item name
    std::vector<Zstring> includeFiles; //empty: all files
    std::vector<Zstring> excludeFiles;
    std::vector<Zstring> excludeFolders; //excludes the whole subtree

    std::optional<uint64_t> minFileSize; //[bytes]
    std::optional<uint64_t> maxFileSize; //

    bool copyTimestamps = true;
    bool copyPermissions = true;
    bool copyXattr = true;

    bool moveFiles = false; //delete source files after copy
    bool moveAll   = false; //also remove emptied source folders

    bool dryRun = false; //list only

    int deleteRetryCount = 3;
    std::chrono::milliseconds deleteRetryWait{1000};
};

//read-only after success
void validateConfig(const JobConfig& cfg, const AbstractFileSystem& afs); //throw ErrorSourceNotFound, ErrorSourceNotFolder, ErrorInvalidThreadCount, ErrorInvalidRetryCount, FileError

inline bool reconcileRequested(const JobConfig& cfg) { return (cfg.mirror || cfg.purge) && !cfg.excludeExtra; }

inline bool moveRequested(const JobConfig& cfg) { return cfg.moveFiles || cfg.moveAll; }

//----------------------------------------------------------------------------------------------

struct CandidateFile
{
    Zstring sourcePath;
    Zstring relPath; //relative to the resolved source root: computed once, never re-derived!
    uint64_t fileSize = 0;
    timespec modTime = {};
};


enum class SkipReason
{
    identical,
    newerAtTarget,
    excludedByFilter,
    sizeOutOfRange,
    dryRun,
};
std::wstring getSkipReasonLabel(SkipReason reason);


struct OutcomeCopied
{
    Zstring sourcePath;
    Zstring targetPath;
    uint64_t bytes = 0;
};

struct OutcomeSkipped
{
    Zstring sourcePath;
    SkipReason reason = SkipReason::identical;
    uint64_t bytes = 0;
};

struct OutcomeDeleted
{
    Zstring path;
    bool isFolder = false;
};

struct OutcomeFailed
{
    Zstring path;
    std::wstring errorMsg;
};

struct OutcomeFolderCreated
{
    Zstring path;
};

//exactly one per attempted file or folder action
using OperationOutcome = std::variant<OutcomeCopied,
      OutcomeSkipped,
      OutcomeDeleted,
      OutcomeFailed,
      OutcomeFolderCreated>;
}

#endif //STRUCTURES_H_2093847560192837
