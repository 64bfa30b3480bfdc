// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef RUN_RESULT_H_4401928374650192
#define RUN_RESULT_H_4401928374650192

#include <chrono>
#include <ctime>
#include "structures.h"


namespace robo
{
//run-level statistics: mutated only through record(), by a single thread
class RunResult
{
public:
    RunResult();

    void record(const OperationOutcome& outcome);

    //stamps the end time; later calls are ignored
    void finish();
    bool isFinished() const { return static_cast<bool>(endTime_); }

    int getFilesCopied () const { return filesCopied_; }
    int getFilesSkipped() const { return filesSkipped_; }
    int getFilesFailed () const { return filesFailed_; }
    int getFilesDeleted() const { return filesDeleted_; }

    int getFoldersCreated() const { return foldersCreated_; }
    int getFoldersDeleted() const { return foldersDeleted_; }

    uint64_t getBytesCopied () const { return bytesCopied_; }
    uint64_t getBytesSkipped() const { return bytesSkipped_; }

    struct ErrorEntry
    {
        Zstring path;
        std::wstring errorMsg;
    };
    const std::vector<ErrorEntry>& getErrors() const { return errors_; }

    //derived
    int getTotalFiles() const { return filesCopied_ + filesSkipped_ + filesFailed_; }
    std::chrono::milliseconds getDuration() const; //up to now if not yet finished
    double getBytesPerSecond() const;

    time_t getStartTime() const { return startTimeUtc_; }

    //no side effects: can be called any time
    std::wstring formatSummary() const;

    static constexpr size_t ERRORS_DISPLAY_MAX = 10;

private:
    int filesCopied_  = 0;
    int filesSkipped_ = 0;
    int filesFailed_  = 0;
    int filesDeleted_ = 0;

    int foldersCreated_ = 0;
    int foldersDeleted_ = 0;

    uint64_t bytesCopied_  = 0;
    uint64_t bytesSkipped_ = 0;

    std::vector<ErrorEntry> errors_;

    const time_t startTimeUtc_;
    const std::chrono::steady_clock::time_point startTime_;
    std::optional<std::chrono::steady_clock::time_point> endTime_;
};
}

#endif //RUN_RESULT_H_4401928374650192
