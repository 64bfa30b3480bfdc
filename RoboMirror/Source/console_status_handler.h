// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef CONSOLE_STATUS_HANDLER_H_3381920475610293
#define CONSOLE_STATUS_HANDLER_H_3381920475610293

#include <chrono>
#include <iostream>
#include <rbm/error_log.h>
#include "base/process_callback.h"
#include "base/return_codes.h"


namespace robo
{
enum class Verbosity
{
    quiet,   //errors only
    normal,
    verbose, //+ skipped items, scan progress
};


//command line front end: every event goes to the ErrorLog, the console gets a subset
class ConsoleStatusHandler : public ProcessCallback
{
public:
    ConsoleStatusHandler(Verbosity verbosity, std::ostream& out = std::cout, std::ostream& err = std::cerr); //noexcept!

    void initNewPhase      (int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) override;
    void reportScanProgress(int itemsScanned, int filesFound)                         override;
    void reportOutcome     (const OperationOutcome& outcome)                          override;
    void updateProgress    (int itemsDone, int64_t bytesDone)                         override;
    void logMessage        (const std::wstring& msg, MsgType type)                    override;

    //setup error: the run did not start or was aborted
    void reportFatalError(const std::wstring& msg);

    ProcessPhase getCurrentPhase() const { return currentPhase_; }
    const rbm::ErrorLog& getErrorLog() const { return errorLog_; }

    struct Result
    {
        CopyResult finalStatus = CopyResult::finishedSuccess;
        rbm::ErrorLog errorLog;
    };
    //merges the process-wide extra log; call once after the run
    Result prepareResult();

private:
    void print(const std::wstring& msg, MsgType type);

    const Verbosity verbosity_;
    std::ostream& out_;
    std::ostream& err_;

    rbm::ErrorLog errorLog_;
    bool aborted_ = false;

    ProcessPhase currentPhase_ = ProcessPhase::none;
    int itemsTotal_ = 0;
    int64_t bytesTotal_ = 0;
    std::chrono::steady_clock::time_point lastStatusPrint_;
};
}

#endif //CONSOLE_STATUS_HANDLER_H_3381920475610293
