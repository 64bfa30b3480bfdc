// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef LOG_FILE_H_8820193746510293
#define LOG_FILE_H_8820193746510293

#include <rbm/error_log.h>
#include "base/run_result.h"
#include "base/return_codes.h"


namespace robo
{
struct LogSummary
{
    Zstring sourcePath;
    Zstring targetPath;
    time_t startTime = 0;
    CopyResult finalStatus = CopyResult::finishedSuccess;
};

//header box + log entries + run summary
std::string generateLogText(const LogSummary& summary, const rbm::ErrorLog& log, const RunResult* result /*optional: nullptr if the run did not start*/);

//append == true: keep the content of an existing log file
void saveLogFile(const Zstring& logFilePath, bool append, //throw FileError
                 const LogSummary& summary, const rbm::ErrorLog& log, const RunResult* result);
}

#endif //LOG_FILE_H_8820193746510293
