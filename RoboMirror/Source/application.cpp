// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include <iostream>
#include <optional>
#include <rbm/extra_log.h>
#include "afs/native.h"
#include "base/copy_engine.h"
#include "base/return_codes.h"
#include "cmd_line.h"
#include "console_status_handler.h"
#include "log_file.h"

using namespace rbm;
using namespace robo;


namespace
{
const wchar_t appName[] = L"RoboMirror";


void logFatalError(const std::wstring& msg, const std::wstring& title)
{
    std::cerr << utfTo<std::string>(std::wstring(appName) + L" - " + title + L" - " + msg) << '\n';
}


RoboReturnCode runApplication(const std::vector<Zstring>& commandArgs)
{
    CommandLineConfig cmdCfg;
    try
    {
        cmdCfg = parseCommandLine(commandArgs); //throw SysError
    }
    catch (const SysError& e)
    {
        //error handling strategy unknown and no log output available at this point!
        logFatalError(e.toString() + L"\n" + _("Use --help for the list of options."), _("Syntax error"));
        return RBM_RC_ABORTED;
    }

    if (cmdCfg.showHelp)
    {
        std::cout << utfTo<std::string>(getSyntaxHelp());
        return RBM_RC_SUCCESS;
    }

    ConsoleStatusHandler statusHandler(cmdCfg.verbosity);
    const JobConfig& cfg = cmdCfg.job;

    statusHandler.logMessage(replaceCpy(replaceCpy(_("Source: %x, target: %y"), L"%x", fmtPath(cfg.sourcePath)), L"%y", fmtPath(cfg.targetPath)),
                             ProcessCallback::MsgType::info);
    if (cfg.dryRun)
        statusHandler.logMessage(_("List only: no items will be changed."), ProcessCallback::MsgType::info);

    const NativeFileSystem afs;
    std::optional<RunResult> result;
    try
    {
        result = runCopyJob(cfg, afs, statusHandler); //throw FileError
    }
    catch (const FileError& e) { statusHandler.reportFatalError(e.toString()); } //setup error: nothing was transferred

    if (result && cmdCfg.verbosity != Verbosity::quiet)
        std::cout << '\n' << utfTo<std::string>(result->formatSummary());

    const time_t startTime = result ? result->getStartTime() : std::time(nullptr);
    ConsoleStatusHandler::Result handlerResult = statusHandler.prepareResult();

    RoboReturnCode returnCode = mapToReturnCode(handlerResult.finalStatus);
    if (result && result->getFilesFailed() > 0)
        raiseReturnCode(returnCode, RBM_RC_ERROR);

    if (!cmdCfg.logFilePath.empty())
        try
        {
            const LogSummary summary{cfg.sourcePath, cfg.targetPath, startTime, handlerResult.finalStatus};
            saveLogFile(cmdCfg.logFilePath, cmdCfg.logAppend, summary, handlerResult.errorLog, result ? &*result : nullptr); //throw FileError
        }
        catch (const FileError& e)
        {
            std::cerr << utfTo<std::string>(e.toString()) << '\n';
            raiseReturnCode(returnCode, RBM_RC_ERROR);
        }

    //errors from clean-up after the log was prepared
    for (const LogEntry& entry : fetchExtraLog())
        std::cerr << formatMessage(entry) << '\n';

    return returnCode;
}
}


int main(int argc, char* argv[])
{
    std::vector<Zstring> commandArgs;
    for (int i = 1; i < argc; ++i)
        commandArgs.push_back(argv[i]);

    try
    {
        return runApplication(commandArgs);
    }
    catch (const std::bad_alloc& e) //the only kind of exception we don't want crash dumps for
    {
        logFatalError(utfTo<std::wstring>(std::string_view(e.what())), _("Out of memory."));
        return RBM_RC_EXCEPTION;
    }
    catch (const std::exception& e)
    {
        logFatalError(utfTo<std::wstring>(std::string_view(e.what())), _("An exception occurred"));
        return RBM_RC_EXCEPTION;
    }
}
