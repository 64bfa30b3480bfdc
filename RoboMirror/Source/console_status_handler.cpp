// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "console_status_handler.h"
#include <stdexcept>
#include <rbm/extra_log.h>
#include <rbm/file_path.h>
#include <rbm/format_unit.h>

using namespace rbm;
using namespace robo;


namespace
{
//scan and transfer status in verbose mode: not more often than this
constexpr std::chrono::seconds STATUS_PRINT_INTERVAL(5);


MessageType mapMessageType(ProcessCallback::MsgType type)
{
    switch (type)
    {
        case ProcessCallback::MsgType::info:
            return MSG_TYPE_INFO;
        case ProcessCallback::MsgType::warning:
            return MSG_TYPE_WARNING;
        case ProcessCallback::MsgType::error:
            return MSG_TYPE_ERROR;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
}


ConsoleStatusHandler::ConsoleStatusHandler(Verbosity verbosity, std::ostream& out, std::ostream& err) :
    verbosity_(verbosity),
    out_(out),
    err_(err) {}


void ConsoleStatusHandler::initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId)
{
    currentPhase_ = phaseId;
    itemsTotal_ = itemsTotal;
    bytesTotal_ = bytesTotal;
    lastStatusPrint_ = std::chrono::steady_clock::now();

    switch (phaseId)
    {
        case ProcessPhase::none:
            break;
        case ProcessPhase::scan:
            logMessage(_("Scanning source folder..."), MsgType::info);
            break;
        case ProcessPhase::transfer:
            logMessage(replaceCpy(_P("Copying 1 file (%y)...", "Copying %x files (%y)...", itemsTotal),
                                  L"%y", formatFilesizeShort(bytesTotal)), MsgType::info);
            break;
        case ProcessPhase::reconcile:
            logMessage(_("Removing extra items at target..."), MsgType::info);
            break;
    }
}


void ConsoleStatusHandler::reportScanProgress(int itemsScanned, int filesFound)
{
    if (verbosity_ != Verbosity::verbose)
        return;

    const auto now = std::chrono::steady_clock::now();
    if (now >= lastStatusPrint_ + STATUS_PRINT_INTERVAL)
    {
        lastStatusPrint_ = now;
        out_ << utfTo<std::string>(replaceCpy(replaceCpy(_("Scanned: %x items, %y files to process"), L"%x", formatNumber(itemsScanned)),
                                              L"%y", formatNumber(filesFound))) << std::endl;
    }
}


void ConsoleStatusHandler::updateProgress(int itemsDone, int64_t bytesDone)
{
    if (verbosity_ != Verbosity::verbose)
        return;

    const auto now = std::chrono::steady_clock::now();
    if (now >= lastStatusPrint_ + STATUS_PRINT_INTERVAL)
    {
        lastStatusPrint_ = now;

        std::wstring status = replaceCpy(replaceCpy(_("Progress: %x of %y files"), L"%x", formatNumber(itemsDone)), L"%y", formatNumber(itemsTotal_));
        if (bytesTotal_ > 0)
            status += L" (" + formatProgressPercent(static_cast<double>(bytesDone) / bytesTotal_) + L')';

        out_ << utfTo<std::string>(status) << std::endl;
    }
}


void ConsoleStatusHandler::reportOutcome(const OperationOutcome& outcome)
{
    std::visit([&](const auto& o)
    {
        using T = std::decay_t<decltype(o)>;

        if constexpr (std::is_same_v<T, OutcomeCopied>)
            logMessage(L"COPY: " + utfTo<std::wstring>(getItemName(o.sourcePath)) + L" -> " +
                       utfTo<std::wstring>(o.targetPath) + L" (" + formatFilesizeShort(o.bytes) + L')', MsgType::info);

        else if constexpr (std::is_same_v<T, OutcomeSkipped>)
        {
            if (verbosity_ == Verbosity::verbose) //an unchanged tree would flood the log otherwise
                logMessage(L"SKIP: " + utfTo<std::wstring>(getItemName(o.sourcePath)) + L" (" + getSkipReasonLabel(o.reason) + L')', MsgType::info);
        }
        else if constexpr (std::is_same_v<T, OutcomeDeleted>)
            logMessage(L"DELETE: " + utfTo<std::wstring>(o.path), MsgType::info);

        else if constexpr (std::is_same_v<T, OutcomeFailed>)
            logMessage(L"ERROR: " + utfTo<std::wstring>(o.path) + L": " + o.errorMsg, MsgType::error);

        else
        {
            static_assert(std::is_same_v<T, OutcomeFolderCreated>);
            logMessage(L"MKDIR: " + utfTo<std::wstring>(o.path), MsgType::info);
        }
    }, outcome);
}


void ConsoleStatusHandler::logMessage(const std::wstring& msg, MsgType type)
{
    const std::wstring msgFmt = type == MsgType::warning && !startsWith(msg, L"WARNING: ") ? L"WARNING: " + msg : msg;

    logMsg(errorLog_, msgFmt, mapMessageType(type));
    print(msgFmt, type);
}


void ConsoleStatusHandler::reportFatalError(const std::wstring& msg)
{
    aborted_ = true;
    logMsg(errorLog_, msg, MSG_TYPE_ERROR);
    print(msg, MsgType::error);
}


void ConsoleStatusHandler::print(const std::wstring& msg, MsgType type)
{
    switch (type)
    {
        case MsgType::info:
            if (verbosity_ != Verbosity::quiet)
                out_ << utfTo<std::string>(msg) << '\n';
            break;

        case MsgType::warning:
        case MsgType::error:
            out_.flush(); //keep the order of interleaved stdout/stderr lines
            err_ << utfTo<std::string>(msg) << std::endl;
            break;
    }
}


ConsoleStatusHandler::Result ConsoleStatusHandler::prepareResult()
{
    //errors from destructors and scope guards
    const ErrorLog extraLog = fetchExtraLog();
    for (const LogEntry& entry : extraLog)
        print(utfTo<std::wstring>(entry.message), MsgType::error);

    mergeLogs(errorLog_, extraLog);

    const ErrorLogStats logCount = getStats(errorLog_);

    CopyResult finalStatus = CopyResult::finishedSuccess;
    if (aborted_)
        finalStatus = CopyResult::aborted;
    else if (logCount.error > 0)
        finalStatus = CopyResult::finishedError;
    else if (logCount.warning > 0)
        finalStatus = CopyResult::finishedWarning;

    return {finalStatus, std::move(errorLog_)};
}
