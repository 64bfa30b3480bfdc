// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "log_file.h"
#include <algorithm>
#include <rbm/file_access.h>
#include <rbm/file_io.h>
#include <rbm/format_unit.h>

using namespace rbm;
using namespace robo;


namespace
{
std::wstring generateLogHeader(const LogSummary& s, const ErrorLog& log)
{
    //assemble summary box
    std::vector<std::wstring> summary;

    summary.push_back(utfTo<std::wstring>(formatTime(formatDateTimeTag, getLocalTime(s.startTime))) + L"  RoboMirror");
    summary.push_back(L"");
    summary.push_back(TAB_SPACE + getFinalStatusLabel(s.finalStatus));

    const ErrorLogStats logCount = getStats(log);
    if (logCount.error   > 0) summary.push_back(TAB_SPACE + _("Errors:")   + L' ' + formatNumber(logCount.error));
    if (logCount.warning > 0) summary.push_back(TAB_SPACE + _("Warnings:") + L' ' + formatNumber(logCount.warning));

    summary.push_back(TAB_SPACE + _("Source:") + L' ' + fmtPath(s.sourcePath));
    summary.push_back(TAB_SPACE + _("Target:") + L' ' + fmtPath(s.targetPath));

    size_t sepLineLen = 0;
    for (const std::wstring& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::wstring output(sepLineLen + 1, L'_');
    output += L'\n';

    for (const std::wstring& str : summary) { output += L'|'; output += str; output += L'\n'; }

    output += L'|';
    output.append(sepLineLen, L'_');
    output += L'\n';

    return output;
}
}


std::string robo::generateLogText(const LogSummary& summary, const ErrorLog& log, const RunResult* result)
{
    std::string output = utfTo<std::string>(generateLogHeader(summary, log));
    output += LINE_BREAK;

    for (const LogEntry& entry : log)
    {
        output += formatMessage(entry);
        output += LINE_BREAK;
    }

    if (result)
    {
        output += LINE_BREAK;
        output += utfTo<std::string>(result->formatSummary());
    }
    return output;
}


void robo::saveLogFile(const Zstring& logFilePath, bool append, //throw FileError
                       const LogSummary& summary, const ErrorLog& log, const RunResult* result)
{
    std::string content;
    if (append)
        if (const std::optional<ItemType> type = getItemTypeIfExists(logFilePath)) //throw FileError
        {
            if (*type == ItemType::folder)
                throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(logFilePath)),
                                replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(logFilePath))));

            content = getFileContent(logFilePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
            if (!content.empty() && !endsWith(content, LINE_BREAK))
                content += LINE_BREAK;
            if (!content.empty())
                content += LINE_BREAK;
        }

    content += generateLogText(summary, log, result);

    //transactional: temp file + rename
    setFileContent(logFilePath, content, nullptr /*notifyUnbufferedIO*/); //throw FileError
}
