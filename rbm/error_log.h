// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef ERROR_LOG_H_2938475601928374
#define ERROR_LOG_H_2938475601928374

#include <algorithm>
#include <stdexcept>
#include <vector>
#include "time.h"
#include "i18n.h"
#include "zstring.h"


namespace rbm
{
enum MessageType
{
    MSG_TYPE_INFO,
    MSG_TYPE_WARNING,
    MSG_TYPE_ERROR,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

//chronological, unless merged from several sources: see mergeLogs()
using ErrorLog = std::vector<LogEntry>;

inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr))
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}

//append "other" and restore chronological order; entries with the same time keep their relative order
inline
void mergeLogs(ErrorLog& log, const ErrorLog& other)
{
    log.insert(log.end(), other.begin(), other.end());
    std::stable_sort(log.begin(), log.end(), [](const LogEntry& lhs, const LogEntry& rhs) { return lhs.time < rhs.time; });
}


struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};

inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_ERROR   ? count.error :
           entry.type == MSG_TYPE_WARNING ? count.warning : count.info);
    return count;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        //*INDENT-OFF*
        case MSG_TYPE_INFO:    return _("Info");
        case MSG_TYPE_WARNING: return _("Warning");
        case MSG_TYPE_ERROR:   return _("Error");
        //*INDENT-ON*
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


//"[17:55:34]  Error:  Cannot read file..."
//multi-line messages: empty lines are dropped, continuation lines are aligned with the first one
inline
std::string formatMessage(const LogEntry& entry)
{
    const std::string prefix = '[' + formatTime(formatTimeTag, getLocalTime(entry.time)) + "]  " + utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const std::string indent(utfTo<std::wstring>(prefix).size(), ' '); //count code points, not bytes

    std::string output = prefix;
    bool firstLine = true;

    const std::string msg = trimCpy(entry.message);
    for (size_t pos = 0; pos <= msg.size();)
    {
        size_t posEnd = msg.find('\n', pos);
        if (posEnd == std::string::npos)
            posEnd = msg.size();

        if (posEnd > pos)
        {
            if (!firstLine)
                output += '\n' + indent;
            output.append(msg, pos, posEnd - pos);
            firstLine = false;
        }
        pos = posEnd + 1;
    }
    return output;
}
}

#endif //ERROR_LOG_H_2938475601928374
