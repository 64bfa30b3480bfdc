// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef TIME_H_8402938475610293
#define TIME_H_8402938475610293

#include <ctime>
#include "zstring.h"
#include "string_tools.h"


namespace rbm
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error
TimeComp getLocalTime(); //utc = std::time()

/*  format as specified by "std::strftime", returns empty string on error
            formatTime(Zstr("%Y|%m|%d")); -> "2011|10|29"
            formatTime(formatDateTag);    -> "2011-10-29"
            formatTime(formatTimeTag);    -> "17:55:34"                       */
Zstring formatTime(const Zchar* format, const TimeComp& tc = getLocalTime());

const Zchar* const formatDateTag     = Zstr("%Y-%m-%d");
const Zchar* const formatTimeTag     = Zstr("%H:%M:%S");
const Zchar* const formatDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S");

//"1:03:07", hours optional
Zstring formatTimeSpan(int64_t timeInSec, bool hourOptional = false);








//############################ implementation ##############################
inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return {ctc.tm_year + 1900, ctc.tm_mon + 1, ctc.tm_mday, ctc.tm_hour, ctc.tm_min, ctc.tm_sec};
}


inline
TimeComp getLocalTime()
{
    const time_t utc = std::time(nullptr);
    if (utc == -1)
        return TimeComp();
    return getLocalTime(utc);
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc = {};
    ctc.tm_year  = tc.year - 1900;
    ctc.tm_mon   = tc.month - 1;
    ctc.tm_mday  = tc.day;
    ctc.tm_hour  = tc.hour;
    ctc.tm_min   = tc.minute;
    ctc.tm_sec   = tc.second;
    ctc.tm_isdst = -1;

    Zchar buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, std::size(buffer), format, &ctc);
    return Zstring(buffer, charsWritten);
}


inline
Zstring formatTimeSpan(int64_t timeInSec, bool hourOptional)
{
    Zstring timespanStr;

    if (timeInSec < 0)
    {
        timespanStr += Zstr('-');
        timeInSec = -timeInSec;
    }

    const int64_t hours   = timeInSec / 3600;
    const int64_t minutes = timeInSec / 60 % 60;
    const int64_t seconds = timeInSec % 60;

    if (!hourOptional || hours > 0)
        timespanStr += numberTo<Zstring>(hours) + Zstr(':');

    timespanStr += printNumber<Zstring>(Zstr("%02d"), static_cast<int>(minutes)) + Zstr(':') +
                   printNumber<Zstring>(Zstr("%02d"), static_cast<int>(seconds));
    return timespanStr;
}
}

#endif //TIME_H_8402938475610293
