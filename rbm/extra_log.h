// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef EXTRA_LOG_H_7729384710293847
#define EXTRA_LOG_H_7729384710293847

#include <mutex>
#include <utility>
#include "error_log.h"

//process-wide sink for errors that have nowhere else to go:
//clean-up failures in destructors and scope guards, errors while another exception is in flight
namespace rbm
{
namespace impl
{
struct ExtraLog
{
    std::mutex lock;
    ErrorLog log;
};

inline
ExtraLog& getExtraLog()
{
    static ExtraLog extraLog; //thread-safe init
    return extraLog;
}
}


inline
void logExtraError(const std::wstring& msg) //noexcept
{
    impl::ExtraLog& el = impl::getExtraLog();
    std::lock_guard dummy(el.lock);
    logMsg(el.log, msg, MSG_TYPE_ERROR);
}


//take ownership of everything logged so far
inline
ErrorLog fetchExtraLog()
{
    impl::ExtraLog& el = impl::getExtraLog();
    std::lock_guard dummy(el.lock);
    return std::exchange(el.log, ErrorLog());
}
}

#endif //EXTRA_LOG_H_7729384710293847
