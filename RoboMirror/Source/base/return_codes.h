// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef RETURN_CODES_H_5519283746501928
#define RETURN_CODES_H_5519283746501928

#include <stdexcept>
#include <rbm/i18n.h>


namespace robo
{
enum RoboReturnCode //as returned after process exit
{
    RBM_RC_SUCCESS = 0,
    RBM_RC_WARNING,
    RBM_RC_ERROR,
    RBM_RC_ABORTED,
    RBM_RC_EXCEPTION,
};


inline
void raiseReturnCode(RoboReturnCode& rc, RoboReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class CopyResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
RoboReturnCode mapToReturnCode(CopyResult copyStatus)
{
    switch (copyStatus)
    {
        case CopyResult::finishedSuccess:
            return RBM_RC_SUCCESS;
        case CopyResult::finishedWarning:
            return RBM_RC_WARNING;
        case CopyResult::finishedError:
            return RBM_RC_ERROR;
        case CopyResult::aborted:
            return RBM_RC_ABORTED;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + rbm::numberTo<std::string>(__LINE__) + "] Contract violation!");
}


inline
std::wstring getFinalStatusLabel(CopyResult finalStatus)
{
    switch (finalStatus)
    {
        case CopyResult::finishedSuccess:
            return _("Completed successfully");
        case CopyResult::finishedWarning:
            return _("Completed with warnings");
        case CopyResult::finishedError:
            return _("Completed with errors");
        case CopyResult::aborted:
            return _("Stopped");
    }
    throw std::logic_error(std::string(__FILE__) + '[' + rbm::numberTo<std::string>(__LINE__) + "] Contract violation!");
}
}

#endif //RETURN_CODES_H_5519283746501928
