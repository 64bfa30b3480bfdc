// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef RECONCILE_H_9910283746501928
#define RECONCILE_H_9910283746501928

#include <functional>
#include "structures.h"
#include "process_callback.h"


namespace robo
{
/*  delete target items that have no counterpart in the source (mirror/purge):
    - an extra folder is deleted including its subtree, which is not traversed any further
    - files and symlinks first, then folders deepest first
    - file deletion failure => OutcomeFailed; folder deletion failure => warning only
    - dry run: files are reported as skipped, folders are reported only       */
void reconcileTarget(const Zstring& sourceRoot /*resolved*/, const JobConfig& cfg, const AbstractFileSystem& afs,
                     const std::function<void(const OperationOutcome& outcome)>& onOutcome,
                     const std::function<void(const std::wstring& msg, ProcessCallback::MsgType type)>& logMessage);
}

#endif //RECONCILE_H_9910283746501928
