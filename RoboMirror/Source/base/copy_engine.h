// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef COPY_ENGINE_H_1029384756102938
#define COPY_ENGINE_H_1029384756102938

#include "structures.h"
#include "process_callback.h"
#include "run_result.h"


namespace robo
{
/*  Validate -> EnsureTargetExists -> Enumerate -> TransferAll -> Reconcile (optional) -> Finalize

    - throws only for setup errors: invalid configuration, missing source, target creation failure
    - per-file errors are recorded as OutcomeFailed and the run continues
    - RunResult is owned by the calling thread: workers return outcomes, the caller applies them     */
RunResult runCopyJob(const JobConfig& cfg, const AbstractFileSystem& afs, ProcessCallback& callback); //throw FileError, X
}

#endif //COPY_ENGINE_H_1029384756102938
