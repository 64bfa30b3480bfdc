// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "thread.h"
#include <pthread.h>

using namespace rbm;


void rbm::setCurrentThreadName(const Zstring& threadName)
{
    //"The thread name is a meaningful C language string, whose length is restricted to 16 characters, including the terminating null byte ('\0')."
    const Zstring nameTrunc = threadName.substr(0, 15);

    //ignore errors: thread name is cosmetic (e.g. shown by "top -H")
    [[maybe_unused]] const int rv = ::pthread_setname_np(::pthread_self(), nameTrunc.c_str());
}
