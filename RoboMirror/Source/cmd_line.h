// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef CMD_LINE_H_6610293847561029
#define CMD_LINE_H_6610293847561029

#include <rbm/sys_error.h>
#include "base/structures.h"
#include "console_status_handler.h"


namespace robo
{
struct CommandLineConfig
{
    JobConfig job;
    Verbosity verbosity = Verbosity::normal;

    Zstring logFilePath; //optional
    bool logAppend = false;

    bool showHelp = false;
};

//"robomirror SOURCE TARGET [options]", robocopy-style option names, case-insensitive
CommandLineConfig parseCommandLine(const std::vector<Zstring>& args); //throw SysError

//"512", "10K", "2g": 1024-based units
uint64_t parseFileSize(const Zstring& str); //throw SysError

std::wstring getSyntaxHelp();
}

#endif //CMD_LINE_H_6610293847561029
