// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef PROCESS_CALLBACK_H_7710293846510293
#define PROCESS_CALLBACK_H_7710293846510293

#include <chrono>
#include <cstdint>
#include <string>
#include "structures.h"


namespace robo
{
//perform ui updates not more often than necessary
constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100);

enum class ProcessPhase
{
    none, //initial status
    scan,
    transfer,
    reconcile,
};

//event sink for a copy run: all calls are made from the coordinating thread
struct ProcessCallback
{
    virtual ~ProcessCallback() {}

    //informs about the estimated amount of data that will be processed in the next phase
    virtual void initNewPhase(int itemsTotal, int64_t bytesTotal, ProcessPhase phaseId) = 0; //throw X

    //periodic during enumeration
    virtual void reportScanProgress(int itemsScanned, int filesFound) = 0; //throw X

    //one call per outcome, in completion order
    virtual void reportOutcome(const OperationOutcome& outcome) = 0; //throw X

    //periodic during transfer: totals since phase start
    virtual void updateProgress(int itemsDone, int64_t bytesDone) = 0; //throw X

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //throw X
};
}

#endif //PROCESS_CALLBACK_H_7710293846510293
