// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "run_result.h"
#include <algorithm>
#include <rbm/format_unit.h>
#include <rbm/time.h>

using namespace rbm;
using namespace robo;


RunResult::RunResult() :
    startTimeUtc_(std::time(nullptr)),
    startTime_(std::chrono::steady_clock::now()) {}


void RunResult::record(const OperationOutcome& outcome)
{
    std::visit([&](const auto& o)
    {
        using T = std::decay_t<decltype(o)>;

        if constexpr (std::is_same_v<T, OutcomeCopied>)
        {
            ++filesCopied_;
            bytesCopied_ += o.bytes;
        }
        else if constexpr (std::is_same_v<T, OutcomeSkipped>)
        {
            ++filesSkipped_;
            bytesSkipped_ += o.bytes;
        }
        else if constexpr (std::is_same_v<T, OutcomeDeleted>)
        {
            if (o.isFolder)
                ++foldersDeleted_;
            else
                ++filesDeleted_;
        }
        else if constexpr (std::is_same_v<T, OutcomeFailed>)
        {
            ++filesFailed_;
            errors_.push_back({o.path, o.errorMsg});
        }
        else
        {
            static_assert(std::is_same_v<T, OutcomeFolderCreated>);
            ++foldersCreated_;
        }
    }, outcome);
}


void RunResult::finish()
{
    if (!endTime_)
        endTime_ = std::chrono::steady_clock::now();
}


std::chrono::milliseconds RunResult::getDuration() const
{
    const auto endTime = endTime_ ? *endTime_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime_);
}


double RunResult::getBytesPerSecond() const
{
    const auto durationMs = getDuration().count();
    if (durationMs <= 0)
        return 0;
    return static_cast<double>(bytesCopied_) * 1000 / durationMs;
}


std::wstring RunResult::formatSummary() const
{
    const std::wstring separationLine(60, L'-');

    std::wstring output = separationLine + L'\n';

    auto addLine = [&](const std::wstring& label, const std::wstring& value)
    {
        std::wstring line = label + L':';
        line.resize(std::max<size_t>(line.size() + 1, 24), L' ');
        output += line + value + L'\n';
    };

    addLine(_("Directories created"), numberTo<std::wstring>(foldersCreated_));
    addLine(_("Directories deleted"), numberTo<std::wstring>(foldersDeleted_));
    addLine(_("Files copied"),        numberTo<std::wstring>(filesCopied_));
    addLine(_("Files skipped"),       numberTo<std::wstring>(filesSkipped_));
    addLine(_("Files failed"),        numberTo<std::wstring>(filesFailed_));
    addLine(_("Files deleted"),       numberTo<std::wstring>(filesDeleted_));
    addLine(_("Total files"),         numberTo<std::wstring>(getTotalFiles()));
    addLine(_("Bytes copied"),        formatFilesizeShort(bytesCopied_));
    addLine(_("Bytes skipped"),       formatFilesizeShort(bytesSkipped_));
    addLine(_("Average speed"),       formatSpeed(getBytesPerSecond()));
    addLine(_("Duration"),            utfTo<std::wstring>(formatTimeSpan(getDuration().count() / 1000)));

    if (!errors_.empty())
    {
        output += separationLine + L'\n';
        output += _P("1 error:", "%x errors:", errors_.size()) + L'\n';

        for (size_t i = 0; i < std::min(errors_.size(), ERRORS_DISPLAY_MAX); ++i)
            output += TAB_SPACE + fmtPath(errors_[i].path) + L": " + replaceCpy(errors_[i].errorMsg, L"\n", L' ') + L'\n';

        if (errors_.size() > ERRORS_DISPLAY_MAX)
            output += TAB_SPACE + replaceCpy(_("... and %x more errors"), L"%x", numberTo<std::wstring>(errors_.size() - ERRORS_DISPLAY_MAX)) + L'\n';
    }

    output += separationLine + L'\n';
    return output;
}
