// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "format_unit.h"
#include <cmath>
#include "string_tools.h"
#include "i18n.h"

using namespace rbm;


std::wstring rbm::formatThreeDigitPrecision(double value)
{
    //print three digits: 0,01 | 0,11 | 1,11 | 11,1 | 111
    if (std::abs(value) < 9.995) //9.999 must not be formatted as "10.00"
        return printNumber<std::wstring>(L"%.2f", value);
    if (std::abs(value) < 99.95) //99.99 must not be formatted as "100.0"
        return printNumber<std::wstring>(L"%.1f", value);

    return formatNumber(std::llround(value));
}


std::wstring rbm::formatFilesizeShort(int64_t size)
{
    if (std::abs(size) < bytesPerKilo)
        return replaceCpy(_("%x B"), L"%x", numberTo<std::wstring>(size));

    double sizeInUnit = static_cast<double>(size);

    auto formatUnit = [&](const std::wstring& unitTxt) { return replaceCpy(unitTxt, L"%x", formatThreeDigitPrecision(sizeInUnit)); };

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x KB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x MB"));

    sizeInUnit /= bytesPerKilo;
    if (std::abs(sizeInUnit) < 999.5)
        return formatUnit(_("%x GB"));

    sizeInUnit /= bytesPerKilo;
    return formatUnit(_("%x TB"));
}


std::wstring rbm::formatSpeed(double bytesPerSec)
{
    if (!std::isfinite(bytesPerSec) || bytesPerSec < 0)
        bytesPerSec = 0;

    return replaceCpy(_("%x/sec"), L"%x", formatFilesizeShort(std::llround(bytesPerSec)));
}


std::wstring rbm::formatProgressPercent(double fraction)
{
    //round down! don't show 100% when not actually done
    return numberTo<std::wstring>(static_cast<int>(std::floor(fraction * 100))) + L'%';
}


std::wstring rbm::formatNumber(int64_t n)
{
    static_assert(sizeof(long long int) == sizeof(n));
    return printNumber<std::wstring>(L"%'lld", static_cast<long long int>(n)); //considers grouping (')
}
