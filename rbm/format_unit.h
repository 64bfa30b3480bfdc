// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef FORMAT_UNIT_H_7701928374650192
#define FORMAT_UNIT_H_7701928374650192

#include <cstdint>
#include <string>


namespace rbm
{
const int bytesPerKilo = 1024;

std::wstring formatFilesizeShort(int64_t filesize); //B, KB, MB, GB, TB
std::wstring formatSpeed(double bytesPerSec);
std::wstring formatProgressPercent(double fraction /*[0, 1]*/); //rounded down!

std::wstring formatThreeDigitPrecision(double value); //format with fixed number of digits (unless value is too large)

std::wstring formatNumber(int64_t n); //format integer number including thousands separator
}

#endif //FORMAT_UNIT_H_7701928374650192
