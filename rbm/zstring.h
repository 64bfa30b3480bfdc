// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef ZSTRING_H_5820394857109283
#define ZSTRING_H_5820394857109283

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <string>
#include <string_view>
#include "utf.h"

using Zchar = char;
#define Zstr(x) x

//native file system path encoding: UTF-8 on Linux
using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

const Zchar FILE_NAME_SEPARATOR = '/';


namespace rbm
{
enum class UnicodeNormalForm
{
    nfc, //precomposed
    nfd, //decomposed
    native = nfc,
};

//requires valid UTF-8
Zstring getUnicodeNormalForm(const Zstring& str, UnicodeNormalForm form = UnicodeNormalForm::native); //throw SysError

/* Caveat: don't expect input/output string sizes to match:
    - different UTF-8 encoding length of upper-case chars
    - output is Unicode-normalized                             */
Zstring getUpperCase(const Zstring& str); //throw SysError: invalid UTF-8

bool isAsciiString(ZstringView str);
}

const wchar_t* const TAB_SPACE = L"    ";

#endif //ZSTRING_H_5820394857109283
