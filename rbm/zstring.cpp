// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "zstring.h"
#include "sys_error.h"

using namespace rbm;


bool rbm::isAsciiString(ZstringView str)
{
    for (const Zchar c : str)
        if (static_cast<unsigned char>(c) >= 128)
            return false;
    return true;
}


Zstring rbm::getUnicodeNormalForm(const Zstring& str, UnicodeNormalForm form) //throw SysError
{
    if (isAsciiString(str)) //fast path
        return str;

    if (!isValidUtf8(str))
        throw SysError(formatSystemError("g_utf8_normalize", L"", L"Invalid UTF-8 sequence."));

    //Example: const char* decomposed  = "\x6f\xcc\x81"; //ó
    //         const char* precomposed = "\xc3\xb3"; //ó
    gchar* strNorm = ::g_utf8_normalize(str.c_str(), str.size(), form == UnicodeNormalForm::nfc ? G_NORMALIZE_NFC : G_NORMALIZE_NFD);
    if (!strNorm)
        throw SysError(formatSystemError("g_utf8_normalize", L"", L"Conversion failed."));
    RBM_ON_SCOPE_EXIT(::g_free(strNorm));

    return strNorm;
}


Zstring rbm::getUpperCase(const Zstring& str) //throw SysError
{
    if (isAsciiString(str)) //fast path: identical to g_unichar_toupper() for ASCII
    {
        Zstring output = str;
        for (Zchar& c : output)
            if ('a' <= c && c <= 'z')
                c = static_cast<Zchar>(c - 'a' + 'A');
        return output;
    }

    const Zstring strNorm = getUnicodeNormalForm(str, UnicodeNormalForm::native); //throw SysError

    Zstring output;
    output.reserve(strNorm.size());

    for (const gchar* it = strNorm.c_str(); *it != '\0'; it = ::g_utf8_next_char(it))
    {
        gchar buf[6] = {};
        //don't use std::towupper: incomplete and locale-dependent!
        const gint len = ::g_unichar_to_utf8(::g_unichar_toupper(::g_utf8_get_char(it)), buf);
        output.append(buf, len);
    }
    return output;
}
