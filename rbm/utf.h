// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef UTF_H_0193847561029384
#define UTF_H_0193847561029384

#include <string>
#include <string_view>
#include <type_traits>
#include <glib.h>


namespace rbm
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux); invalid input is replaced by U+FFFD
template <class TargetString> TargetString utfTo(std::string_view  str);
template <class TargetString> TargetString utfTo(std::wstring_view str);

bool isValidUtf8(std::string_view str);








//######################## implementation ########################
static_assert(sizeof(wchar_t) == sizeof(gunichar));


inline
bool isValidUtf8(std::string_view str)
{
    return ::g_utf8_validate(str.data(), str.size(), nullptr) != 0;
}


namespace impl
{
inline
std::wstring utf8ToWide(std::string_view str)
{
    if (str.empty())
        return {};

    gchar* strValid = ::g_utf8_make_valid(str.data(), str.size()); //never fails
    glong charCount = 0;
    gunichar* ucs4 = ::g_utf8_to_ucs4_fast(strValid, -1, &charCount);
    ::g_free(strValid);

    std::wstring output(reinterpret_cast<const wchar_t*>(ucs4), charCount);
    ::g_free(ucs4);
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
    {
        gchar buf[6] = {};
        const gunichar cp = ::g_unichar_validate(static_cast<gunichar>(c)) ? static_cast<gunichar>(c) : 0xFFFD;
        const gint len = ::g_unichar_to_utf8(cp, buf);
        output.append(buf, len);
    }
    return output;
}
}


template <class TargetString> inline
TargetString utfTo(std::string_view str)
{
    if constexpr (std::is_same_v<typename TargetString::value_type, char>)
        return TargetString(str);
    else
    {
        static_assert(std::is_same_v<typename TargetString::value_type, wchar_t>);
        return impl::utf8ToWide(str);
    }
}


template <class TargetString> inline
TargetString utfTo(std::wstring_view str)
{
    if constexpr (std::is_same_v<typename TargetString::value_type, wchar_t>)
        return TargetString(str);
    else
    {
        static_assert(std::is_same_v<typename TargetString::value_type, char>);
        return impl::wideToUtf8(str);
    }
}
}

#endif //UTF_H_0193847561029384
