// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef I18N_H_1093857204958723
#define I18N_H_1093857204958723

#include <string>
#include "string_tools.h"


//minimal layer for user-visible text: English only, but keep the call sites greppable
//  1. plain text:   _("Cannot open file %x.")
//  2. plural forms: _P("1 error", "%x errors", errorCount)
#define _(s) rbm::translate(L ## s)
#define _P(s, p, n) rbm::translate(L ## s, L ## p, n)


namespace rbm
{
inline
std::wstring translate(const std::wstring& text) { return text; }


//"%x" is replaced by the number
inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n)
{
    return replaceCpy(n == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n));
}
}

#endif //I18N_H_1093857204958723
