// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "path_filter.h"
#include <algorithm>
#include <rbm/sys_error.h>

using namespace rbm;
using namespace robo;


namespace
{
bool matchesMask(const Zchar* name, const Zchar* const nameEnd, const Zchar* mask /*0-terminated*/)
{
    for (;; ++mask, ++name)
    {
        Zchar m = *mask;
        switch (m)
        {
            case 0:
                return name == nameEnd;

            case Zstr('?'):
                if (name == nameEnd)
                    return false;
                break;

            case Zstr('*'):
                do //advance mask to next non-* char
                {
                    m = *++mask;
                }
                while (m == Zstr('*'));

                if (m == 0) //mask ends with '*':
                    return true;

                ++mask;
                if (m == Zstr('?')) //*? pattern
                {
                    while (name != nameEnd)
                        if (matchesMask(++name, nameEnd, mask))
                            return true;
                }
                else //*[letter] pattern
                    while (name != nameEnd)
                        if (*name++ == m)
                            if (matchesMask(name, nameEnd, mask))
                                return true;
                return false;

            default:
                if (name == nameEnd || *name != m)
                    return false;
        }
    }
}


inline
bool matchesMask(const Zstring& name, const Zstring& mask)
{
    return matchesMask(name.c_str(), name.c_str() + name.size(), mask.c_str());
}
}


NameMatcher::NameMatcher(const std::vector<Zstring>& patterns)
{
    for (const Zstring& pattern : patterns)
        if (!pattern.empty())
            try
            {
                //normalize input: 1. ignore Unicode normalization form 2. ignore case
                masks_.push_back(getUpperCase(pattern)); //throw SysError
            }
            catch (SysError&) //invalid UTF-8
            {
                exactNames_.push_back(pattern);
            }
}


bool NameMatcher::matches(const Zstring& itemName) const
{
    if (std::find(exactNames_.begin(), exactNames_.end(), itemName) != exactNames_.end())
        return true;

    if (masks_.empty())
        return false;

    Zstring nameFmt;
    try
    {
        nameFmt = getUpperCase(itemName); //throw SysError
    }
    catch (SysError&) //invalid UTF-8: case-sensitive comparison is all we can do
    {
        nameFmt = itemName;
    }

    return std::any_of(masks_.begin(), masks_.end(), [&](const Zstring& mask) { return matchesMask(nameFmt, mask); });
}
