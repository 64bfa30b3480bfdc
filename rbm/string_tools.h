// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef STRING_TOOLS_H_2093847561029384
#define STRING_TOOLS_H_2093847561029384

#include <cstdio>
#include <cwchar>
#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include <type_traits>


//string helpers for std::basic_string<char/wchar_t>
namespace rbm
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only
template <class Char> Char asciiToUpper(Char c);

template <class Char> bool startsWith(std::basic_string_view<Char> str, std::basic_string_view<Char> prefix);
template <class Char> bool endsWith  (std::basic_string_view<Char> str, std::basic_string_view<Char> postfix);
template <class Char> bool contains  (std::basic_string_view<Char> str, std::basic_string_view<Char> term);
template <class Char> bool equalAsciiNoCase(std::basic_string_view<Char> lhs, std::basic_string_view<Char> rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class Char> std::basic_string<Char> afterLast  (std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr);
template <class Char> std::basic_string<Char> beforeLast (std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr);
template <class Char> std::basic_string<Char> afterFirst (std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr);
template <class Char> std::basic_string<Char> beforeFirst(std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr);

template <class Char> [[nodiscard]] std::vector<std::basic_string<Char>> splitCpy(std::basic_string_view<Char> str, Char delimiter);

template <class Char> [[nodiscard]] std::basic_string<Char> trimCpy(std::basic_string_view<Char> str);

template <class Char> [[nodiscard]] std::basic_string<Char> replaceCpy(std::basic_string<Char> str, std::basic_string_view<Char> oldTerm, std::basic_string_view<Char> newTerm);

//convert std::string/std::wstring <-> number
template <class S,   class Num> S   numberTo(const Num& number);

//format a single number using std::snprintf()
template <class S, class Num> S printNumber(const typename S::value_type* format, const Num& number);

//overloads resolving string literals and std::basic_string arguments
inline bool startsWith(std::string_view  str, std::string_view  prefix) { return startsWith<char   >(str, prefix); }
inline bool startsWith(std::wstring_view str, std::wstring_view prefix) { return startsWith<wchar_t>(str, prefix); }
inline bool endsWith  (std::string_view  str, std::string_view  postfix) { return endsWith<char   >(str, postfix); }
inline bool endsWith  (std::wstring_view str, std::wstring_view postfix) { return endsWith<wchar_t>(str, postfix); }
inline bool contains  (std::string_view  str, std::string_view  term) { return contains<char   >(str, term); }
inline bool contains  (std::wstring_view str, std::wstring_view term) { return contains<wchar_t>(str, term); }
inline bool equalAsciiNoCase(std::string_view  lhs, std::string_view  rhs) { return equalAsciiNoCase<char   >(lhs, rhs); }
inline bool equalAsciiNoCase(std::wstring_view lhs, std::wstring_view rhs) { return equalAsciiNoCase<wchar_t>(lhs, rhs); }

inline std::string  afterLast  (std::string_view  str, char    term, IfNotFoundReturn infr) { return afterLast  <char   >(str, term, infr); }
inline std::wstring afterLast  (std::wstring_view str, wchar_t term, IfNotFoundReturn infr) { return afterLast  <wchar_t>(str, term, infr); }
inline std::string  beforeLast (std::string_view  str, char    term, IfNotFoundReturn infr) { return beforeLast <char   >(str, term, infr); }
inline std::wstring beforeLast (std::wstring_view str, wchar_t term, IfNotFoundReturn infr) { return beforeLast <wchar_t>(str, term, infr); }
inline std::string  afterFirst (std::string_view  str, char    term, IfNotFoundReturn infr) { return afterFirst <char   >(str, term, infr); }
inline std::wstring afterFirst (std::wstring_view str, wchar_t term, IfNotFoundReturn infr) { return afterFirst <wchar_t>(str, term, infr); }
inline std::string  beforeFirst(std::string_view  str, char    term, IfNotFoundReturn infr) { return beforeFirst<char   >(str, term, infr); }
inline std::wstring beforeFirst(std::wstring_view str, wchar_t term, IfNotFoundReturn infr) { return beforeFirst<wchar_t>(str, term, infr); }

inline std::vector<std::string > splitCpy(std::string_view  str, char    delimiter) { return splitCpy<char   >(str, delimiter); }
inline std::vector<std::wstring> splitCpy(std::wstring_view str, wchar_t delimiter) { return splitCpy<wchar_t>(str, delimiter); }

inline std::string  trimCpy(std::string_view  str) { return trimCpy<char   >(str); }
inline std::wstring trimCpy(std::wstring_view str) { return trimCpy<wchar_t>(str); }

inline std::string  replaceCpy(std::string  str, std::string_view  oldTerm, std::string_view  newTerm) { return replaceCpy<char   >(std::move(str), oldTerm, newTerm); }
inline std::wstring replaceCpy(std::wstring str, std::wstring_view oldTerm, std::wstring_view newTerm) { return replaceCpy<wchar_t>(std::move(str), oldTerm, newTerm); }
inline std::wstring replaceCpy(std::wstring str, std::wstring_view oldTerm, wchar_t newChar) { return replaceCpy<wchar_t>(std::move(str), oldTerm, std::wstring_view(&newChar, 1)); }








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //caveat: std::isspace() takes an int, but expects an unsigned char
    return c == static_cast<Char>(' ' ) || c == static_cast<Char>('\t') || c == static_cast<Char>('\n') ||
           c == static_cast<Char>('\r') || c == static_cast<Char>('\v') || c == static_cast<Char>('\f');
}


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
Char asciiToUpper(Char c)
{
    if (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'))
        return static_cast<Char>(c - static_cast<Char>('a') + static_cast<Char>('A'));
    return c;
}


template <class Char> inline
bool startsWith(std::basic_string_view<Char> str, std::basic_string_view<Char> prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}


template <class Char> inline
bool endsWith(std::basic_string_view<Char> str, std::basic_string_view<Char> postfix)
{
    return str.size() >= postfix.size() && str.compare(str.size() - postfix.size(), postfix.size(), postfix) == 0;
}


template <class Char> inline
bool contains(std::basic_string_view<Char> str, std::basic_string_view<Char> term)
{
    return str.find(term) != std::basic_string_view<Char>::npos;
}


template <class Char> inline
bool equalAsciiNoCase(std::basic_string_view<Char> lhs, std::basic_string_view<Char> rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
        if (asciiToUpper(lhs[i]) != asciiToUpper(rhs[i]))
            return false;
    return true;
}


template <class Char> inline
std::basic_string<Char> afterLast(std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::basic_string_view<Char>::npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<Char>(str) : std::basic_string<Char>();
    return std::basic_string<Char>(str.substr(pos + 1));
}


template <class Char> inline
std::basic_string<Char> beforeLast(std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(term);
    if (pos == std::basic_string_view<Char>::npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<Char>(str) : std::basic_string<Char>();
    return std::basic_string<Char>(str.substr(0, pos));
}


template <class Char> inline
std::basic_string<Char> afterFirst(std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::basic_string_view<Char>::npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<Char>(str) : std::basic_string<Char>();
    return std::basic_string<Char>(str.substr(pos + 1));
}


template <class Char> inline
std::basic_string<Char> beforeFirst(std::basic_string_view<Char> str, Char term, IfNotFoundReturn infr)
{
    const size_t pos = str.find(term);
    if (pos == std::basic_string_view<Char>::npos)
        return infr == IfNotFoundReturn::all ? std::basic_string<Char>(str) : std::basic_string<Char>();
    return std::basic_string<Char>(str.substr(0, pos));
}


template <class Char> inline
std::vector<std::basic_string<Char>> splitCpy(std::basic_string_view<Char> str, Char delimiter)
{
    std::vector<std::basic_string<Char>> output;
    for (;;)
    {
        const size_t pos = str.find(delimiter);
        output.emplace_back(str.substr(0, pos));
        if (pos == std::basic_string_view<Char>::npos)
            return output;
        str.remove_prefix(pos + 1);
    }
}


template <class Char> inline
std::basic_string<Char> trimCpy(std::basic_string_view<Char> str)
{
    while (!str.empty() && isWhiteSpace(str.front())) str.remove_prefix(1);
    while (!str.empty() && isWhiteSpace(str.back ())) str.remove_suffix(1);
    return std::basic_string<Char>(str);
}


template <class Char> inline
std::basic_string<Char> replaceCpy(std::basic_string<Char> str, std::basic_string_view<Char> oldTerm, std::basic_string_view<Char> newTerm)
{
    if (oldTerm.empty())
        return str;

    for (size_t pos = str.find(oldTerm); pos != std::basic_string<Char>::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    char buffer[32] = {};
    const std::to_chars_result rv = std::to_chars(buffer, buffer + sizeof(buffer), number);
    return S(buffer, rv.ptr); //char -> wchar_t widening is fine for digits
}


template <class S, class Num> inline
S printNumber(const typename S::value_type* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    typename S::value_type buffer[128] = {};
    int charsWritten = 0;

    if constexpr (std::is_same_v<typename S::value_type, wchar_t>)
        charsWritten = std::swprintf(buffer, std::size(buffer), format, number);
    else
        charsWritten = std::snprintf(buffer, std::size(buffer), format, number);

    return charsWritten > 0 ? S(buffer, charsWritten) : S();
}
}

#endif //STRING_TOOLS_H_2093847561029384
