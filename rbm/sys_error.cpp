// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "sys_error.h"
#include <glib.h>

using namespace rbm;


namespace
{
struct ErrorCodeName
{
    ErrorCode ec;
    const wchar_t* name;
};

//errors of the calls made by the copy engine: open, read, write, fsync, copy_file_range,
//rename, unlink, rmdir, mkdir, stat, chmod, utimensat, *xattr
constexpr ErrorCodeName errorCodeNames[] =
{
    {EPERM,        L"EPERM"},
    {ENOENT,       L"ENOENT"},
    {EIO,          L"EIO"},
    {EAGAIN,       L"EAGAIN"},
    {EACCES,       L"EACCES"},
    {EBUSY,        L"EBUSY"},
    {EEXIST,       L"EEXIST"},
    {EXDEV,        L"EXDEV"},
    {ENOTDIR,      L"ENOTDIR"},
    {EISDIR,       L"EISDIR"},
    {EINVAL,       L"EINVAL"},
    {EMFILE,       L"EMFILE"},
    {ETXTBSY,      L"ETXTBSY"},
    {ENOSPC,       L"ENOSPC"},
    {EROFS,        L"EROFS"},
    {ENAMETOOLONG, L"ENAMETOOLONG"},
    {ENOTEMPTY,    L"ENOTEMPTY"},
    {ELOOP,        L"ELOOP"},
    {ENODATA,      L"ENODATA"},
    {EOPNOTSUPP,   L"EOPNOTSUPP"},
    {EDQUOT,       L"EDQUOT"},
};


std::wstring formatSystemErrorCode(ErrorCode ec)
{
    for (const ErrorCodeName& item : errorCodeNames)
        if (item.ec == ec)
            return item.name;

    return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
}
}


std::wstring rbm::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    RBM_ON_SCOPE_EXIT(errno = ecCurrent);

    //g_strerror() vs strerror(): "marginally improves thread safety, and marginally improves consistency"
    return trimCpy(utfTo<std::wstring>(::g_strerror(ec)));
}


std::wstring rbm::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring rbm::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
