// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef SYS_ERROR_H_6019283745109283
#define SYS_ERROR_H_6019283745109283

#include <cerrno>
#include "scope_guard.h" //
#include "i18n.h"        //not used by this header, but the "rest of the world" needs it!
#include "zstring.h"     //


namespace rbm
{
//evaluate errno and assemble specific error message
using ErrorCode = int;

ErrorCode getLastError();

std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);


//A low-level exception class giving (non-translated) detail information only - same conceptional level like errno!
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

//keep errno for callers that need to distinguish ENOENT & co.
class SysErrorCode : public SysError
{
public:
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public rbm::SysError { X(const std::wstring& msg) : SysError(msg) {} };


//better leave it as a macro: errno must be read before any other call
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const rbm::ErrorCode ecInternal = rbm::getLastError(); throw rbm::SysError(rbm::formatSystemError(functionName, ecInternal)); } while (false)


/* Example: ASSERT_SYSERROR(expr);

    Equivalent to:
        if (!expr)
            throw rbm::SysError(L"Assertion failed: \"expr\"");            */
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr) //throw SysError








//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //don't use "::" prefix, errno is a macro!
}


std::wstring getSystemErrorDescription(ErrorCode ec); //return empty string on error

namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //catch unintended bool conversions
}

#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!rbm::impl::validateBool(expr))        \
            throw rbm::SysError(L"Assertion failed: \"" L ## exprStr L"\""); }
}

#endif //SYS_ERROR_H_6019283745109283
