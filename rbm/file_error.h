// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#ifndef FILE_ERROR_H_1209384756012938
#define FILE_ERROR_H_1209384756012938

#include "sys_error.h" //we'll need this later anyway!


namespace rbm
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public rbm::FileError { X(const std::wstring& msg) : FileError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorFileLocked)
DEFINE_NEW_FILE_ERROR(ErrorPermissionDenied)
DEFINE_NEW_FILE_ERROR(ErrorMoveUnsupported)


#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const rbm::ErrorCode ecInternal = rbm::getLastError(); throw rbm::FileError(msg, rbm::formatSystemError(functionName, ecInternal)); } while (false)


//map errno of a failed open() to the matching exception type
[[noreturn]] inline
void throwFileErrorForOpen(const std::wstring& msg, const std::string& functionName, ErrorCode ec)
{
    if (ec == EACCES || ec == EPERM)
        throw ErrorPermissionDenied(msg, formatSystemError(functionName, ec));
    if (ec == ETXTBSY || ec == EWOULDBLOCK)
        throw ErrorFileLocked(msg, formatSystemError(functionName, ec));
    throw FileError(msg, formatSystemError(functionName, ec));
}

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_1209384756012938
