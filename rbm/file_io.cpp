// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "file_io.h"
#include <cassert>
#include <random>
#include <fcntl.h>  //open
#include <unistd.h> //close, read, write
#include "extra_log.h"

using namespace rbm;


size_t FileBase::getBlockSize() //throw FileError
{
    if (blockSizeBuf_ == 0)
    {
        //st_blksize: "blocksize for file system I/O. Writing in smaller chunks may cause an inefficient read-modify-rewrite."
        const auto st_blksize = getStatBuffered().st_blksize; //throw FileError
        if (st_blksize > 0)             //st_blksize is signed!
            blockSizeBuf_ = st_blksize; //

        blockSizeBuf_ = std::max(blockSizeBuf_, defaultBlockSize);
    }
    return blockSizeBuf_;
}


const struct stat& FileBase::getStatBuffered() //throw FileError
{
    if (!statBuf_)
        try
        {
            if (hFile_ == invalidFileHandle)
                throw SysError(L"Contract error: getStatBuffered() called after close().");

            struct stat fileInfo = {};
            if (::fstat(hFile_, &fileInfo) != 0)
                THROW_LAST_SYS_ERROR("fstat");

            statBuf_ = std::move(fileInfo);
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath_)), e.toString()); }

    return *statBuf_;
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, struct stat>
openHandleForRead(const Zstring& filePath) //throw FileError, ErrorFileLocked, ErrorPermissionDenied
{
    const std::wstring errorMsg = replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath));

    //caveat: check for file types that block during open(): character device, block device, named pipe
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
        throwFileErrorForOpen(errorMsg, "stat", errno);

    if (!S_ISREG(fileInfo.st_mode) &&
        !S_ISDIR(fileInfo.st_mode)) //open() will fail with "EISDIR: Is a directory" => nice
        throw FileError(errorMsg, _("Unsupported item type.") + L" [" + printNumber<std::wstring>(L"0%06o", fileInfo.st_mode & S_IFMT) + L']');

    const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
        throwFileErrorForOpen(errorMsg, "open", errno);

    return {fdFile /*pass ownership*/, fileInfo};
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {} //throw FileError, ErrorFileLocked, ErrorPermissionDenied


FileInputPlain::FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const Zstring& filePath) :
    FileInputPlain(fileDetails.first, filePath)
{
    setStatBuffered(fileDetails.second);
}


FileInputPlain::FileInputPlain(FileHandle handle, const Zstring& filePath) :
    FileBase(handle, filePath)
{
    //optimize read-ahead on input file: POSIX_FADV_SEQUENTIAL doubles the read-ahead buffer size
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


void FileInputPlain::seek(uint64_t offset) //throw FileError
{
    if (::lseek(getHandle(), static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1))
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), "lseek");
}


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError, ErrorFileLocked
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //if ::read is interrupted (EINTR) right in the middle, it will return successfully with "bytesRead < bytesToRead"

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath, FileOutputMode mode) //throw FileError, ErrorTargetExisting, ErrorPermissionDenied
{
    const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath));

    const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

    const int flags = mode == FileOutputMode::createNew ?
                      O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC :
                      O_CREAT | O_APPEND | O_WRONLY | O_CLOEXEC;

    const int fdFile = ::open(filePath.c_str(), flags, lockFileMode);
    if (fdFile == -1)
    {
        const int ec = errno; //copy before making other system calls!
        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, formatSystemError("open", ec));

        throwFileErrorForOpen(errorMsg, "open", ec);
    }
    return fdFile; //pass ownership
}
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath, FileOutputMode mode) :
    FileOutputPlain(openHandleForWrite(filePath, mode), filePath, mode) {} //throw FileError, ErrorTargetExisting, ErrorPermissionDenied


FileOutputPlain::FileOutputPlain(FileHandle handle, const Zstring& filePath, FileOutputMode mode) :
    FileBase(handle, filePath),
    mode_(mode) {}


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle && //not finalized => clean up garbage
        mode_ == FileOutputMode::createNew)
        try
        {
            //"deleting while handle is open" == FILE_FLAG_DELETE_ON_CLOSE
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + e.toString());
        }
}


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);
        //if ::write() is interrupted (EINTR) right in the middle, it will return successfully with "bytesWritten < bytesToWrite"!

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}


void FileOutputPlain::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    const char* it = static_cast<const char*>(buffer);
    while (bytesToWrite > 0)
    {
        const size_t bytesWritten = tryWrite(it, bytesToWrite); //throw FileError
        it           += bytesWritten;
        bytesToWrite -= bytesWritten;
    }
}


void FileOutputPlain::flushToDisk() //throw FileError
{
    if (::fsync(getHandle()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), "fsync");
}

//----------------------------------------------------------------------------------------------------

Zstring rbm::getPathWithTempName(const Zstring& filePath) //generate (hopefully) unique file name
{
    static thread_local std::mt19937 rng(std::random_device{}());
    const unsigned int shortId = std::uniform_int_distribution<unsigned int>(0, 0xffff)(rng);

    return filePath + Zstr('.') + printNumber<Zstring>(Zstr("%04x"), shortId) + Zstr(".tmp");
}


std::string rbm::getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    FileInputPlain fileIn(filePath); //throw FileError, ErrorFileLocked

    const size_t blockSize = fileIn.getBlockSize(); //throw FileError
    std::string content;
    for (;;)
    {
        const size_t oldSize = content.size();
        content.resize(oldSize + blockSize);

        const size_t bytesRead = fileIn.tryRead(&content[oldSize], blockSize); //throw FileError; may return short, only 0 means EOF!
        content.resize(oldSize + bytesRead);

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X!

        if (bytesRead == 0) //end of file
            return content;
    }
}


void rbm::setFileContent(const Zstring& filePath, std::string_view byteStream, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);

    FileOutputPlain tmpFile(tmpFilePath); //throw FileError, (ErrorTargetExisting)

    if (!byteStream.empty())
    {
        tmpFile.write(byteStream.data(), byteStream.size()); //throw FileError
        if (notifyUnbufferedIO) notifyUnbufferedIO(byteStream.size()); //throw X!
    }

    tmpFile.close(); //throw FileError
    //take over ownership:
    RBM_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError, (ErrorMoveUnsupported), (ErrorTargetExisting)
}
