// *****************************************************************************
// * This file is part of the RoboMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************
#include "file_access.h"
#include <cstdlib>
#include <fcntl.h>     //open, AT_FDCWD
#include <unistd.h>    //copy_file_range
#include <sys/xattr.h>
#include "file_traverser.h"
#include "file_io.h"
#include <cstddef>

using namespace rbm;


namespace
{
ItemDetails getItemDetailsImpl(const Zstring& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    ItemDetails details;
    details.type = S_ISLNK(itemInfo.st_mode) ? ItemType::symlink :
                   S_ISDIR(itemInfo.st_mode) ? ItemType::folder :
                   ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
    details.fileSize   = static_cast<uint64_t>(itemInfo.st_size);
    details.modTime    = itemInfo.st_mtim;
    details.accessTime = itemInfo.st_atim;
    details.mode       = itemInfo.st_mode;
    return details;
}
}


ItemType rbm::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemDetailsImpl(itemPath).type; //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemDetails> rbm::getItemDetailsIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemDetailsImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        if (e.errorCode == ENOENT || //not existing
            e.errorCode == ENOTDIR)  //some parent component is a file
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString());
    }
}


Zstring rbm::getResolvedFilePath(const Zstring& itemPath) //throw FileError
{
    char* resolvedPath = ::realpath(itemPath.c_str(), nullptr);
    if (!resolvedPath)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot determine final path for %x."), L"%x", fmtPath(itemPath)), "realpath");
    RBM_ON_SCOPE_EXIT(::free(resolvedPath));

    return resolvedPath;
}


void rbm::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void rbm::removeSymlinkPlain(const Zstring& linkPath) //throw FileError
{
    try
    {
        if (::unlink(linkPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete symbolic link %x."), L"%x", fmtPath(linkPath)), e.toString()); }
}


void rbm::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


namespace
{
void removeDirectoryImpl(const Zstring& folderPath) //throw FileError
{
    std::vector<Zstring> folderPaths;
    {
        std::vector<Zstring> filePaths;
        std::vector<Zstring> symlinkPaths;

        //get all files and directories from current directory (WITHOUT subdirectories!)
        traverseFolder(folderPath,
        [&](const    FileInfo& fi) {    filePaths.push_back(fi.fullPath); },
        [&](const  FolderInfo& fi) {  folderPaths.push_back(fi.fullPath); },
        [&](const SymlinkInfo& si) { symlinkPaths.push_back(si.fullPath); }); //throw FileError

        for (const Zstring& filePath : filePaths)
            removeFilePlain(filePath); //throw FileError

        for (const Zstring& symlinkPath : symlinkPaths)
            removeSymlinkPlain(symlinkPath); //throw FileError
    } //=> save stack space and allow deletion of extremely deep hierarchies!

    //delete directories recursively
    for (const Zstring& subFolderPath : folderPaths)
        removeDirectoryImpl(subFolderPath); //throw FileError; call recursively to correctly handle symbolic links

    removeDirectoryPlain(folderPath); //throw FileError
}
}


void rbm::removeDirectoryPlainRecursion(const Zstring& dirPath) //throw FileError
{
    if (getItemType(dirPath) == ItemType::symlink) //throw FileError
        removeSymlinkPlain(dirPath); //throw FileError
    else
        removeDirectoryImpl(dirPath); //throw FileError
}


namespace
{
std::wstring generateMoveErrorMsg(const Zstring& pathFrom, const Zstring& pathTo)
{
    if (getParentFolderPath(pathFrom) == getParentFolderPath(pathTo)) //pure "rename"
        return replaceCpy(replaceCpy(_("Cannot rename %x to %y."),
                                     L"%x", fmtPath(pathFrom)),
                          L"%y", fmtPath(getItemName(pathTo)));
    else //"move" or "move + rename"
        return trimCpy(replaceCpy(replaceCpy(_("Cannot move %x to %y."),
                                             L"%x", L'\n' + fmtPath(pathFrom)),
                                  L"%y", L'\n' + fmtPath(pathTo)));
}
}


void rbm::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return generateMoveErrorMsg(pathFrom, pathTo); };

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (!replaceExisting)
    {
        struct stat sourceInfo = {};
        if (::lstat(pathFrom.c_str(), &sourceInfo) != 0)
            throw FileError(getErrorMsg(), formatSystemError("lstat(source)", errno));

        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) != 0)
        {
            if (errno != ENOENT)
                throw FileError(getErrorMsg(), formatSystemError("lstat(target)", errno));
        }
        else if (sourceInfo.st_dev != targetInfo.st_dev ||
                 sourceInfo.st_ino != targetInfo.st_ino)
            throw ErrorTargetExisting(getErrorMsg(), replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(pathTo))));
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const int ec = errno;
        if (ec == EXDEV)
            throw ErrorMoveUnsupported(getErrorMsg(), formatSystemError("rename", ec));

        throw FileError(getErrorMsg(), formatSystemError("rename", ec));
    }
}


void rbm::setFileTimes(const Zstring& filePath, const timespec& accessTime, const timespec& modTime) //throw FileError
{
    //utimensat() is supposed to obsolete utime/utimes and is also used by "cp" and "touch"
    const timespec newTimes[2]
    {
        accessTime,
        modTime,
    };

    if (::utimensat(AT_FDCWD, filePath.c_str(), newTimes, 0) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(filePath)), "utimensat");
}


void rbm::copyItemPermissions(const Zstring& sourcePath, const Zstring& targetPath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(sourcePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read permissions of %x."), L"%x", fmtPath(sourcePath)), "stat");

    if (::chmod(targetPath.c_str(), fileInfo.st_mode & (S_IRWXU | S_IRWXG | S_IRWXO | S_ISUID | S_ISGID | S_ISVTX)) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write permissions of %x."), L"%x", fmtPath(targetPath)), "chmod");
}


void rbm::copyExtendedAttributes(const Zstring& sourcePath, const Zstring& targetPath) //throw FileError
{
    std::string attrNames;
    try
    {
        const ssize_t bufSize = ::listxattr(sourcePath.c_str(), nullptr, 0);
        if (bufSize < 0)
        {
            if (errno == ENOTSUP) //source file system has no extended attributes => nothing to copy
                return;
            THROW_LAST_SYS_ERROR("listxattr");
        }

        attrNames.resize(bufSize);
        if (bufSize > 0)
        {
            const ssize_t bytesRead = ::listxattr(sourcePath.c_str(), &attrNames[0], attrNames.size());
            if (bytesRead < 0) //ERANGE: attribute list grown in the meantime
                THROW_LAST_SYS_ERROR("listxattr");
            attrNames.resize(bytesRead);
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read extended attributes of %x."), L"%x", fmtPath(sourcePath)), e.toString()); }

    //list of null-terminated names
    for (const std::string& attrName : splitCpy(attrNames, '\0'))
        if (startsWith(attrName, "user."))
        {
            std::string attrValue;
            try
            {
                const ssize_t valSize = ::getxattr(sourcePath.c_str(), attrName.c_str(), nullptr, 0);
                if (valSize < 0)
                    THROW_LAST_SYS_ERROR("getxattr");

                attrValue.resize(valSize);
                if (valSize > 0)
                {
                    const ssize_t bytesRead = ::getxattr(sourcePath.c_str(), attrName.c_str(), &attrValue[0], attrValue.size());
                    if (bytesRead < 0)
                        THROW_LAST_SYS_ERROR("getxattr");
                    attrValue.resize(bytesRead);
                }
            }
            catch (const SysError& e)
            {
                throw FileError(replaceCpy(_("Cannot read extended attributes of %x."), L"%x", fmtPath(sourcePath)),
                                utfTo<std::wstring>(attrName) + L": " + e.toString());
            }

            if (::setxattr(targetPath.c_str(), attrName.c_str(), attrValue.data(), attrValue.size(), 0 /*create or replace*/) != 0)
            {
                const ErrorCode ec = errno;
                throw FileError(replaceCpy(_("Cannot write extended attributes of %x."), L"%x", fmtPath(targetPath)),
                                utfTo<std::wstring>(attrName) + L": " + formatSystemError("setxattr", ec));
            }
        }
}


void rbm::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

    if (::mkdir(dirPath.c_str(), mode) != 0)
    {
        const int ec = errno; //copy before directly or indirectly making other system calls!
        if (ec == EEXIST)
            throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));

        throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
    }
}


std::vector<Zstring> rbm::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    auto throwNameClash = [&](const Zstring& itemPath)
    {
        throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                        replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(itemPath))));
    };

    //path most likely already exists => check first
    if (const std::optional<ItemType> type = getItemTypeIfExists(dirPath)) //throw FileError
    {
        if (*type == ItemType::file /*obscure, but possible*/)
            throwNameClash(dirPath);
        return {}; //folder or symlink to folder
    }

    std::vector<Zstring> foldersCreated;
    if (const std::optional<Zstring> parentPath = getParentFolderPath(dirPath))
        foldersCreated = createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
        foldersCreated.push_back(dirPath);
    }
    catch (ErrorTargetExisting&) //possible, if createDirectoryIfMissingRecursion() is run in parallel
    {
        if (getItemType(dirPath) == ItemType::file) //throw FileError
            throwNameClash(dirPath);
    }
    return foldersCreated;
}


FileCopyResult rbm::copyNewFile(const Zstring& sourceFile, const Zstring& targetFile, //throw FileError, ErrorTargetExisting, ErrorFileLocked, ErrorPermissionDenied, X
                                const IoCallback& notifyUnbufferedIO /*throw X*/)
{
    FileInputPlain fileIn(sourceFile); //throw FileError, ErrorFileLocked, ErrorPermissionDenied

    FileOutputPlain fileOut(targetFile, FileOutputMode::createNew); //throw FileError, ErrorTargetExisting, ErrorPermissionDenied

    const size_t blockSize = fileIn.getBlockSize(); //throw FileError
    uint64_t bytesCopied = 0;

    //copy_file_range() performs an in-kernel copy (and reflinks where supported)
    bool useKernelCopy = true;
    std::vector<std::byte> buffer;
    for (;;)
        if (useKernelCopy)
        {
            const ssize_t bytesWritten = ::copy_file_range(fileIn.getHandle(), nullptr, fileOut.getHandle(), nullptr, blockSize, 0);
            if (bytesWritten < 0)
            {
                const int ec = errno;
                if (ec == EINTR)
                    continue;

                if (bytesCopied == 0 && (ec == EXDEV || ec == ENOSYS || ec == EINVAL || ec == EOPNOTSUPP)) //not supported for this file system pair
                {
                    useKernelCopy = false;
                    continue;
                }
                throw FileError(replaceCpy(replaceCpy(_("Cannot copy file %x to %y."), L"%x", L'\n' + fmtPath(sourceFile)), L"%y", L'\n' + fmtPath(targetFile)),
                                formatSystemError("copy_file_range", ec));
            }
            if (bytesWritten == 0) //end of file
                break;

            bytesCopied += bytesWritten;
            if (notifyUnbufferedIO) notifyUnbufferedIO(bytesWritten); //throw X
        }
        else
        {
            if (buffer.empty())
                buffer.resize(blockSize);

            const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError, ErrorFileLocked
            if (bytesRead == 0) //end of file
                break;

            fileOut.write(buffer.data(), bytesRead); //throw FileError

            bytesCopied += bytesRead;
            if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
        }

    fileOut.flushToDisk(); //throw FileError
    //close output file handle before setting file time; also good place to catch errors when closing stream!
    fileOut.close(); //throw FileError

    return {bytesCopied};
}
